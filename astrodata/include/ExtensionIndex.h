// Ordered sequence of extensions with a (name, version) lookup table.
#ifndef ASTRODATA_EXTENSIONINDEX_H
#define ASTRODATA_EXTENSIONINDEX_H

#include <map>

#include "Std.h"
#include "Extension.h"

namespace astrodata {

  // Maintains a vector of extensions in insertion order, and a map from
  // each extension's (name, version) to its position.  The map is rebuilt
  // after every mutation so it never disagrees with the vector.
  //
  // Uniqueness rules enforced on insert (ConflictError):
  //  - no two extensions share (name, version);
  //  - a name held by a singleton (version 0) cannot also be versioned,
  //    and vice versa.
  //
  // Copying an index copies the pointers, not the Extensions: the copy
  // addresses the same Extension objects but can be restructured
  // independently.
  class ExtensionIndex {
  public:
    typedef vector<ExtensionPtr>::const_iterator const_iterator;

    ExtensionIndex() {}

    int size() const {return extensions.size();}
    bool empty() const {return extensions.empty();}
    const_iterator begin() const {return extensions.begin();}
    const_iterator end() const {return extensions.end();}

    // NotFoundError if position is out of range
    ExtensionPtr at(int position) const;

    // Throws ConflictError if inserting key would break uniqueness.
    void checkInsert(const ExtensionKey& key) const;
    // position=-1 appends at the end.
    void insert(ExtensionPtr e, int position=-1);

    bool has(const string& name, int version) const;
    bool hasName(const string& name) const;

    // The extension with this exact key, else NotFoundError
    ExtensionPtr lookup(const string& name, int version) const;
    // All extensions with this name in index order, else NotFoundError
    vector<ExtensionPtr> lookup(const string& name) const;
    int positionOf(const string& name, int version) const;

    void remove(int position);
    void remove(const string& name, int version);

    // Highest version among extensions of one name, or among all versioned
    // extensions; 0 if there are none.
    int maxVersion(const string& name) const;
    int maxVersion() const;

    void swap(ExtensionIndex& rhs);

  private:
    vector<ExtensionPtr> extensions;
    std::map<ExtensionKey,int> positions;
    // Number of extensions under each name
    std::map<string,int> nameCounts;
    void rebuild();
  };

} // namespace astrodata

#endif // ASTRODATA_EXTENSIONINDEX_H
