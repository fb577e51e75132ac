// Choice of version numbers for extensions entering a container.
#ifndef ASTRODATA_VERSIONPOLICY_H
#define ASTRODATA_VERSIONPOLICY_H

#include "Std.h"
#include "ExtensionIndex.h"

namespace astrodata {

  // The policy never mutates the index; it only computes numbers.  Collisions
  // it lets through (explicit versions without auto-numbering) are caught
  // by ExtensionIndex::checkInsert().
  //
  // Automatic numbering continues the run of existing extensions of the
  // same name, or, for a name new to the host, starts just above the
  // highest version of any name in the host:
  //     next = (host has name ? maxVersion(name) : maxVersion()) + 1
  class VersionPolicy {
  public:
    // One extension arriving in a merge, in source order
    struct Request {
      string name;
      int version;     // as numbered in the source, 0 if unversioned
      bool versioned;  // per the host's naming rules
      Request(const string& name_, int version_, bool versioned_):
	name(name_), version(version_), versioned(versioned_) {}
    };

    static int nextVersion(const ExtensionIndex& host, const string& name);

    // Version for a single appended extension.  requested is an explicit
    // version (0 for none).  With autoNumber, a requested version is kept
    // when free and replaced by nextVersion() when taken.  Without it,
    // a requested version is returned as-is and 0 gets nextVersion().
    // Unversioned names always get 0; a requested version for them, or a
    // negative one for anyone, is a ValueError.
    static int assign(const ExtensionIndex& host,
		      const string& name,
		      bool versioned,
		      int requested,
		      bool autoNumber);

    // Versions for extensions merged from another container, in the same
    // order as incoming.  With autoNumber, each name's group is renumbered
    // as a contiguous run starting at nextVersion() evaluated on the host
    // before the merge.  Without it, source versions are kept.
    static vector<int> assignMerge(const ExtensionIndex& host,
				   const vector<Request>& incoming,
				   bool autoNumber);
  };

} // namespace astrodata

#endif // ASTRODATA_VERSIONPOLICY_H
