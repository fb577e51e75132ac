#include "ExtensionIndex.h"
#include <algorithm>

using namespace astrodata;

void
ExtensionIndex::rebuild() {
  positions.clear();
  nameCounts.clear();
  for (size_t i=0; i<extensions.size(); i++) {
    positions[extensions[i]->key()] = i;
    ++nameCounts[extensions[i]->getName()];
  }
}

ExtensionPtr
ExtensionIndex::at(int position) const {
  if (position < 0 || position >= size())
    FormatAndThrow<NotFoundError>() << "Extension position " << position
				    << " with " << size() << " extensions";
  return extensions[position];
}

void
ExtensionIndex::checkInsert(const ExtensionKey& key) const {
  if (positions.count(key))
    FormatAndThrow<ConflictError>() << "Extension " << key << " already exists";
  if (!hasName(key.name)) return;
  bool existingSingleton = positions.count(ExtensionKey(key.name, NO_VERSION)) > 0;
  if (key.version==NO_VERSION)
    FormatAndThrow<ConflictError>() << "Singleton extension " << key.name
				    << " conflicts with existing versioned extensions";
  if (existingSingleton)
    FormatAndThrow<ConflictError>() << "Versioned extension " << key
				    << " conflicts with existing singleton " << key.name;
}

void
ExtensionIndex::insert(ExtensionPtr e, int position) {
  if (!e) throw ValueError("Insert of null extension");
  checkInsert(e->key());
  if (position < 0 || position >= size())
    extensions.push_back(e);
  else
    extensions.insert(extensions.begin()+position, e);
  rebuild();
  xdbg << "Index inserted " << e->key() << ", now " << size() << " extensions" << endl;
}

bool
ExtensionIndex::has(const string& name, int version) const {
  return positions.count(ExtensionKey(name, version)) > 0;
}

bool
ExtensionIndex::hasName(const string& name) const {
  return nameCounts.count(name) > 0;
}

int
ExtensionIndex::positionOf(const string& name, int version) const {
  std::map<ExtensionKey,int>::const_iterator i = positions.find(ExtensionKey(name, version));
  if (i==positions.end())
    FormatAndThrow<NotFoundError>() << "Extension " << ExtensionKey(name, version);
  return i->second;
}

ExtensionPtr
ExtensionIndex::lookup(const string& name, int version) const {
  return extensions[positionOf(name, version)];
}

vector<ExtensionPtr>
ExtensionIndex::lookup(const string& name) const {
  vector<ExtensionPtr> out;
  if (!hasName(name)) throw NotFoundError("No extension named " + name);
  for (auto& e : extensions)
    if (e->getName()==name) out.push_back(e);
  return out;
}

void
ExtensionIndex::remove(int position) {
  if (position < 0 || position >= size())
    FormatAndThrow<NotFoundError>() << "Cannot remove extension position " << position
				    << " with " << size() << " extensions";
  extensions.erase(extensions.begin()+position);
  rebuild();
}

void
ExtensionIndex::remove(const string& name, int version) {
  remove(positionOf(name, version));
}

int
ExtensionIndex::maxVersion(const string& name) const {
  int vmax = 0;
  // Keys are sorted by (name, version), so the last key for the name is the max
  std::map<ExtensionKey,int>::const_iterator i =
    positions.lower_bound(ExtensionKey(name, NO_VERSION));
  for ( ; i!=positions.end() && i->first.name==name; ++i)
    vmax = std::max(vmax, i->first.version);
  return vmax;
}

int
ExtensionIndex::maxVersion() const {
  int vmax = 0;
  for (auto& e : extensions)
    vmax = std::max(vmax, e->getVersion());
  return vmax;
}

void
ExtensionIndex::swap(ExtensionIndex& rhs) {
  extensions.swap(rhs.extensions);
  positions.swap(rhs.positions);
  nameCounts.swap(rhs.nameCounts);
}
