#include "VersionPolicy.h"
#include <map>

using namespace astrodata;

int
VersionPolicy::nextVersion(const ExtensionIndex& host, const string& name) {
  int base = host.hasName(name) ? host.maxVersion(name) : host.maxVersion();
  return base + 1;
}

int
VersionPolicy::assign(const ExtensionIndex& host,
		      const string& name,
		      bool versioned,
		      int requested,
		      bool autoNumber) {
  if (requested < 0)
    FormatAndThrow<ValueError>() << "Version " << requested << " for extension " << name
				 << " is not a positive integer";
  if (!versioned) {
    if (requested != NO_VERSION)
      FormatAndThrow<ValueError>() << "Extension " << name
				   << " is not a versioned name; cannot give it version "
				   << requested;
    return NO_VERSION;
  }
  if (requested==NO_VERSION) return nextVersion(host, name);
  if (autoNumber && host.has(name, requested)) {
    int v = nextVersion(host, name);
    dbg << "Version " << requested << " of " << name << " is taken, using " << v << endl;
    return v;
  }
  return requested;
}

vector<int>
VersionPolicy::assignMerge(const ExtensionIndex& host,
			   const vector<Request>& incoming,
			   bool autoNumber) {
  vector<int> out(incoming.size(), NO_VERSION);
  // Next free number for each name, seeded from the host before the merge
  std::map<string,int> next;
  for (size_t i=0; i<incoming.size(); i++) {
    const Request& r = incoming[i];
    if (!r.versioned) continue;
    if (!autoNumber && r.version!=NO_VERSION) {
      out[i] = r.version;
      continue;
    }
    std::map<string,int>::iterator n = next.find(r.name);
    if (n==next.end())
      n = next.insert(std::make_pair(r.name, nextVersion(host, r.name))).first;
    out[i] = n->second++;
  }
  if (autoNumber)
    for (auto& n : next)
      xdbg << "Merge numbered " << n.first << " through " << n.second-1 << endl;
  return out;
}
