// Version numbers chosen for appended and merged extensions
#include "VersionPolicy.h"
#include "TestSupport.h"

using namespace astrodata;
using namespace astrodata::test;

void
add(ExtensionIndex& index, const string& name, int version) {
  index.insert(ExtensionPtr(new Extension(name, version, Header(), scienceImage())));
}

int main(int argc,
	 char *argv[]) {
  try {
    ExtensionIndex host;
    checkEqual(VersionPolicy::nextVersion(host, "SCI"), 1, "first version");
    add(host, "SCI", 1);
    add(host, "SCI", 2);
    add(host, "SCI", 3);
    add(host, "MDF", NO_VERSION);
    checkEqual(VersionPolicy::nextVersion(host, "SCI"), 4, "next of present name");
    checkEqual(VersionPolicy::nextVersion(host, "VAR"), 4, "next of new name follows overall max");

    // Single appends
    checkEqual(VersionPolicy::assign(host, "SCI", true, NO_VERSION, false), 4,
	       "no version requested");
    checkEqual(VersionPolicy::assign(host, "SCI", true, 2, false), 2,
	       "requested version passes through without auto-numbering");
    checkEqual(VersionPolicy::assign(host, "SCI", true, 2, true), 4,
	       "taken version replaced with auto-numbering");
    checkEqual(VersionPolicy::assign(host, "SCI", true, 10, true), 10,
	       "free version kept with auto-numbering");
    checkEqual(VersionPolicy::assign(host, "TABLE", false, NO_VERSION, true), NO_VERSION,
	       "singleton name");
    checkThrows<ValueError>([&]() {VersionPolicy::assign(host, "TABLE", false, 2, false);},
			    "version for singleton name");
    checkThrows<ValueError>([&]() {VersionPolicy::assign(host, "SCI", true, -1, true);},
			    "negative version");

    // Merges: contiguous runs per name, seeded from the host before the merge
    vector<VersionPolicy::Request> incoming;
    incoming.push_back(VersionPolicy::Request("MDF2", NO_VERSION, false));
    incoming.push_back(VersionPolicy::Request("SCI", 1, true));
    incoming.push_back(VersionPolicy::Request("SCI", 2, true));
    incoming.push_back(VersionPolicy::Request("DQ", 1, true));
    incoming.push_back(VersionPolicy::Request("DQ", 2, true));
    vector<int> v = VersionPolicy::assignMerge(host, incoming, true);
    checkEqual(v.size(), size_t(5), "one version per incoming extension");
    checkEqual(v[0], NO_VERSION, "merged singleton");
    checkEqual(v[1], 4, "merged SCI 1");
    checkEqual(v[2], 5, "merged SCI 2");
    checkEqual(v[3], 4, "merged DQ 1 follows host maximum");
    checkEqual(v[4], 5, "merged DQ 2");

    v = VersionPolicy::assignMerge(host, incoming, false);
    checkEqual(v[1], 1, "source versions kept without auto-numbering");
    checkEqual(v[4], 2, "source DQ version kept");

    // An unversioned request for a versioned name still gets a number
    vector<VersionPolicy::Request> bare(1, VersionPolicy::Request("VAR", NO_VERSION, true));
    v = VersionPolicy::assignMerge(host, bare, false);
    checkEqual(v[0], 4, "unnumbered versioned extension numbered on merge");

    cout << "testVersionPolicy OK" << endl;
  } catch (std::runtime_error& e) {
    quit(e,1);
  }
  exit(0);
}
