// Ordered (name, version) index of extensions
#include "ExtensionIndex.h"
#include "TestSupport.h"

using namespace astrodata;
using namespace astrodata::test;

ExtensionPtr
makeExtension(const string& name, int version) {
  return ExtensionPtr(new Extension(name, version, Header(), scienceImage()));
}

int main(int argc,
	 char *argv[]) {
  try {
    ExtensionIndex index;
    check(index.empty(), "new index is empty");
    checkEqual(index.maxVersion(), 0, "max version of empty index");

    index.insert(makeExtension("SCI", 1));
    index.insert(makeExtension("SCI", 2));
    index.insert(makeExtension("VAR", 1));
    index.insert(makeExtension("MDF", NO_VERSION));
    checkEqual(index.size(), 4, "size after inserts");
    checkEqual(index.positionOf("VAR", 1), 2, "position of VAR 1");
    checkEqual(index.lookup("SCI", 2)->getVersion(), 2, "lookup by key");
    checkEqual(index.lookup("SCI").size(), size_t(2), "lookup by name");
    check(index.has("MDF", NO_VERSION), "singleton present");
    check(!index.has("MDF", 1), "singleton has no version 1");
    check(index.hasName("VAR") && !index.hasName("DQ"), "hasName");
    checkEqual(index.maxVersion("SCI"), 2, "max SCI version");
    checkEqual(index.maxVersion("DQ"), 0, "max version of absent name");
    checkEqual(index.maxVersion(), 2, "max version overall");

    checkThrows<NotFoundError>([&]() {index.lookup("SCI", 3);}, "lookup absent key");
    checkThrows<NotFoundError>([&]() {index.lookup("DQ");}, "lookup absent name");
    checkThrows<NotFoundError>([&]() {index.at(4);}, "position past end");

    checkThrows<ConflictError>([&]() {index.insert(makeExtension("SCI", 2));},
			       "duplicate key");
    checkThrows<ConflictError>([&]() {index.insert(makeExtension("SCI", NO_VERSION));},
			       "singleton beside versioned name");
    checkThrows<ConflictError>([&]() {index.insert(makeExtension("MDF", 1));},
			       "versioned beside singleton");
    checkEqual(index.size(), 4, "failed inserts change nothing");

    // Insert in the middle
    index.insert(makeExtension("DQ", 1), 1);
    checkEqual(index.at(1)->getName(), "DQ", "insert at position");
    checkEqual(index.positionOf("SCI", 2), 2, "positions follow an insert");

    index.remove("SCI", 1);
    checkEqual(index.at(0)->getName(), "DQ", "remove by key");
    checkEqual(index.positionOf("MDF", NO_VERSION), 3, "positions follow a remove");
    index.remove(0);
    check(!index.hasName("DQ"), "remove by position");
    checkThrows<NotFoundError>([&]() {index.remove("DQ", 1);}, "remove absent key");

    ExtensionIndex other;
    other.insert(makeExtension("SCI", 9));
    index.swap(other);
    checkEqual(index.size(), 1, "swap");
    checkEqual(index.maxVersion("SCI"), 9, "swapped index lookups");
    checkEqual(other.size(), 3, "swap other side");

    cout << "testExtensionIndex OK" << endl;
  } catch (std::runtime_error& e) {
    quit(e,1);
  }
  exit(0);
}
