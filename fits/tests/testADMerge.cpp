// Run the ADMerge program on two files and check what it wrote.
// Usage: testADMerge <path to ADMerge>
#include "FitsIO.h"
#include "TestSupport.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace astrodata;
using namespace astrodata::test;

namespace {
  const string first = "testADMerge_a.fits";
  const string second = "testADMerge_b.fits";
  const string listFile = "testADMerge.list";
  const string outfile = "testADMerge_out.fits";

  void cleanup() {
    std::remove(first.c_str());
    std::remove(second.c_str());
    std::remove(listFile.c_str());
    std::remove(outfile.c_str());
  }

  int runMerge(const string& program, const string& flags) {
    string command = program + " " + outfile + " " + flags + " < " + listFile;
    dbg << "Running " << command << endl;
    return std::system(command.c_str());
  }
}

int main(int argc,
	 char *argv[]) {
  if (argc != 2) {
    cerr << "usage: testADMerge <ADMerge program>" << endl;
    exit(1);
  }
  const string program = argv[1];
  try {
    fits::writeFits(sci3(), first, true);
    fits::writeFits(mdfSciVarDq(), second, true);
    {
      std::ofstream list(listFile.c_str());
      list << "# inputs" << endl
	   << first << endl
	   << endl
	   << "  " << second << endl;
    }

    check(runMerge(program, "-clobber") != 0, "colliding versions without -auto");
    check(runMerge(program, "-auto -clobber") == 0, "ADMerge with -auto");

    AstroData merged = fits::readFits(outfile);
    checkKeys(merged, {{"SCI", 1}, {"SCI", 2}, {"SCI", 3}, {"MDF", NO_VERSION},
	               {"SCI", 4}, {"VAR", 4}, {"DQ", 4}},
      "merged file");
    string s;
    check(merged.phu().getValue("DATALAB", s) && s=="sci3", "primary header of first input");
    checkEqual(merged.phu().history().size(), size_t(1), "command line in HISTORY");

    check(runMerge(program, "-auto") != 0, "existing output without -clobber");
    cleanup();
    cout << "testADMerge OK" << endl;
  } catch (std::runtime_error& e) {
    cleanup();
    quit(e,1);
  }
  exit(0);
}
