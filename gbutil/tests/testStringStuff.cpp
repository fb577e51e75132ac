// String utilities used by the command-line programs
#include "Std.h"
#include "StringStuff.h"

using namespace stringstuff;

namespace {
  void check(bool ok, const string& what) {
    if (!ok) FormatAndThrow<std::runtime_error>() << "Test failed: " << what;
  }
}

int main(int argc,
	 char *argv[]) {
  try {
    std::istringstream list("# file list\n"
			    "\n"
			    "  a.fits   \n"
			    "   # indented comment\n"
			    "b.fits # trailing comment\n");
    string line;
    check(getlineNoComment(list, line) && line=="a.fits", "first entry, white space stripped");
    check(getlineNoComment(list, line) && line=="b.fits", "trailing comment removed");
    check(!getlineNoComment(list, line), "end of list");

    check(nocaseEqual("-Clobber", "-clobber"), "case-blind match");
    check(!nocaseEqual("-clob", "-clobber"), "lengths differ");

    std::list<string> words = split("SCI,VAR,,DQ", ',');
    check(words.size()==4 && words.back()=="DQ", "split keeps empty fields");
    check(split("  one two  ").size()==2, "split on white space");

    char prog[] = "ADMerge";
    char out[] = "out.fits";
    char* args[] = {prog, out};
    string tag = taggedCommandLine(2, args);
    check(tag.size()==19+string(": ADMerge out.fits").size(), "tagged line length");
    check(tag[4]=='-' && tag[10]=='T', "FITS style date");
    check(tag.substr(19)==": ADMerge out.fits", "command line follows the date");

    check(findFileOnPath("/abs/path.yaml", "ASTRODATA_NO_SUCH_VAR")=="/abs/path.yaml",
	  "absolute path returned as is");
    check(findFileOnPath("no_such_file.yaml", "ASTRODATA_NO_SUCH_VAR").empty(),
	  "missing file");
    cout << "testStringStuff OK" << endl;
  } catch (std::runtime_error& e) {
    quit(e,1);
  }
  exit(0);
}
