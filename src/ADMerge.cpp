// Merge AstroData FITS files into one.  The primary header comes from the
// first input; extensions of later inputs are appended in order.
// Usage: ADMerge outfile [-auto] [-clobber] [-config <yaml>] [-verbose <n>]
// stdin is list of input files, one per line.

#include "FitsIO.h"
#include "StringStuff.h"
#include <cstdlib>

using namespace astrodata;

string usage = "ADMerge: merge AstroData FITS files listed on stdin\n"
  "usage: ADMerge outfile [-auto] [-clobber] [-config <yaml>] [-verbose <n>]\n"
  "   -auto     renumber colliding extension versions instead of failing\n"
  "   -clobber  overwrite an existing outfile\n"
  "   -config   YAML file of extension naming rules, searched along $ASTRODATA_PATH\n"
  "   -verbose  diagnostic level on stderr, 0 for none";

int
main(int argc, char *argv[])
{
  try {
    if (argc < 2 || argv[1][0]=='-') {
      cerr << usage << endl;
      exit(1);
    }
    string outfile = argv[1];
    bool autoNumber = false;
    bool clobber = false;
    AstroDataConfig config;
    for (int i=2; i<argc; i++) {
      string arg = argv[i];
      if (stringstuff::nocaseEqual(arg, "-auto")) autoNumber = true;
      else if (stringstuff::nocaseEqual(arg, "-clobber")) clobber = true;
      else if (stringstuff::nocaseEqual(arg, "-config") && i+1<argc)
	config = AstroDataConfig::readFile(argv[++i]);
      else if (stringstuff::nocaseEqual(arg, "-verbose") && i+1<argc)
	verbose_level = std::atoi(argv[++i]);
      else {
	cerr << usage << endl;
	exit(1);
      }
    }

    AstroData merged(config);
    bool first = true;
    string buffer;
    while (stringstuff::getlineNoComment(cin, buffer)) {
      AstroData in = fits::readFits(buffer, config);
      if (first) {
	merged = in;
	first = false;
      } else {
	merged.append(in, autoNumber);
      }
      dbg << "Merged " << buffer << ", " << merged.size() << " extensions" << endl;
    }
    if (first) {
      cerr << "ADMerge: no input files on stdin" << endl;
      exit(1);
    }
    merged.phu().addHistory(stringstuff::taggedCommandLine(argc, argv));
    fits::writeFits(merged, outfile, clobber);
  } catch (std::runtime_error& m) {
    quit(m,1);
  }
  exit(0);
}
