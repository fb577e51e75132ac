// List the extensions and descriptors of AstroData FITS files.
// Usage: ADInfo [-config <yaml>] [-verbose <n>] file [file ...]
// File arguments may be glob patterns.

#include "FitsIO.h"
#include "StringStuff.h"
#include <cstdlib>

using namespace astrodata;

string usage = "ADInfo: list extensions and descriptors of AstroData FITS files\n"
  "usage: ADInfo [-config <yaml>] [-verbose <n>] file [file ...]\n"
  "   -config   YAML file of extension naming rules and descriptor keywords,\n"
  "             searched along $ASTRODATA_PATH\n"
  "   -verbose  diagnostic level on stderr, 0 for none";

int
main(int argc, char *argv[])
{
  try {
    AstroDataConfig config;
    vector<string> files;
    for (int i=1; i<argc; i++) {
      string arg = argv[i];
      if (stringstuff::nocaseEqual(arg, "-config") && i+1<argc) {
	config = AstroDataConfig::readFile(argv[++i]);
      } else if (stringstuff::nocaseEqual(arg, "-verbose") && i+1<argc) {
	verbose_level = std::atoi(argv[++i]);
      } else if (!arg.empty() && arg[0]=='-') {
	cerr << usage << endl;
	exit(1);
      } else {
	for (auto& f : stringstuff::fileGlob(arg)) files.push_back(f);
      }
    }
    if (files.empty()) {
      cerr << usage << endl;
      exit(1);
    }

    for (auto& f : files) {
      AstroData ad = fits::readFits(f, config);
      cout << ad;
      for (int d=0; d<N_DESCRIPTORS; d++) {
	Descriptor desc = static_cast<Descriptor>(d);
	string s;
	double v;
	if (ad.getDescriptor(desc, s))
	  cout << "  " << DescriptorName(desc) << " = " << s << endl;
	else if (ad.getDescriptor(desc, v))
	  cout << "  " << DescriptorName(desc) << " = " << v << endl;
      }
      cout << endl;
    }
  } catch (std::runtime_error& m) {
    quit(m,1);
  }
  exit(0);
}
