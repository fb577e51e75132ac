// Common convenience functions with strings
#ifndef ASTRODATA_STRINGSTUFF_H
#define ASTRODATA_STRINGSTUFF_H

#include <iostream>
#include <sstream>
#include <string>
#include <list>

using std::string;

namespace stringstuff {
  // Read the next line holding anything besides a '#' comment.  The
  // comment and surrounding white space are removed from s.
  std::istream& getlineNoComment(std::istream& is, string& s);

  bool nocaseEqual(const string& s1, const string& s2);

  // Strip leading and trailing white space from a string:
  void stripWhite(string& s);

  // Split string at designated character;
  // Default is to split at whitespace.
  // Trailing whitespace is dropped but trailing
  // non-white will add null string at end.
  std::list<string> split(const string& s, char c=0);

  // UTC time in FITS DATE form followed by the command line, for HISTORY
  string taggedCommandLine(int argc, char *argv[]);

  // Wraps the POSIX C glob function to provide matching filenames
  // to an input pattern.  More than one pattern may be in the string,
  // separated by ",".  A pattern matching nothing is returned as-is.
  std::list<string> fileGlob(const string& patterns);

  // Find first file that is open-able following the colon-separated path
  // given in some environment variable.  Path is just current directory if
  // the variable is not set.  Absolute filenames are returned unchanged.
  // Returns empty string if none is found.
  string findFileOnPath(const string& filename, const string& environmentVar);

} // namespace stringstuff

#endif
