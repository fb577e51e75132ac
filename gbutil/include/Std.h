// Things to include in every program and library source.
// Includes the common standard headers, the debugging-stream macros,
// and the exception-formatting helpers.
#ifndef ASTRODATA_STD_H
#define ASTRODATA_STD_H

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <stdexcept>
#include <exception>

using std::string;
using std::vector;
using std::cerr;
using std::cout;
using std::cin;
using std::endl;
using std::ostream;
using std::istream;

// Diagnostic output.  Everything goes to *dbgout (std::cerr unless a program
// redirects it), and is filtered by verbose_level:
//   dbg  << ...   printed when verbose_level >= 1
//   xdbg << ...   printed when verbose_level >= 2
// Set dbgout to 0 to silence all diagnostics.
namespace astrodata {
  extern std::ostream* dbgout;
  extern int verbose_level;
}

#define dbg if (astrodata::dbgout && astrodata::verbose_level >= 1) (*astrodata::dbgout)
#define xdbg if (astrodata::dbgout && astrodata::verbose_level >= 2) (*astrodata::dbgout)

// Build an exception message with stream syntax, thrown when the temporary dies:
//   FormatAndThrow<ConflictError>() << "duplicate " << name << "," << version;
template <class E=std::runtime_error>
class FormatAndThrow {
public:
  template <class T>
  FormatAndThrow& operator<<(const T& t) {oss << t; return *this;}
  ~FormatAndThrow() noexcept(false) {throw E(oss.str());}
private:
  std::ostringstream oss;
};

// Report an exception and exit a program.
inline void quit(const std::exception& e, const int exit_code=1) {
  cerr << e.what() << endl;
  std::exit(exit_code);
}

#endif // ASTRODATA_STD_H
