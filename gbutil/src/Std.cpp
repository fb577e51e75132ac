// Storage for the diagnostic stream settings declared in Std.h
#include "Std.h"

namespace astrodata {
  std::ostream* dbgout = &std::cerr;
  int verbose_level = 0;
}
