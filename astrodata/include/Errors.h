// Exception classes for the AstroData container.
#ifndef ASTRODATA_ERRORS_H
#define ASTRODATA_ERRORS_H

#include <stdexcept>
#include <string>

namespace astrodata {

  using std::string;

  class AstroDataError: public std::runtime_error {
  public:
    AstroDataError(const string &m=""):
      std::runtime_error("AstroData Error: " + m) {}
  };

  // A (name, version) pair or a singleton name would be duplicated.
  class ConflictError: public AstroDataError {
  public:
    ConflictError(const string &m=""):
      AstroDataError("Conflict: " + m) {}
  };

  // Lookup or removal of an extension, column, or keyword that is absent.
  class NotFoundError: public AstroDataError {
  public:
    NotFoundError(const string &m=""):
      AstroDataError("Not found: " + m) {}
  };

  // Malformed request: missing or disallowed name, bad version number,
  // mismatched payload.
  class ValueError: public AstroDataError {
  public:
    ValueError(const string &m=""):
      AstroDataError("Bad value: " + m) {}
  };

} // namespace astrodata

#endif // ASTRODATA_ERRORS_H
