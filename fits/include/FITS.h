// FITS.h: CFITSIO plumbing for reading and writing AstroData.

// The FitsFile class owns one CFITSIO fitsfile* for its lifetime.  Header
// transfer between a FITS HDU and a Header skips the structural keywords
// (BITPIX, NAXISn, TFORMn, ...) that CFITSIO maintains itself.

#ifndef ASTRODATA_FITS_H
#define ASTRODATA_FITS_H

#include "Std.h"
#include "Errors.h"
#include "Header.h"

#include "fitsio.h"

namespace astrodata {
  namespace fits {

    class FITSError: public AstroDataError {
    public:
      FITSError(const string& m=""): AstroDataError("FITS: " + m) {}
    };

    class FITSCantOpen: public FITSError {
    public:
      FITSCantOpen(const string& fname, const string& m=""):
	FITSError("Cannot open FITS file " + fname + ": " + m) {}
    };

    // Throw FITSError with the CFITSIO message stack appended.
    // Only prints the message if an exception is already in flight.
    void throw_CFITSIO(const string& m="");
    // throw if status is non-zero:
    inline void checkCFITSIO(int status, const string& m="") {if (status) throw_CFITSIO(m);}

    // Flush the CFITSIO error message stack and clear status
    void flushFitsErrors(int& status);

    enum OpenMode {ReadOnly, Create, Overwrite};

    class FitsFile {
    public:
      FitsFile(const string& fname, OpenMode mode=ReadOnly);
      ~FitsFile();
      fitsfile* getFitsptr() const {return fptr;}
      // Implicit conversion for use in CFITSIO calls
      operator fitsfile*() const {return fptr;}
      string getFilename() const {return filename;}
      int HDUCount() const;
      // Make HDU number hdu (0=primary) current; returns its CFITSIO type
      int moveTo(int hdu) const;
    private:
      FitsFile(const FitsFile& rhs);
      void operator=(const FitsFile& rhs);
      string filename;
      fitsfile* fptr;
    };

    // Keywords belonging to HDU structure rather than to the user's metadata.
    bool isSpecialKeyword(const string& keyword);

    // Read/write the header of the current HDU
    Header readFitsHeader(fitsfile* fptr);
    void writeFitsHeader(fitsfile* fptr, const Header& h);

  } // namespace fits
} // namespace astrodata

#endif // ASTRODATA_FITS_H
