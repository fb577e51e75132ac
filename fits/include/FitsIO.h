// Reading an AstroData from a FITS file and writing one back.
#ifndef ASTRODATA_FITSIO_H
#define ASTRODATA_FITSIO_H

#include "FITS.h"
#include "DataProvider.h"
#include "AstroData.h"

namespace astrodata {
  namespace fits {

    // Keyword flagging a binary table that holds a RecordData in its one row
    const string RECORD_KEY = "ADRECORD";

    // DataProvider reading every extension HDU of a FITS file.  Images
    // become ImageData of the matching pixel type, binary tables become
    // TableData (scalar columns only), and tables flagged with ADRECORD
    // become RecordData.  The file is read completely on construction.
    class FitsProvider: public DataProvider {
    public:
      explicit FitsProvider(const string& filename);
      virtual Header primaryHeader() const {return phu;}
      virtual int size() const {return records.size();}
      virtual Header header(int record) const;
      virtual PayloadPtr data(int record) const;
      virtual string source() const {return filename;}
    private:
      string filename;
      Header phu;
      vector<std::pair<Header, PayloadPtr> > records;
    };

    // Convenience: FitsProvider plus AstroData construction
    AstroData readFits(const string& filename,
		       const AstroDataConfig& config=AstroDataConfig());

    // Write the PHU and every extension.  Mask, variance and named
    // attachments follow their parent as HDUs carrying ADPARENT.
    // Throws FITSCantOpen if the file exists and overwrite is false.
    void writeFits(const AstroData& ad, const string& filename, bool overwrite=false);

  } // namespace fits
} // namespace astrodata

#endif // ASTRODATA_FITSIO_H
