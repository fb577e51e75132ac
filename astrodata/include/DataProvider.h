// Source of the records an AstroData is built from.
#ifndef ASTRODATA_DATAPROVIDER_H
#define ASTRODATA_DATAPROVIDER_H

#include "Std.h"
#include "Header.h"
#include "Payload.h"

namespace astrodata {

  // A DataProvider hands over one primary header and a sequence of
  // records, each a header plus payload.  How the records were obtained
  // (FITS file, memory, network) is no concern of the container.
  // Record headers carry EXTNAME/EXTVER; a record whose header has the
  // ADPARENT keyword is an attachment of the extension named there.
  class DataProvider {
  public:
    virtual ~DataProvider() {}
    virtual Header primaryHeader() const =0;
    virtual int size() const =0;
    virtual Header header(int record) const =0;
    virtual PayloadPtr data(int record) const =0;
    // Description used in diagnostics, e.g. a filename
    virtual string source() const {return "";}
  };

  // Records held in memory
  class MemoryProvider: public DataProvider {
  public:
    MemoryProvider(const Header& phu_=Header()): phu(phu_) {}
    void add(const Header& h, PayloadPtr data);

    virtual Header primaryHeader() const {return phu;}
    virtual int size() const {return records.size();}
    virtual Header header(int record) const {return records[checked(record)].first;}
    virtual PayloadPtr data(int record) const {return records[checked(record)].second;}
    virtual string source() const {return "memory";}

  private:
    Header phu;
    vector<std::pair<Header, PayloadPtr> > records;
    int checked(int record) const;
  };

} // namespace astrodata

#endif // ASTRODATA_DATAPROVIDER_H
