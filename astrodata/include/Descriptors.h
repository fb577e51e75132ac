// Fixed set of metadata descriptors and the header keywords they read.
#ifndef ASTRODATA_DESCRIPTORS_H
#define ASTRODATA_DESCRIPTORS_H

#include <map>

#include "Std.h"

namespace astrodata {

  // Every metadata accessor an AstroData offers.  The keyword read for each
  // one comes from a DescriptorMap fixed when the container is built.
  enum Descriptor {
    Object,
    Instrument,
    Telescope,
    ObservationId,
    DataLabel,
    UtDate,
    ExposureTime,
    Filter,
    Airmass,
    RightAscension,
    Declination,
    Gain,
    ReadNoise
  };

  const int N_DESCRIPTORS = ReadNoise + 1;

  // Lower-case name used in configuration files, e.g. "exposure_time"
  string DescriptorName(Descriptor d);
  // Returns false if the name is not a descriptor
  bool DescriptorFromName(const string& name, Descriptor& d);

  class DescriptorMap {
  public:
    // Standard keywords: OBJECT, INSTRUME, TELESCOP, OBSID, DATALAB,
    // DATE-OBS, EXPTIME, FILTER, AIRMASS, RA, DEC, GAIN, RDNOISE
    DescriptorMap();
    string keyword(Descriptor d) const;
    void setKeyword(Descriptor d, const string& keyword);
  private:
    std::map<Descriptor,string> keywords;
  };

} // namespace astrodata

#endif // ASTRODATA_DESCRIPTORS_H
