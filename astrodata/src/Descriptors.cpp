#include "Descriptors.h"
#include "Header.h"

using namespace astrodata;

namespace {
  struct DescriptorEntry {
    Descriptor d;
    const char* name;
    const char* keyword;
  };
  const DescriptorEntry descriptorTable[N_DESCRIPTORS] = {
    {Object, "object", "OBJECT"},
    {Instrument, "instrument", "INSTRUME"},
    {Telescope, "telescope", "TELESCOP"},
    {ObservationId, "observation_id", "OBSID"},
    {DataLabel, "data_label", "DATALAB"},
    {UtDate, "ut_date", "DATE-OBS"},
    {ExposureTime, "exposure_time", "EXPTIME"},
    {Filter, "filter", "FILTER"},
    {Airmass, "airmass", "AIRMASS"},
    {RightAscension, "ra", "RA"},
    {Declination, "dec", "DEC"},
    {Gain, "gain", "GAIN"},
    {ReadNoise, "read_noise", "RDNOISE"}
  };
}

string
astrodata::DescriptorName(Descriptor d) {
  for (auto& e : descriptorTable)
    if (e.d==d) return e.name;
  return "";
}

bool
astrodata::DescriptorFromName(const string& name, Descriptor& d) {
  for (auto& e : descriptorTable)
    if (name==e.name) {
      d = e.d;
      return true;
    }
  return false;
}

DescriptorMap::DescriptorMap() {
  for (auto& e : descriptorTable)
    keywords[e.d] = e.keyword;
}

string
DescriptorMap::keyword(Descriptor d) const {
  return keywords.at(d);
}

void
DescriptorMap::setKeyword(Descriptor d, const string& keyword) {
  string k = KeyFormat(keyword);
  if (k.empty())
    throw ValueError("Empty keyword for descriptor " + DescriptorName(d));
  keywords[d] = k;
}
