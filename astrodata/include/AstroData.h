// The AstroData container: primary metadata plus an ordered set of
// named, versioned extensions.
#ifndef ASTRODATA_ASTRODATA_H
#define ASTRODATA_ASTRODATA_H

#include <memory>

#include "Std.h"
#include "Errors.h"
#include "Header.h"
#include "Payload.h"
#include "Extension.h"
#include "ExtensionIndex.h"
#include "VersionPolicy.h"
#include "DataProvider.h"
#include "Descriptors.h"
#include "Config.h"

namespace astrodata {

  /************************  AstroData ****************************
   * A telescope exposure: one primary header (PHU) and an ordered
   * collection of extensions, each identified by (name, version).
   *
   * Views.  Indexing returns a new AstroData that shares the PHU and the
   * Extension objects of its parent but has its own index:
   *   ad[2]            single-extension view by position (negative from end)
   *   ad("SCI", 3)     single-extension view by (name, version)
   *   ad.select("SCI") all extensions of a name
   *   ad.slice(0, 4)   positional range
   * Changing headers or payloads through a view is seen by the parent and
   * every other view.  Appending to or removing from a view changes only
   * the view.  Copying an AstroData makes the same kind of view of the
   * whole container; deepCopy() duplicates headers and payloads.
   *
   * Appending.
   *   append(payload, name)          bare payload at the root: the name is
   *                                  required, mask/variance names are refused,
   *                                  and images need a versioned name.
   *   append(header, payload)        name taken from EXTNAME if not given.
   *   append(other)                  merge every extension of another container.
   * autoNumber=true picks versions that cannot collide; without it a
   * colliding (name, version) throws ConflictError.  Either way the
   * container is unchanged when an append throws.
   *
   * Appending a payload to a single-extension view attaches it under that
   * extension (mask, variance, or a named attachment) and consumes no
   * version.  Root-only names (SCI) are refused there.
   *****************************************************************/

  class AstroData {
  public:
    typedef ExtensionIndex::const_iterator const_iterator;

    explicit AstroData(const AstroDataConfig& config=AstroDataConfig());
    explicit AstroData(const Header& phu, const AstroDataConfig& config=AstroDataConfig());
    explicit AstroData(const DataProvider& provider,
		       const AstroDataConfig& config=AstroDataConfig());

    // Number of extensions, excluding the PHU
    int size() const {return index.size();}
    bool isSingle() const {return singleView;}
    string getSource() const {return source;}

    Header& phu() {return *primary;}
    const Header& phu() const {return *primary;}
    const AstroDataConfig& config() const {return cfg;}
    const ExtensionRules& rules() const {return cfg.rules;}

    const_iterator begin() const {return index.begin();}
    const_iterator end() const {return index.end();}

    // Views
    AstroData operator[](int position) const;
    AstroData operator()(const string& name, int version) const;
    AstroData select(const string& name) const;
    // Python-style range [start, stop) with positive step; negative
    // positions count from the end and out-of-range bounds are clipped.
    AstroData slice(int start, int stop, int step=1) const;

    // Independent container with duplicated headers and payloads
    AstroData deepCopy() const;

    ExtensionPtr extension(int position) const;
    ExtensionPtr extension(const string& name, int version) const;
    bool hasExtension(const string& name, int version=NO_VERSION) const;

    // Accessors for single-extension views; ValueError on other containers
    ExtensionPtr single() const;
    string name() const {return single()->getName();}
    int version() const {return single()->getVersion();}
    Header& header() const {return single()->header();}
    PayloadPtr data() const {return single()->data();}
    PayloadPtr mask() const {return single()->mask();}
    PayloadPtr variance() const {return single()->variance();}
    PayloadPtr attachment(const string& attachName) const {
      return single()->attachment(attachName);
    }

    // Returns the new extension, or for a single view the extension that
    // received the attachment.
    ExtensionPtr append(PayloadPtr data,
			const string& name="",
			int version=NO_VERSION,
			bool autoNumber=false);
    ExtensionPtr append(const Header& h,
			PayloadPtr data,
			const string& name="",
			int version=NO_VERSION,
			bool autoNumber=false);
    void append(const AstroData& other, bool autoNumber=false);

    void remove(int position);
    void remove(const string& name, int version);
    // Every extension of this name, e.g. a singleton table
    void remove(const string& name);

    // Names of extensions holding tables
    vector<string> tableNames() const;

    void info(ostream& os) const;

    // Metadata descriptors.  Looked up in the PHU, then in extension
    // headers in order.  Numeric descriptors accept integer keywords.
    bool getDescriptor(Descriptor d, string& value) const;
    bool getDescriptor(Descriptor d, double& value) const;
    bool getDescriptor(Descriptor d, int& value) const;
    // These throw NotFoundError when the keyword is absent
    string object() const {return stringDescriptor(Object);}
    string instrument() const {return stringDescriptor(Instrument);}
    string telescope() const {return stringDescriptor(Telescope);}
    string observationId() const {return stringDescriptor(ObservationId);}
    string dataLabel() const {return stringDescriptor(DataLabel);}
    string utDate() const {return stringDescriptor(UtDate);}
    string filter() const {return stringDescriptor(Filter);}
    double exposureTime() const {return doubleDescriptor(ExposureTime);}
    double airmass() const {return doubleDescriptor(Airmass);}
    double ra() const {return doubleDescriptor(RightAscension);}
    double dec() const {return doubleDescriptor(Declination);}
    double gain() const {return doubleDescriptor(Gain);}
    double readNoise() const {return doubleDescriptor(ReadNoise);}

  private:
    std::shared_ptr<Header> primary;
    ExtensionIndex index;
    AstroDataConfig cfg;
    bool singleView;
    string source;

    // Empty view sharing this container's PHU
    AstroData makeView(bool single) const;
    int normalize(int position) const;
    ExtensionPtr addExtension(const Header& h, PayloadPtr data, const string& name,
			      int version, int headerVersion, bool autoNumber);
    ExtensionPtr attachTo(ExtensionPtr target, PayloadPtr data,
			  const string& name, int version);
    template <class T>
    bool findKeyword(const string& keyword, T& value) const;
    string stringDescriptor(Descriptor d) const;
    double doubleDescriptor(Descriptor d) const;
  };

  std::ostream& operator<<(std::ostream& os, const AstroData& ad);

  // EXTVER of a header, 0 if absent
  int HeaderVersion(const Header& h);

} // namespace astrodata

#endif // ASTRODATA_ASTRODATA_H
