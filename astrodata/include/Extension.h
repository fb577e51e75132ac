// One named, optionally versioned unit of header + payload.
#ifndef ASTRODATA_EXTENSION_H
#define ASTRODATA_EXTENSION_H

#include <memory>
#include <utility>

#include "Std.h"
#include "Header.h"
#include "Payload.h"

namespace astrodata {

  // Keywords carrying an extension's identity in its header, and marking a
  // stored record as an attachment of another extension.
  extern const string EXTNAME_KEY;
  extern const string EXTVER_KEY;
  extern const string PARENT_KEY;

  // Version number 0 means "no version": singleton names, attachments.
  const int NO_VERSION = 0;

  // Identity of an extension within a container
  struct ExtensionKey {
    string name;
    int version;
    ExtensionKey(const string& name_="", int version_=NO_VERSION):
      name(name_), version(version_) {}
    bool operator<(const ExtensionKey& rhs) const {
      return name<rhs.name || (name==rhs.name && version<rhs.version);
    }
    bool operator==(const ExtensionKey& rhs) const {
      return name==rhs.name && version==rhs.version;
    }
  };
  std::ostream& operator<<(std::ostream& os, const ExtensionKey& k);

  class Extension {
  public:
    // The header is copied; the payload is shared.  The copy of the header
    // gets EXTNAME/EXTVER set to match name and version.
    Extension(const string& name, int version, const Header& h, PayloadPtr data);

    string getName() const {return name;}
    int getVersion() const {return version;}
    bool isVersioned() const {return version!=NO_VERSION;}
    ExtensionKey key() const {return ExtensionKey(name, version);}

    Header& header() {return hdr;}
    const Header& header() const {return hdr;}

    PayloadPtr data() const {return payload;}
    void setData(PayloadPtr data);

    // Secondary payloads living under this extension.  None of them takes
    // a version or appears as a separate extension of the container.
    PayloadPtr mask() const {return maskData;}
    void setMask(PayloadPtr m) {maskData = m;}
    PayloadPtr variance() const {return varData;}
    void setVariance(PayloadPtr v) {varData = v;}

    // Named attachments; attaching an existing name replaces it.
    void attach(const string& attachName, PayloadPtr p);
    bool hasAttachment(const string& attachName) const;
    PayloadPtr attachment(const string& attachName) const;
    void detach(const string& attachName);
    vector<string> attachmentNames() const;

    // e.g. "SCI 2  Image 2048x4176 float  +mask +variance"
    string describe() const;

  private:
    // Identity changes only through the container that indexes the extension
    friend class AstroData;
    void setName(const string& name_);
    void setVersion(int version_);

    string name;
    int version;
    Header hdr;
    PayloadPtr payload;
    PayloadPtr maskData;
    PayloadPtr varData;
    vector<std::pair<string, PayloadPtr> > attached;
    void syncHeader();
  };

  typedef std::shared_ptr<Extension> ExtensionPtr;

} // namespace astrodata

#endif // ASTRODATA_EXTENSION_H
