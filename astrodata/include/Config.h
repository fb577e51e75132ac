// Naming rules for extensions and the descriptor keyword map, with their
// YAML serialization.
#ifndef ASTRODATA_CONFIG_H
#define ASTRODATA_CONFIG_H

#include <set>

#include "Std.h"
#include "Errors.h"
#include "Descriptors.h"
#include "yaml-cpp/yaml.h"

namespace astrodata {

  class ConfigError: public AstroDataError {
  public:
    ConfigError(const string& m=""):
      AstroDataError("Config: " + m) {}
  };

  // Classifies extension names:
  //  - versioned names may have many numbered instances (SCI, VAR, DQ);
  //    any other name is a singleton (MDF, arbitrary tables).
  //  - the mask and variance names are how secondary payloads attach to a
  //    single extension; a bare payload of these names may not be
  //    appended at the container root.
  //  - root-only names may not be attached under a single extension.
  //  - the science name is given to unnamed image records on load.
  class ExtensionRules {
  public:
    ExtensionRules();

    bool isVersioned(const string& name) const {return versioned.count(name)>0;}
    bool isRootOnly(const string& name) const {return rootOnly.count(name)>0;}
    bool isAttachmentName(const string& name) const {
      return name==maskExtension || name==varianceExtension;
    }
    string maskName() const {return maskExtension;}
    string varianceName() const {return varianceExtension;}
    string scienceName() const {return scienceExtension;}

    void setVersioned(const std::set<string>& names) {versioned = names;}
    void setRootOnly(const std::set<string>& names) {rootOnly = names;}
    void setMaskName(const string& name);
    void setVarianceName(const string& name);
    void setScienceName(const string& name);

    // Overrides the fields present in the node, keeps the rest
    void read(const YAML::Node& node);
    void write(YAML::Emitter& os) const;

  private:
    std::set<string> versioned;
    std::set<string> rootOnly;
    string maskExtension;
    string varianceExtension;
    string scienceExtension;
  };

  // Everything a container is configured with.  File layout:
  //   extensions:
  //     versioned: [SCI, VAR, DQ]
  //     rootOnly: [SCI]
  //     science: SCI
  //     mask: DQ
  //     variance: VAR
  //   descriptors:
  //     exposure_time: EXPTIME
  //     filter: FILTER2
  // Either section may be absent; absent entries keep their defaults.
  struct AstroDataConfig {
    ExtensionRules rules;
    DescriptorMap descriptors;

    static AstroDataConfig read(istream& is);
    // File is searched for along the ASTRODATA_PATH environment variable.
    static AstroDataConfig readFile(const string& filename);
    string dump() const;

    static string CONFIG_PATH;
  };

} // namespace astrodata

#endif // ASTRODATA_CONFIG_H
