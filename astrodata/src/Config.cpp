#include "Config.h"
#include "StringStuff.h"
#include <fstream>

using namespace astrodata;

string
AstroDataConfig::CONFIG_PATH = "ASTRODATA_PATH";

ExtensionRules::ExtensionRules(): maskExtension("DQ"),
				  varianceExtension("VAR"),
				  scienceExtension("SCI") {
  versioned.insert("SCI");
  versioned.insert("VAR");
  versioned.insert("DQ");
  rootOnly.insert("SCI");
}

void
ExtensionRules::setMaskName(const string& name) {
  if (name.empty()) throw ConfigError("Empty mask extension name");
  maskExtension = name;
}

void
ExtensionRules::setVarianceName(const string& name) {
  if (name.empty()) throw ConfigError("Empty variance extension name");
  varianceExtension = name;
}

void
ExtensionRules::setScienceName(const string& name) {
  if (name.empty()) throw ConfigError("Empty science extension name");
  scienceExtension = name;
}

namespace {
  std::set<string> readNameSet(const YAML::Node& node, const string& key) {
    if (!node.IsSequence())
      throw ConfigError("extensions." + key + " must be a sequence of names");
    std::set<string> out;
    for (auto n : node) out.insert(n.as<string>());
    return out;
  }
}

void
ExtensionRules::read(const YAML::Node& node) {
  if (!node.IsMap())
    throw ConfigError("extensions section must be a map");
  for (auto entry : node) {
    string key = entry.first.as<string>();
    if (key=="versioned")
      setVersioned(readNameSet(entry.second, key));
    else if (key=="rootOnly")
      setRootOnly(readNameSet(entry.second, key));
    else if (key=="science")
      setScienceName(entry.second.as<string>());
    else if (key=="mask")
      setMaskName(entry.second.as<string>());
    else if (key=="variance")
      setVarianceName(entry.second.as<string>());
    else
      throw ConfigError("Unknown extensions key <" + key + ">");
  }
  if (!isVersioned(scienceExtension))
    throw ConfigError("Science extension " + scienceExtension + " must be a versioned name");
}

void
ExtensionRules::write(YAML::Emitter& os) const {
  os << YAML::BeginMap
     << YAML::Key << "versioned" << YAML::Value << YAML::Flow << YAML::BeginSeq;
  for (auto& n : versioned) os << n;
  os << YAML::EndSeq
     << YAML::Key << "rootOnly" << YAML::Value << YAML::Flow << YAML::BeginSeq;
  for (auto& n : rootOnly) os << n;
  os << YAML::EndSeq
     << YAML::Key << "science" << YAML::Value << scienceExtension
     << YAML::Key << "mask" << YAML::Value << maskExtension
     << YAML::Key << "variance" << YAML::Value << varianceExtension
     << YAML::EndMap;
}

AstroDataConfig
AstroDataConfig::read(istream& is) {
  AstroDataConfig config;
  try {
    YAML::Node root = YAML::Load(is);
    if (root.IsNull()) return config;
    if (!root.IsMap()) throw ConfigError("Configuration root must be a map");
    for (auto section : root) {
      string name = section.first.as<string>();
      if (name=="extensions") {
	config.rules.read(section.second);
      } else if (name=="descriptors") {
	if (!section.second.IsMap())
	  throw ConfigError("descriptors section must be a map");
	for (auto entry : section.second) {
	  Descriptor d;
	  string dname = entry.first.as<string>();
	  if (!DescriptorFromName(dname, d))
	    throw ConfigError("Unknown descriptor <" + dname + ">");
	  string keyword = entry.second.as<string>();
	  if (keyword.empty())
	    throw ConfigError("Empty keyword for descriptor <" + dname + ">");
	  config.descriptors.setKeyword(d, keyword);
	}
      } else {
	throw ConfigError("Unknown configuration section <" + name + ">");
      }
    }
  } catch (YAML::Exception& e) {
    throw ConfigError(string("YAML: ") + e.what());
  }
  dbg << "Read AstroData configuration" << endl;
  return config;
}

AstroDataConfig
AstroDataConfig::readFile(const string& filename) {
  string path = stringstuff::findFileOnPath(filename, CONFIG_PATH);
  if (path.empty())
    throw ConfigError("Could not find configuration file " + filename);
  std::ifstream ifs(path.c_str());
  if (!ifs)
    throw ConfigError("Could not open configuration file " + path);
  dbg << "Reading configuration from " << path << endl;
  return read(ifs);
}

string
AstroDataConfig::dump() const {
  YAML::Emitter out;
  out << YAML::BeginMap << YAML::Key << "extensions" << YAML::Value;
  rules.write(out);
  out << YAML::Key << "descriptors" << YAML::Value << YAML::BeginMap;
  for (int i=0; i<N_DESCRIPTORS; i++) {
    Descriptor d = static_cast<Descriptor>(i);
    out << YAML::Key << DescriptorName(d) << YAML::Value << descriptors.keyword(d);
  }
  out << YAML::EndMap << YAML::EndMap;
  return out.c_str();
}
