// YAML configuration of naming rules and descriptor keywords
#include "Config.h"
#include "TestSupport.h"
#include <fstream>
#include <cstdio>

using namespace astrodata;
using namespace astrodata::test;

int main(int argc,
	 char *argv[]) {
  try {
    {
      AstroDataConfig defaults;
      const ExtensionRules& r = defaults.rules;
      check(r.isVersioned("SCI") && r.isVersioned("VAR") && r.isVersioned("DQ"),
	    "default versioned names");
      check(!r.isVersioned("MDF"), "other names are singletons");
      check(r.isRootOnly("SCI") && !r.isRootOnly("DQ"), "default root-only names");
      check(r.isAttachmentName("DQ") && r.isAttachmentName("VAR"), "attachment names");
      checkEqual(defaults.descriptors.keyword(ExposureTime), "EXPTIME", "default keyword");
      checkEqual(defaults.descriptors.keyword(UtDate), "DATE-OBS", "default date keyword");
    }

    std::istringstream yaml(
      "extensions:\n"
      "  versioned: [SCI, VAR, BPM, OBJMASK]\n"
      "  mask: BPM\n"
      "descriptors:\n"
      "  filter: FILTER2\n"
      "  exposure_time: ELAPSED\n");
    AstroDataConfig cfg = AstroDataConfig::read(yaml);
    check(cfg.rules.isVersioned("OBJMASK") && !cfg.rules.isVersioned("DQ"), "versioned list");
    checkEqual(cfg.rules.maskName(), "BPM", "mask name");
    checkEqual(cfg.rules.varianceName(), "VAR", "unlisted fields keep defaults");
    checkEqual(cfg.descriptors.keyword(Filter), "FILTER2", "descriptor keyword");
    checkEqual(cfg.descriptors.keyword(ExposureTime), "ELAPSED", "descriptor keyword 2");
    checkEqual(cfg.descriptors.keyword(Airmass), "AIRMASS", "unlisted descriptor");

    // A container follows its configuration
    AstroData ad(cfg);
    ad.append(scienceImage(), "SCI");
    ad[0].append(maskImage(), "BPM");
    check(bool(ad[0].mask()), "configured mask name attaches as mask");
    checkThrows<ValueError>([&]() {ad.append(maskImage(), "BPM");}, "configured mask at root");
    ad.append(extHeader("OBJMASK", 3), maskImage());
    checkEqual(ad.extension(1)->key(), ExtensionKey("OBJMASK", 3), "configured versioned name");

    // Round trip through dump()
    std::istringstream dumped(cfg.dump());
    AstroDataConfig again = AstroDataConfig::read(dumped);
    checkEqual(again.rules.maskName(), "BPM", "dumped mask name");
    check(again.rules.isVersioned("OBJMASK"), "dumped versioned names");
    checkEqual(again.descriptors.keyword(Filter), "FILTER2", "dumped descriptor");

    std::istringstream empty("");
    checkEqual(AstroDataConfig::read(empty).rules.scienceName(), "SCI", "empty file");

    const char* badFiles[] = {
      "extensions:\n  colour: red\n",
      "extensions:\n  science: OBJ\n",
      "extensions:\n  versioned: SCI\n",
      "descriptors:\n  seeing: FWHM\n",
      "descriptors:\n  filter: ''\n",
      "telescope: big\n",
      "extensions: [SCI\n",
      0};
    for (int i=0; badFiles[i]; i++) {
      std::istringstream bad(badFiles[i]);
      checkThrows<ConfigError>([&]() {AstroDataConfig::read(bad);},
			       string("bad configuration: ") + badFiles[i]);
    }

    // Files are searched along ASTRODATA_PATH
    const string filename = "testConfig_search.yaml";
    {
      std::ofstream ofs(filename.c_str());
      ofs << "extensions:\n  variance: SIGMA2\n  versioned: [SCI, SIGMA2, DQ]\n";
    }
    setenv(AstroDataConfig::CONFIG_PATH.c_str(), "/nonexistent:.", 1);
    AstroDataConfig fromFile = AstroDataConfig::readFile(filename);
    checkEqual(fromFile.rules.varianceName(), "SIGMA2", "configuration read from path");
    std::remove(filename.c_str());
    checkThrows<ConfigError>([&]() {AstroDataConfig::readFile(filename);},
			     "missing configuration file");

    cout << "testConfig OK" << endl;
  } catch (std::runtime_error& e) {
    quit(e,1);
  }
  exit(0);
}
