// Appending single extensions to containers and to single-extension views
#include "AstroData.h"
#include "TestSupport.h"

using namespace astrodata;
using namespace astrodata::test;

int main(int argc,
	 char *argv[]) {
  try {
    {
      // SCI 1 header onto SCI 1-3, auto-numbered
      AstroData ad1 = sci3();
      AstroData ad4 = sci3Var3Dq3();
      AstroData sci = ad4("SCI", 1);
      ad1.append(sci.header(), sci.data(), "", NO_VERSION, true);
      checkEqual(ad1.extension(3)->key(), ExtensionKey("SCI", 4), "auto-numbered SCI");
      int extver;
      check(ad1.extension(3)->header().getValue(EXTVER_KEY, extver) && extver==4,
	    "EXTVER follows the assigned version");
      checkEqual(sci.version(), 1, "source extension untouched");
    }
    {
      // A present name continues from its own highest version, even when
      // another name has gone further
      AstroData ad(samplePHU("sci1var5"));
      ad.append(extHeader("SCI", 1), scienceImage());
      for (int v=1; v<=5; v++)
	ad.append(extHeader("VAR", v), scienceImage());
      ad.append(scienceImage(), "SCI");
      checkEqual(ad.extension(6)->key(), ExtensionKey("SCI", 2), "SCI after VAR 1-5");
      ad.append(extHeader("DQ"), maskImage());
      checkEqual(ad.extension(7)->key(), ExtensionKey("DQ", 6), "new name after VAR 5");
    }
    {
      // VAR 2 header onto SCI 1-3
      AstroData ad1 = sci3();
      AstroData var = sci3Var3Dq3()("VAR", 2);
      ad1.append(var.header(), var.data(), "", NO_VERSION, true);
      checkEqual(ad1.extension(3)->key(), ExtensionKey("VAR", 4), "new name after overall max");
    }
    {
      // VAR 3 after SCI 3 is removed
      AstroData ad1 = sci3();
      ad1.remove(2);
      AstroData var = sci3Var3Dq3()("VAR", 3);
      ad1.append(var.header(), var.data(), "", NO_VERSION, true);
      checkEqual(ad1.extension(2)->key(), ExtensionKey("VAR", 3), "freed maximum reused");
    }
    {
      // Explicit free version wins
      AstroData ad1 = sci3();
      AstroData sci = sci3Var3Dq3()("SCI", 1);
      ad1.append(sci.header(), sci.data(), "", 10, true);
      checkEqual(ad1.extension(3)->key(), ExtensionKey("SCI", 10), "explicit version");
    }
    {
      // Without auto-numbering the header version collides
      AstroData ad1 = sci3();
      AstroData sci = sci3Var3Dq3()("SCI", 1);
      checkThrows<ConflictError>([&]() {ad1.append(sci.header(), sci.data());},
				 "colliding header version");
      checkEqual(ad1.size(), 3, "failed append changes nothing");
      ad1.append(sci.header(), sci.data(), "", 7);
      checkEqual(ad1.extension(3)->key(), ExtensionKey("SCI", 7), "explicit version, no auto");
    }
    {
      // Building a container from a primary header
      AstroData ad1 = sci3();
      AstroData adNew(ad1.phu());
      for (int v=1; v<=3; v++) {
	AstroData sci = ad1("SCI", v);
	adNew.append(sci.header(), sci.data(), "", NO_VERSION, true);
      }
      checkKeys(adNew, {{"SCI", 1}, {"SCI", 2}, {"SCI", 3}}, "built from PHU");
      string label;
      check(adNew.phu().getValue("DATALAB", label) && label=="sci3", "PHU copied");
    }
    {
      // Explicit version overrides the header for each name
      AstroData ad4 = sci3Var3Dq3();
      AstroData adNew(ad4.phu());
      adNew.append(ad4[1].header(), ad4[1].data(), "", 1, true);
      adNew.append(ad4[7].header(), ad4[7].data(), "", 1, true);
      checkKeys(adNew, {{"SCI", 1}, {"DQ", 1}}, "explicit version per name");
    }
    {
      // Singleton table with a header
      AstroData ad3 = mdfSciVarDq();
      AstroData adNew(ad3.phu());
      adNew.append(ad3[0].header(), ad3[0].data(), "", NO_VERSION, true);
      checkKeys(adNew, {{"MDF", NO_VERSION}}, "MDF appended");
      check(!adNew.extension(0)->header().hasKey(EXTVER_KEY), "singleton has no EXTVER");
      checkThrows<ConflictError>([&]() {
	  adNew.append(ad3[0].header(), ad3[0].data(), "", NO_VERSION, true);},
	"second singleton of a name");
    }
    {
      // Rules for bare payloads at the top level
      AstroData ad1 = sci3();
      checkThrows<ValueError>([&]() {ad1.append(scienceImage());}, "bare payload without name");
      checkThrows<ValueError>([&]() {ad1.append(scienceImage(), "DQ", NO_VERSION, true);},
			      "bare mask at the top level");
      checkThrows<ValueError>([&]() {ad1.append(scienceImage(), "VAR");},
			      "bare variance at the top level");
      checkThrows<ValueError>([&]() {ad1.append(scienceImage(), "ARBITRARY");},
			      "image with a singleton name");
      checkThrows<ValueError>([&]() {ad1.append(Header(), scienceImage());},
			      "header without EXTNAME");
      checkThrows<ValueError>([&]() {ad1.append(PayloadPtr(), "SCI");}, "null payload");
      checkThrows<ValueError>([&]() {ad1.append(mdfTable(), "OBJCAT", 2);},
			      "version for a singleton table");
      ad1.append(scienceImage(), "SCI", NO_VERSION, true);
      ad1.append(mdfTable(), "OBJCAT");
      PayloadPtr rec(new RecordData);
      ad1.append(rec, "REFCAT");
      checkKeys(ad1, {{"SCI", 1}, {"SCI", 2}, {"SCI", 3}, {"SCI", 4},
	             {"OBJCAT", NO_VERSION}, {"REFCAT", NO_VERSION}},
	"bare payloads with names");
      checkEqual(ad1.tableNames().size(), size_t(1), "one table extension");
      checkEqual(ad1.tableNames()[0], "OBJCAT", "table name");
      // A DQ arriving with its own header is an ordinary versioned extension
      ad1.append(extHeader("DQ", 2), maskImage());
      checkEqual(ad1.extension(6)->key(), ExtensionKey("DQ", 2), "DQ with header");
    }
    {
      // Appending to a single-extension view attaches data
      AstroData ad1 = sci3();
      AstroData sci2 = ad1[1];
      PayloadPtr dq = maskImage();
      sci2.append(dq, "DQ");
      sci2.append(scienceImage(0.5), "VAR");
      sci2.append(mdfTable(), "OBJCAT");
      checkEqual(ad1.size(), 3, "attachments consume no extension");
      check(ad1("SCI", 2).mask()==dq, "mask seen through the parent");
      check(bool(ad1("SCI", 2).variance()), "variance attached");
      check(ad1("SCI", 2).attachment("OBJCAT")->payloadType()==TablePayload,
	    "named attachment");
      check(!ad1("SCI", 1).mask(), "other extensions untouched");
      checkThrows<ValueError>([&]() {sci2.append(scienceImage(), "SCI");},
			      "root-only name as attachment");
      checkThrows<ValueError>([&]() {sci2.append(maskImage(), "DQ", 2);},
			      "version for an attachment");
      checkThrows<ValueError>([&]() {sci2.append(scienceImage());}, "unnamed attachment");
      checkThrows<NotFoundError>([&]() {sci2.attachment("NOPE");}, "absent attachment");
      // Header carries the attachment name
      sci2.append(extHeader("DQ", 5), maskImage());
      check(ad1("SCI", 2).mask()!=dq, "mask replaced by header append");
      checkThrows<ValueError>([&]() {ad1.name();}, "single accessor on whole container");
    }

    cout << "testAppend OK" << endl;
  } catch (std::runtime_error& e) {
    quit(e,1);
  }
  exit(0);
}
