// Images, tables and records held by extensions
#include "Payload.h"
#include "TestSupport.h"

using namespace astrodata;
using namespace astrodata::test;

int main(int argc,
	 char *argv[]) {
  try {
    // Images
    ImageData<float> img(4, 3, 1.5);
    checkEqual(img.dimension(), 2, "image dimension");
    checkEqual(img.nPixels(), 12L, "image pixel count");
    checkEqual(img.pixelType(), Tfloat, "pixel type");
    checkEqual(img.describe(), "Image 4x3 float", "image description");
    img(3,2) = 7.;
    checkEqual(img[11], 7.f, "(x,y) maps with x fastest");
    checkThrows<NotFoundError>([&]() {img(4,0);}, "x outside image");
    checkThrows<NotFoundError>([&]() {img(0,-1);}, "negative y");

    ImageData<short> cube(vector<long>{2, 2, 2});
    checkEqual(cube.nPixels(), 8L, "3d pixel count");
    checkThrows<ValueError>([&]() {cube(0,0);}, "(x,y) access to 3d image");
    checkThrows<ValueError>([&]() {ImageData<int>(vector<long>{3}, vector<int>{1,2});},
			    "pixel values of wrong length");
    ImageData<int> empty((vector<long>()));
    checkEqual(empty.nPixels(), 0L, "dimensionless image is empty");

    std::unique_ptr<Payload> copy(img.duplicate());
    ImageData<float>& imgCopy = dynamic_cast<ImageData<float>&>(*copy);
    imgCopy[0] = -1.;
    checkEqual(img[0], 1.5f, "duplicate() copies pixels");

    // Tables
    TableData t;
    t.addColumn(vector<int>{1, 2, 3}, "ID");
    t.addColumn(vector<double>{0.5, 1.5, 2.5}, "FLUX");
    t.addColumn(vector<string>{"a", "b", "c"}, "NAME");
    t.addColumn(vector<bool>{true, false, true}, "GOOD");
    checkEqual(t.nrows(), 3L, "table rows");
    checkEqual(t.ncols(), 4, "table columns");
    checkEqual(t.columnNames()[1], "FLUX", "column order");
    checkEqual(t.columnType("NAME"), Tstring, "string column type");
    checkEqual(t.describe(), "Table 3 rows x 4 columns", "table description");

    int id;
    t.readCell(id, "ID", 2);
    checkEqual(id, 3, "readCell");
    t.writeCell(string("z"), "NAME", 0);
    vector<string> names;
    t.readCells(names, "NAME");
    checkEqual(names[0], "z", "writeCell");
    bool good = false;
    t.readCell(good, "GOOD", 2);
    check(good, "bool cell");

    checkThrows<ValueError>([&]() {t.readCell(id, "FLUX", 0);}, "read with wrong type");
    checkThrows<NotFoundError>([&]() {t.readCell(id, "ID", 3);}, "row past end");
    checkThrows<NotFoundError>([&]() {t.readCell(id, "NOPE", 0);}, "absent column");
    checkThrows<ConflictError>([&]() {t.addColumn(vector<int>{4,5,6}, "ID");},
			       "duplicate column");
    checkThrows<ValueError>([&]() {t.addColumn(vector<int>{4,5}, "SHORT");},
			    "column of wrong length");
    checkThrows<ValueError>([&]() {t.addColumn(vector<int>{4,5,6}, "");},
			    "unnamed column");

    TableData t2(t);
    check(t2==t, "copied table equals original");
    t2.writeCell(99, "ID", 0);
    check(t2!=t, "copy does not alias");
    t2.eraseColumn("ID");
    checkEqual(t2.ncols(), 3, "eraseColumn");
    check(!t2.hasColumn("ID"), "erased column gone");
    checkEqual(t2.columnNames()[0], "FLUX", "order after erase");
    checkThrows<NotFoundError>([&]() {t2.eraseColumn("ID");}, "erase absent column");

    // Records
    RecordData rec;
    rec.record().append("GRATING", "B600");
    rec.record().append("CENTWAVE", 520.);
    checkEqual(rec.payloadType(), RecordPayload, "record type");
    checkEqual(rec.describe(), "Record 2 fields", "record description");
    std::unique_ptr<Payload> recCopy(rec.duplicate());
    dynamic_cast<RecordData&>(*recCopy).record().setValue("CENTWAVE", 700.);
    double w;
    check(rec.record().getValue("CENTWAVE", w) && w==520., "record copies are deep");

    cout << "testPayload OK" << endl;
  } catch (std::runtime_error& e) {
    quit(e,1);
  }
  exit(0);
}
