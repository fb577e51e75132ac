#include "FitsIO.h"
#include <algorithm>

using namespace astrodata;
using namespace astrodata::fits;

namespace {

  //////////////////////////////////////////////////////////////
  // Reading
  //////////////////////////////////////////////////////////////

  template <class T>
  PayloadPtr
  readImage(fitsfile* fptr, const vector<long>& axes, int datatype) {
    std::shared_ptr<ImageData<T> > img(new ImageData<T>(axes));
    long npix = img->nPixels();
    if (npix > 0) {
      int status = 0;
      int anynul;
      fits_read_img(fptr, datatype, 1, npix, NULL, img->data().data(), &anynul, &status);
      checkCFITSIO(status, "Reading image pixels");
    }
    return img;
  }

  PayloadPtr
  readImageHDU(fitsfile* fptr) {
    int status = 0;
    int bitpix;
    int naxis;
    fits_get_img_equivtype(fptr, &bitpix, &status);
    fits_get_img_dim(fptr, &naxis, &status);
    checkCFITSIO(status, "Reading image parameters");
    vector<long> axes(naxis, 0);
    if (naxis > 0) {
      fits_get_img_size(fptr, naxis, axes.data(), &status);
      checkCFITSIO(status, "Reading image size");
    }
    switch (bitpix) {
    case BYTE_IMG:
      return readImage<unsigned char>(fptr, axes, TBYTE);
    case SBYTE_IMG:
    case SHORT_IMG:
      return readImage<short>(fptr, axes, TSHORT);
    case USHORT_IMG:
      return readImage<unsigned short>(fptr, axes, TUSHORT);
    case LONG_IMG:
      return readImage<int>(fptr, axes, TINT);
    case ULONG_IMG:
    case LONGLONG_IMG:
      return readImage<long>(fptr, axes, TLONG);
    case FLOAT_IMG:
      return readImage<float>(fptr, axes, TFLOAT);
    case DOUBLE_IMG:
      return readImage<double>(fptr, axes, TDOUBLE);
    default:
      FormatAndThrow<FITSError>() << "Unsupported BITPIX " << bitpix;
    }
    return PayloadPtr();
  }

  template <class T>
  void
  readColumn(fitsfile* fptr, int col, long nrows, int datatype,
	     TableData& table, const string& name) {
    vector<T> values(nrows);
    if (nrows > 0) {
      int status = 0;
      int anynul;
      fits_read_col(fptr, datatype, col, 1, 1, nrows, NULL, values.data(),
		    &anynul, &status);
      checkCFITSIO(status, "Reading column " + name);
    }
    table.addColumn(values, name);
  }

  std::shared_ptr<TableData>
  readTableHDU(fitsfile* fptr) {
    std::shared_ptr<TableData> table(new TableData);
    int status = 0;
    long nrows;
    int ncols;
    fits_get_num_rows(fptr, &nrows, &status);
    fits_get_num_cols(fptr, &ncols, &status);
    checkCFITSIO(status, "Reading table size");

    for (int col=1; col<=ncols; col++) {
      std::ostringstream ttype;
      ttype << "TTYPE" << col;
      char cname[FLEN_VALUE];
      fits_read_key(fptr, TSTRING, const_cast<char*>(ttype.str().c_str()),
		    cname, NULL, &status);
      int typecode;
      long repeat;
      long width;
      fits_get_eqcoltype(fptr, col, &typecode, &repeat, &width, &status);
      checkCFITSIO(status, "Reading description of column " + ttype.str());
      string name = cname;

      if (typecode==TSTRING) {
	vector<vector<char> > buffers(nrows, vector<char>(width+1, 0));
	vector<char*> ptrs(nrows);
	for (long i=0; i<nrows; i++) ptrs[i] = buffers[i].data();
	if (nrows > 0) {
	  int anynul;
	  fits_read_col_str(fptr, col, 1, 1, nrows, const_cast<char*>(""),
			    ptrs.data(), &anynul, &status);
	  checkCFITSIO(status, "Reading column " + name);
	}
	vector<string> values(nrows);
	for (long i=0; i<nrows; i++) values[i] = ptrs[i];
	table->addColumn(values, name);
	continue;
      }

      if (typecode < 0 || repeat != 1)
	FormatAndThrow<FITSError>() << "Column " << name
				    << " is not a scalar column (repeat " << repeat << ")";
      switch (typecode) {
      case TLOGICAL:
	{
	  vector<char> flags(nrows, 0);
	  if (nrows > 0) {
	    int anynul;
	    fits_read_col(fptr, TLOGICAL, col, 1, 1, nrows, NULL, flags.data(),
			  &anynul, &status);
	    checkCFITSIO(status, "Reading column " + name);
	  }
	  vector<bool> values(flags.begin(), flags.end());
	  table->addColumn(values, name);
	}
	break;
      case TBYTE:
	readColumn<unsigned char>(fptr, col, nrows, TBYTE, *table, name);
	break;
      case TSBYTE:
      case TSHORT:
	readColumn<short>(fptr, col, nrows, TSHORT, *table, name);
	break;
      case TUSHORT:
	readColumn<unsigned short>(fptr, col, nrows, TUSHORT, *table, name);
	break;
      case TINT:
      case TLONG:
	readColumn<int>(fptr, col, nrows, TINT, *table, name);
	break;
      case TULONG:
      case TLONGLONG:
	readColumn<long>(fptr, col, nrows, TLONG, *table, name);
	break;
      case TFLOAT:
	readColumn<float>(fptr, col, nrows, TFLOAT, *table, name);
	break;
      case TDOUBLE:
	readColumn<double>(fptr, col, nrows, TDOUBLE, *table, name);
	break;
      default:
	FormatAndThrow<FITSError>() << "Column " << name
				    << " has unsupported type code " << typecode;
      }
    }
    return table;
  }

  template <class T>
  void
  cellToRecord(const TableData& table, const string& name, Header& h) {
    T value;
    table.readCell(value, name, 0);
    h.append(name, value);
  }

  // One-row table back to keyword/value record
  PayloadPtr
  tableToRecord(const TableData& table) {
    std::shared_ptr<RecordData> rec(new RecordData);
    if (table.nrows() != 1)
      FormatAndThrow<FITSError>() << RECORD_KEY << " table has " << table.nrows()
				  << " rows, needs 1";
    for (auto& name : table.columnNames()) {
      switch (table.columnType(name)) {
      case Tbool:
	{
	  vector<bool> v;
	  table.readCells(v, name);
	  rec->record().append(name, bool(v[0]));
	}
	break;
      case Tint:
	cellToRecord<int>(table, name, rec->record());
	break;
      case Tlong:
	cellToRecord<long>(table, name, rec->record());
	break;
      case Tdouble:
	cellToRecord<double>(table, name, rec->record());
	break;
      case Tstring:
	cellToRecord<string>(table, name, rec->record());
	break;
      default:
	FormatAndThrow<FITSError>() << "Record field " << name << " has type "
				    << DataTypeName(table.columnType(name));
      }
    }
    return rec;
  }

  //////////////////////////////////////////////////////////////
  // Writing
  //////////////////////////////////////////////////////////////

  template <class T>
  void
  writeImage(fitsfile* fptr, const ImageBase& base, int bitpix, int datatype) {
    const ImageData<T>& img = dynamic_cast<const ImageData<T>&>(base);
    int status = 0;
    vector<long> axes = img.axes();
    fits_create_img(fptr, bitpix, axes.size(), axes.empty() ? NULL : axes.data(), &status);
    checkCFITSIO(status, "Creating image HDU");
    if (img.nPixels() > 0) {
      fits_write_img(fptr, datatype, 1, img.nPixels(),
		     const_cast<T*>(img.data().data()), &status);
      checkCFITSIO(status, "Writing image pixels");
    }
  }

  void
  writeImageHDU(fitsfile* fptr, const ImageBase& img) {
    switch (img.pixelType()) {
    case Tbyte:
      writeImage<unsigned char>(fptr, img, BYTE_IMG, TBYTE);
      break;
    case Tshort:
      writeImage<short>(fptr, img, SHORT_IMG, TSHORT);
      break;
    case Tushort:
      writeImage<unsigned short>(fptr, img, USHORT_IMG, TUSHORT);
      break;
    case Tint:
      writeImage<int>(fptr, img, LONG_IMG, TINT);
      break;
    case Tlong:
      writeImage<long>(fptr, img, LONGLONG_IMG, TLONG);
      break;
    case Tfloat:
      writeImage<float>(fptr, img, FLOAT_IMG, TFLOAT);
      break;
    case Tdouble:
      writeImage<double>(fptr, img, DOUBLE_IMG, TDOUBLE);
      break;
    default:
      throw FITSError("No FITS image type for pixels of type "
		      + DataTypeName(img.pixelType()));
    }
  }

  template <class T>
  void
  writeColumn(fitsfile* fptr, int col, const TableData& table,
	      const string& name, int datatype) {
    vector<T> values;
    table.readCells(values, name);
    if (values.empty()) return;
    int status = 0;
    fits_write_col(fptr, datatype, col, 1, 1, values.size(), values.data(), &status);
    checkCFITSIO(status, "Writing column " + name);
  }

  void
  writeTableHDU(fitsfile* fptr, const TableData& table) {
    vector<string> names = table.columnNames();
    vector<string> forms;
    for (auto& name : names) {
      switch (table.columnType(name)) {
      case Tbool:   forms.push_back("L"); break;
      case Tbyte:   forms.push_back("B"); break;
      case Tshort:  forms.push_back("I"); break;
      case Tushort: forms.push_back("U"); break;
      case Tint:    forms.push_back("J"); break;
      case Tlong:   forms.push_back("K"); break;
      case Tfloat:  forms.push_back("E"); break;
      case Tdouble: forms.push_back("D"); break;
      case Tstring:
	{
	  vector<string> values;
	  table.readCells(values, name);
	  size_t width = 1;
	  for (auto& s : values) width = std::max(width, s.size());
	  std::ostringstream oss;
	  oss << width << "A";
	  forms.push_back(oss.str());
	}
	break;
      default:
	throw FITSError("No FITS column type for column " + name);
      }
    }

    vector<char*> ttype;
    vector<char*> tform;
    for (size_t i=0; i<names.size(); i++) {
      ttype.push_back(const_cast<char*>(names[i].c_str()));
      tform.push_back(const_cast<char*>(forms[i].c_str()));
    }
    int status = 0;
    fits_create_tbl(fptr, BINARY_TBL, table.nrows(), names.size(),
		    ttype.data(), tform.data(), NULL, NULL, &status);
    checkCFITSIO(status, "Creating binary table");

    for (size_t i=0; i<names.size(); i++) {
      int col = i+1;
      const string& name = names[i];
      switch (table.columnType(name)) {
      case Tbool:
	{
	  vector<bool> values;
	  table.readCells(values, name);
	  vector<char> flags(values.begin(), values.end());
	  if (!flags.empty())
	    fits_write_col(fptr, TLOGICAL, col, 1, 1, flags.size(), flags.data(), &status);
	}
	break;
      case Tbyte:
	writeColumn<unsigned char>(fptr, col, table, name, TBYTE);
	break;
      case Tshort:
	writeColumn<short>(fptr, col, table, name, TSHORT);
	break;
      case Tushort:
	writeColumn<unsigned short>(fptr, col, table, name, TUSHORT);
	break;
      case Tint:
	writeColumn<int>(fptr, col, table, name, TINT);
	break;
      case Tlong:
	writeColumn<long>(fptr, col, table, name, TLONG);
	break;
      case Tfloat:
	writeColumn<float>(fptr, col, table, name, TFLOAT);
	break;
      case Tdouble:
	writeColumn<double>(fptr, col, table, name, TDOUBLE);
	break;
      case Tstring:
	{
	  vector<string> values;
	  table.readCells(values, name);
	  vector<char*> ptrs;
	  for (auto& s : values) ptrs.push_back(const_cast<char*>(s.c_str()));
	  if (!ptrs.empty())
	    fits_write_col_str(fptr, col, 1, 1, ptrs.size(), ptrs.data(), &status);
	}
	break;
      default:
	break;
      }
      checkCFITSIO(status, "Writing column " + name);
    }
  }

  // Keyword/value record as a one-row table, dropping valueless keywords
  TableData
  recordToTable(const RecordData& rec) {
    TableData table;
    for (auto& r : rec.record()) {
      string kw = r->getKeyword();
      switch (r->valueType()) {
      case Vbool:
	table.addColumn(vector<bool>(1, dynamic_cast<const HdrRecord<bool>&>(*r).Value()), kw);
	break;
      case Vint:
	table.addColumn(vector<int>(1, dynamic_cast<const HdrRecord<int>&>(*r).Value()), kw);
	break;
      case Vlong:
	table.addColumn(vector<long>(1, dynamic_cast<const HdrRecord<long>&>(*r).Value()), kw);
	break;
      case Vdouble:
	table.addColumn(vector<double>(1, dynamic_cast<const HdrRecord<double>&>(*r).Value()),
			kw);
	break;
      case Vstring:
	table.addColumn(vector<string>(1, dynamic_cast<const HdrRecord<string>&>(*r).Value()),
			kw);
	break;
      case Vnull:
	xdbg << "Record keyword " << kw << " has no value, not written" << endl;
	break;
      }
    }
    return table;
  }

  void
  writeHDU(fitsfile* fptr, const Payload& payload, const Header& h) {
    switch (payload.payloadType()) {
    case ImagePayload:
      writeImageHDU(fptr, dynamic_cast<const ImageBase&>(payload));
      writeFitsHeader(fptr, h);
      break;
    case TablePayload:
      writeTableHDU(fptr, dynamic_cast<const TableData&>(payload));
      writeFitsHeader(fptr, h);
      break;
    case RecordPayload:
      {
	writeTableHDU(fptr, recordToTable(dynamic_cast<const RecordData&>(payload)));
	writeFitsHeader(fptr, h);
	int status = 0;
	fits_update_key_log(fptr, const_cast<char*>(RECORD_KEY.c_str()), 1,
			    const_cast<char*>("Table holds a keyword record"), &status);
	checkCFITSIO(status, "Writing " + RECORD_KEY);
      }
      break;
    }
  }

  // Header to write for an extension: EXTNAME and EXTVER come from its key,
  // whatever the caller has done to the header since.
  Header
  extensionHeader(const Extension& e) {
    Header h = e.header();
    h.replace(EXTNAME_KEY, e.getName());
    if (e.isVersioned())
      h.replace(EXTVER_KEY, e.getVersion());
    else if (h.hasKey(EXTVER_KEY))
      h.erase(EXTVER_KEY);
    return h;
  }

  Header
  attachmentHeader(const string& name, const Extension& parent) {
    Header h;
    h.append(EXTNAME_KEY, name);
    if (parent.isVersioned()) h.append(EXTVER_KEY, parent.getVersion());
    h.append(PARENT_KEY, parent.getName(), "Extension this data belongs to");
    return h;
  }

} // anonymous namespace

FitsProvider::FitsProvider(const string& filename_): filename(filename_) {
  FitsFile ff(filename);
  int nHDU = ff.HDUCount();
  ff.moveTo(0);
  phu = readFitsHeader(ff);
  int naxis = 0;
  int status = 0;
  fits_get_img_dim(ff, &naxis, &status);
  checkCFITSIO(status, "Reading primary HDU of " + filename);
  if (naxis > 0)
    cerr << "WARNING: primary HDU pixels of " << filename << " are ignored" << endl;

  for (int hdu=1; hdu<nHDU; hdu++) {
    int hdutype = ff.moveTo(hdu);
    Header h = readFitsHeader(ff);
    PayloadPtr p;
    if (hdutype==IMAGE_HDU) {
      p = readImageHDU(ff);
    } else {
      std::shared_ptr<TableData> table = readTableHDU(ff);
      bool isRecord = false;
      if (h.getValue(RECORD_KEY, isRecord) && isRecord) {
	p = tableToRecord(*table);
	h.erase(RECORD_KEY);
      } else {
	p = table;
      }
    }
    xdbg << "HDU " << hdu << " of " << filename << ": " << p->describe() << endl;
    records.push_back(std::make_pair(h, p));
  }
  dbg << "Read " << records.size() << " extension HDUs from " << filename << endl;
}

Header
FitsProvider::header(int record) const {
  if (record < 0 || record >= size())
    FormatAndThrow<NotFoundError>() << "HDU record " << record << " of " << filename;
  return records[record].first;
}

PayloadPtr
FitsProvider::data(int record) const {
  if (record < 0 || record >= size())
    FormatAndThrow<NotFoundError>() << "HDU record " << record << " of " << filename;
  return records[record].second;
}

AstroData
fits::readFits(const string& filename, const AstroDataConfig& config) {
  FitsProvider provider(filename);
  return AstroData(provider, config);
}

void
fits::writeFits(const AstroData& ad, const string& filename, bool overwrite) {
  FitsFile ff(filename, overwrite ? Overwrite : Create);
  int status = 0;
  fits_create_img(ff, BYTE_IMG, 0, NULL, &status);
  checkCFITSIO(status, "Creating primary HDU of " + filename);
  writeFitsHeader(ff, ad.phu());

  const ExtensionRules& rules = ad.rules();
  for (auto& e : ad) {
    writeHDU(ff, *e->data(), extensionHeader(*e));
    if (e->mask())
      writeHDU(ff, *e->mask(), attachmentHeader(rules.maskName(), *e));
    if (e->variance())
      writeHDU(ff, *e->variance(), attachmentHeader(rules.varianceName(), *e));
    for (auto& a : e->attachmentNames())
      writeHDU(ff, *e->attachment(a), attachmentHeader(a, *e));
  }
  dbg << "Wrote " << ad.size() << " extensions to " << filename << endl;
}
