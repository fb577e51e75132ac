#include "FITS.h"
#include <cstring>
#include <cstdlib>
#include <climits>
#include <exception>

using namespace astrodata;
using namespace astrodata::fits;

void
fits::throw_CFITSIO(const string& m1) {
  string m = m1 + " CFITSIO Error: ";
  char ebuff[FLEN_ERRMSG];
  while (fits_read_errmsg(ebuff)) {m += "\n\t"; m += ebuff;}
  // Do not throw if we are already unwinding stack from
  // another thrown exception:
  if (std::uncaught_exception()) {
    cerr << "During exception processing: " << m << endl;
  } else {
    throw FITSError(m);
  }
}

void
fits::flushFitsErrors(int& status) {
  fits_clear_errmsg();
  status = 0;
}

FitsFile::FitsFile(const string& fname, OpenMode mode): filename(fname),
							 fptr(nullptr) {
  int status = 0;
  if (mode==ReadOnly) {
    fits_open_file(&fptr, filename.c_str(), READONLY, &status);
    if (status) {
      char ebuff[FLEN_ERRMSG];
      fits_read_errmsg(ebuff);
      flushFitsErrors(status);
      throw FITSCantOpen(filename, ebuff);
    }
    return;
  }
  // CFITSIO clobbers an existing file when the name starts with !
  string cname = (mode==Overwrite ? "!" : "") + filename;
  fits_create_file(&fptr, cname.c_str(), &status);
  if (status) {
    char ebuff[FLEN_ERRMSG];
    fits_read_errmsg(ebuff);
    flushFitsErrors(status);
    throw FITSCantOpen(filename, ebuff);
  }
}

FitsFile::~FitsFile() {
  if (!fptr) return;
  int status = 0;
  fits_close_file(fptr, &status);
  if (status) {
    char ebuff[FLEN_ERRMSG];
    fits_read_errmsg(ebuff);
    cerr << "Error closing FITS file " << filename << ": " << ebuff << endl;
    flushFitsErrors(status);
  }
}

int
FitsFile::HDUCount() const {
  int status = 0;
  int count;
  fits_get_num_hdus(fptr, &count, &status);
  checkCFITSIO(status, "HDUCount() in " + filename);
  return count;
}

int
FitsFile::moveTo(int hdu) const {
  int status = 0;
  int hdutype;
  fits_movabs_hdu(fptr, hdu+1, &hdutype, &status);
  if (status) {
    std::ostringstream oss;
    oss << "Moving to HDU " << hdu << " of " << filename;
    throw_CFITSIO(oss.str());
  }
  return hdutype;
}

bool
fits::isSpecialKeyword(const string& keyword) {
  static const char* fixed[] = {"SIMPLE", "BITPIX", "NAXIS", "EXTEND", "XTENSION",
				"PCOUNT", "GCOUNT", "TFIELDS", "BSCALE", "BZERO",
				"THEAP", "END", 0};
  for (int i=0; fixed[i]; i++)
    if (keyword==fixed[i]) return true;
  // Indexed structural keywords: NAXISn, TFORMn, ...
  static const char* indexed[] = {"NAXIS", "TTYPE", "TFORM", "TBCOL", "TUNIT",
				  "TSCAL", "TZERO", "TNULL", "TDISP", "TDIM", 0};
  for (int i=0; indexed[i]; i++) {
    size_t n = std::strlen(indexed[i]);
    if (keyword.size() > n
	&& keyword.compare(0, n, indexed[i])==0
	&& keyword.find_first_not_of("0123456789", n)==string::npos)
      return true;
  }
  return false;
}

namespace {
  // CFITSIO returns string values in quotes with doubled internal quotes
  string unquote(const string& v) {
    string s = v;
    if (s.size()>=2 && s[0]=='\'' && s[s.size()-1]=='\'')
      s = s.substr(1, s.size()-2);
    else
      dbg << "String keyword value without quotes: [" << v << "]" << endl;
    string out;
    for (size_t i=0; i<s.size(); i++) {
      out += s[i];
      if (s[i]=='\'' && i+1<s.size() && s[i+1]=='\'') i++;
    }
    size_t last = out.find_last_not_of(' ');
    return last==string::npos ? string() : out.substr(0, last+1);
  }
}

Header
fits::readFitsHeader(fitsfile* fptr) {
  Header h;

  int status = 0;
  int nkeys;
  fits_get_hdrspace(fptr, &nkeys, NULL, &status);
  checkCFITSIO(status, "readFitsHeader getting header size");

  char keyword[FLEN_CARD];
  char comment[FLEN_CARD];
  char value[FLEN_CARD];
  char units[FLEN_CARD];
  char vtype;

  for (int ikey=1; ikey<=nkeys; ikey++) {
    fits_read_keyn(fptr, ikey, keyword, value, comment, &status);
    if (std::strlen(value)>0) {
      fits_get_keytype(value, &vtype, &status);
      fits_read_key_unit(fptr, keyword, units, &status);
    } else {
      vtype = 'N';
      units[0] = 0;
    }
    checkCFITSIO(status, "readFitsHeader collecting all keys");

    string kw = keyword;
    if (kw=="COMMENT") {
      h.addComment(comment);
      continue;
    }
    if (kw=="HISTORY") {
      h.addHistory(comment);
      continue;
    }
    if (kw.empty() || isSpecialKeyword(kw)) continue;

    string vstring = value;
    HdrRecordBase* hh;
    bool badstring = false;
    switch (vtype) {
    case 'N':
      hh = new HdrRecordNull(kw, comment);
      break;
    case 'C':
      hh = new HdrRecord<string>(kw, unquote(vstring), comment, units);
      break;
    case 'L':
      hh = new HdrRecord<bool>(kw, false, comment, units);
      badstring = hh->setValueString(vstring);
      break;
    case 'I':
      {
	long lv = std::strtol(vstring.c_str(), NULL, 10);
	if (lv >= INT_MIN && lv <= INT_MAX)
	  hh = new HdrRecord<int>(kw, static_cast<int>(lv), comment, units);
	else
	  hh = new HdrRecord<long>(kw, lv, comment, units);
      }
      break;
    case 'F':
      hh = new HdrRecord<double>(kw, 0., comment, units);
      badstring = hh->setValueString(vstring);
      break;
    case 'X':
      // No complex-valued records; keep the text
      hh = new HdrRecord<string>(kw, vstring, comment, units);
      break;
    default:
      throw HeaderError("Header value [" + vstring + "] of unknown type " + vtype);
    }
    if (badstring) {
      delete hh;
      throw HeaderError("Could not read value [" + vstring + "] for keyword " + kw);
    }
    h.append(hh);
  }
  return h;
}

void
fits::writeFitsHeader(fitsfile* fptr, const Header& h) {
  int status = 0;
  for (auto& r : h) {
    string kw = r->getKeyword();
    if (isSpecialKeyword(kw)) continue;
    char* ckw = const_cast<char*>(kw.c_str());
    char* ccom = const_cast<char*>(r->getComment().c_str());
    switch (r->valueType()) {
    case Vnull:
      fits_update_key_null(fptr, ckw, ccom, &status);
      break;
    case Vbool:
      {
	const HdrRecord<bool>* b = dynamic_cast<const HdrRecord<bool>*>(r.get());
	fits_update_key_log(fptr, ckw, b->Value() ? 1 : 0, ccom, &status);
      }
      break;
    case Vint:
      {
	const HdrRecord<int>* i = dynamic_cast<const HdrRecord<int>*>(r.get());
	fits_update_key_lng(fptr, ckw, i->Value(), ccom, &status);
      }
      break;
    case Vlong:
      {
	const HdrRecord<long>* l = dynamic_cast<const HdrRecord<long>*>(r.get());
	fits_update_key_lng(fptr, ckw, l->Value(), ccom, &status);
      }
      break;
    case Vdouble:
      {
	const HdrRecord<double>* d = dynamic_cast<const HdrRecord<double>*>(r.get());
	fits_update_key_dbl(fptr, ckw, d->Value(), -15, ccom, &status);
      }
      break;
    case Vstring:
      {
	const HdrRecord<string>* s = dynamic_cast<const HdrRecord<string>*>(r.get());
	fits_update_key_str(fptr, ckw, const_cast<char*>(s->Value().c_str()),
			    ccom, &status);
      }
      break;
    }
    if (!r->getUnits().empty())
      fits_write_key_unit(fptr, ckw, const_cast<char*>(r->getUnits().c_str()), &status);
    checkCFITSIO(status, "writeFitsHeader keyword " + kw);
  }
  for (auto& c : h.comments())
    fits_write_comment(fptr, const_cast<char*>(c.c_str()), &status);
  for (auto& c : h.history())
    fits_write_history(fptr, const_cast<char*>(c.c_str()), &status);
  checkCFITSIO(status, "writeFitsHeader comments");
}
