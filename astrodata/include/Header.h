// Ordered keyword/value metadata, a la FITS headers.

#ifndef ASTRODATA_HEADER_H
#define ASTRODATA_HEADER_H

#include <list>
#include <memory>
#include <sstream>
#include <type_traits>

#include "Std.h"
#include "Errors.h"

/************************  Header ****************************
 * Holds the primary metadata of an exposure and the header of each
 * extension.  A Header is:
 * a list of COMMENT strings
 * a list of HISTORY strings
 * an ordered list of keyword-indexed records.
 *
 * Records have a keyword string, a value, and optional comment
 * and units strings.  The base class is HdrRecordBase, and the
 * derived classes are
 *   HdrRecordNull (no value)
 *   HdrRecord<T>  (value of type T = bool, int, long, double, string).
 * Other integer types are stored as int or long, float as double.
 * Keywords are case-insensitive and stored upper-case.
 *
 * The most common methods:
 *   append("keyword",value,"comment")
 *   replace("keyword",value,"comment")
 *        ...replaces old keyword record, or appends if none
 *   getValue("keyword", value)
 *        ...returns true & fills the value if keyword is present with
 *           a value of the same type, false otherwise.
 *   erase("keyword")  throws HeaderError if keyword is absent.
 *
 * Copy and assignment are deep copies; a Header owns its records.
 *****************************************************************/

namespace astrodata {

  class HeaderError: public AstroDataError {
  public:
    HeaderError(const string& m=""):
      AstroDataError("Header: " + m) {}
  };

  // Value types a record can hold
  enum ValueType {Vnull, Vbool, Vint, Vlong, Vdouble, Vstring};

  template <class T>
  inline ValueType ValueTypeOf() {return Vnull;}
  template <>
  inline ValueType ValueTypeOf<bool>() {return Vbool;}
  template <>
  inline ValueType ValueTypeOf<int>() {return Vint;}
  template <>
  inline ValueType ValueTypeOf<long>() {return Vlong;}
  template <>
  inline ValueType ValueTypeOf<double>() {return Vdouble;}
  template <>
  inline ValueType ValueTypeOf<string>() {return Vstring;}

  // Type a value of class T is stored as.  Narrower numeric types are
  // widened; there is no StoredType for anything else.
  template <class T> struct StoredType;
  template <> struct StoredType<bool> {typedef bool type;};
  template <> struct StoredType<short> {typedef int type;};
  template <> struct StoredType<unsigned short> {typedef int type;};
  template <> struct StoredType<int> {typedef int type;};
  template <> struct StoredType<unsigned int> {typedef long type;};
  template <> struct StoredType<long> {typedef long type;};
  template <> struct StoredType<unsigned long> {typedef long type;};
  template <> struct StoredType<long long> {typedef long type;};
  template <> struct StoredType<unsigned long long> {typedef long type;};
  template <> struct StoredType<float> {typedef double type;};
  template <> struct StoredType<double> {typedef double type;};
  template <> struct StoredType<string> {typedef string type;};

  // Upper-case the keyword and strip any white space around it
  string KeyFormat(const string& input);

  class HdrRecordBase {
  public:
    HdrRecordBase(const string& kw, const string& com="",
		  const string& un=""): keyword(KeyFormat(kw)),
					comment(com),
					units(un) {}
    virtual ~HdrRecordBase() {}
    virtual HdrRecordBase* duplicate() const =0;

    bool matchesKey(const string& k) const {return keyword==KeyFormat(k);}
    string getKeyword() const {return keyword;}
    string getComment() const {return comment;}
    void setComment(const string& c) {comment=c;}
    string getUnits() const {return units;}
    void setUnits(const string& u) {units=u;}

    virtual ValueType valueType() const =0;
    // Set value from string; return true on failure
    virtual bool setValueString(const string& v) =0;
    virtual string getValueString() const =0;
    // 80-column style card image (not truncated)
    string writeCard() const;

  protected:
    string keyword;
    string comment;
    string units;
  };

  class HdrRecordNull: public HdrRecordBase {
  public:
    HdrRecordNull(const string& kw, const string& com=""): HdrRecordBase(kw,com) {}
    virtual HdrRecordNull* duplicate() const {return new HdrRecordNull(*this);}
    virtual ValueType valueType() const {return Vnull;}
    virtual bool setValueString(const string& v) {return !v.empty();}
    virtual string getValueString() const {return "";}
  };

  template <class T>
  class HdrRecord: public HdrRecordBase {
    static_assert(std::is_same<typename StoredType<T>::type, T>::value,
		  "HdrRecord holds only bool, int, long, double or string");
  public:
    HdrRecord(const string& kw,
	      const T& v,
	      const string& com="",
	      const string& un=""): HdrRecordBase(kw, com, un), val(v) {}
    virtual HdrRecord* duplicate() const {return new HdrRecord(*this);}

    T& Value() {return val;}
    const T& Value() const {return val;}

    virtual ValueType valueType() const {return ValueTypeOf<T>();}
    virtual bool setValueString(const string& v) {
      std::istringstream iss(v);
      string leftover;
      return !(iss >> val) || (iss >> leftover);
    }
    virtual string getValueString() const {
      std::ostringstream os;
      os << val;
      return os.str();
    }
  private:
    T val;
  };

  // Specializations: T/F for bool, quotes around strings, and a decimal
  // point forced on doubles.
  template <>
  string HdrRecord<bool>::getValueString() const;
  template <>
  bool HdrRecord<bool>::setValueString(const string& v);
  template <>
  string HdrRecord<string>::getValueString() const;
  template <>
  bool HdrRecord<string>::setValueString(const string& v);
  template <>
  string HdrRecord<double>::getValueString() const;

  class Header {
  public:
    typedef std::list<std::unique_ptr<HdrRecordBase> > RecordList;
    typedef RecordList::const_iterator const_iterator;

    Header() {}
    Header(const Header& rhs) {copyFrom(rhs);}
    Header& operator=(const Header& rhs) {
      if (this!=&rhs) copyFrom(rhs);
      return *this;
    }

    void clear() {hlist.clear(); lcomment.clear(); lhistory.clear();}
    // Number of keyword records plus COMMENT and HISTORY entries
    int size() const {return hlist.size() + lcomment.size() + lhistory.size();}
    bool empty() const {return size()==0;}

    const_iterator begin() const {return hlist.begin();}
    const_iterator end() const {return hlist.end();}

    const std::list<string>& comments() const {return lcomment;}
    const std::list<string>& history() const {return lhistory;}
    void addComment(const string& s) {lcomment.push_back(s);}
    void addHistory(const string& s) {lhistory.push_back(s);}

    // Append contents of another header to this one.
    // Duplicate keywords take the value in rhs.
    void operator+=(const Header& rhs);

    // Takes ownership of the record
    void append(HdrRecordBase* record);
    template <class T>
    void append(const string& keyword, const T& value,
		const string& comment="", const string& units="") {
      typedef typename StoredType<T>::type S;
      append(new HdrRecord<S>(keyword, static_cast<S>(value), comment, units));
    }
    // String literals are stored as strings, not as pointers
    void append(const string& keyword, const char* value,
		const string& comment="", const string& units="") {
      append(keyword, string(value), comment, units);
    }
    void appendNull(const string& keyword, const string& comment="") {
      append(new HdrRecordNull(keyword, comment));
    }
    template <class T>
    void replace(const string& keyword, const T& value,
		 const string& comment="", const string& units="") {
      typedef typename StoredType<T>::type S;
      HdrRecordBase* record = new HdrRecord<S>(keyword, static_cast<S>(value),
					       comment, units);
      RecordList::iterator i = locate(keyword);
      if (i==hlist.end())
	hlist.push_back(std::unique_ptr<HdrRecordBase>(record));
      else
	i->reset(record);
    }
    void replace(const string& keyword, const char* value,
		 const string& comment="", const string& units="") {
      replace(keyword, string(value), comment, units);
    }

    bool hasKey(const string& keyword) const;
    // Null if keyword is absent
    const HdrRecordBase* find(const string& keyword) const;
    HdrRecordBase* find(const string& keyword);

    void erase(const string& keyword);

    // Get/set the value of an existing record.  Returns false if
    // keyword doesn't exist or does not match type of argument.
    template <class T>
    bool getValue(const string& keyword, T& outVal) const;
    template <class T>
    bool setValue(const string& keyword, const T& inVal);

  private:
    RecordList hlist;
    std::list<string> lcomment;
    std::list<string> lhistory;
    void copyFrom(const Header& rhs);
    RecordList::iterator locate(const string& keyword);
    RecordList::const_iterator locate(const string& keyword) const;
  };

  std::ostream& operator<<(std::ostream& os, const Header& h);

  template <class T>
  bool
  Header::getValue(const string& keyword, T& outVal) const {
    typedef typename StoredType<T>::type S;
    const HdrRecord<S>* r = dynamic_cast<const HdrRecord<S>*>(find(keyword));
    if (!r) return false;
    outVal = static_cast<T>(r->Value());
    return true;
  }

  template <class T>
  bool
  Header::setValue(const string& keyword, const T& inVal) {
    typedef typename StoredType<T>::type S;
    HdrRecord<S>* r = dynamic_cast<HdrRecord<S>*>(find(keyword));
    if (!r) return false;
    r->Value() = static_cast<S>(inVal);
    return true;
  }

} // namespace astrodata

#endif // ASTRODATA_HEADER_H
