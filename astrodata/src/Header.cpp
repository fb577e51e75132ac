// Keyword records and the Header that holds them.

#include "Header.h"
#include "StringStuff.h"
#include <cctype>
#include <iomanip>

using namespace astrodata;

string
astrodata::KeyFormat(const string& input) {
  string output;
  size_t i=0;
  while (i<input.size() && std::isspace(input[i])) i++;
  // Convert to upper case, stop at whitespace
  while (i<input.size() && !std::isspace(input[i]))
    output += std::toupper(input[i++]);
  return output;
}

string
HdrRecordBase::writeCard() const {
  string vv=getValueString();
  string card= (keyword.size() <=8) ? keyword : "HIERARCH " + keyword;
  if (card.size() < 8) card.append(8-card.size(), ' ');
  if (!vv.empty()) {
    card += "= ";
    if (vv.size() < 20) card.append(20-vv.size(), ' ');
    card += vv;
    if (!comment.empty() || !units.empty())
      card += " /";
  }
  card += " ";
  if (!units.empty()) card+= "[" + units + "] ";
  card += comment;
  return card;
}

namespace astrodata {

  template <>
  string
  HdrRecord<bool>::getValueString() const {
    return val ? "T" : "F";
  }

  template <>
  bool
  HdrRecord<bool>::setValueString(const string& v) {
    std::istringstream iss(v);
    string s;
    string leftover;
    // Should be only one word, T or F:
    if (!(iss >> s) || (iss >> leftover)) return true;
    if (s=="T" || s=="t" || s=="true") val=true;
    else if (s=="F" || s=="f" || s=="false") val=false;
    else return true;
    return false;
  }

  template <>
  string
  HdrRecord<string>::getValueString() const {
    return "'" + val + "'";
  }

  // Whole string is the value, with enclosing quotes removed if present
  template <>
  bool
  HdrRecord<string>::setValueString(const string& v) {
    string s(v);
    stringstuff::stripWhite(s);
    if (s.size()>=2 && s[0]=='\'' && s[s.size()-1]=='\'')
      s = s.substr(1, s.size()-2);
    val = s;
    return false;
  }

  template <>
  string
  HdrRecord<double>::getValueString() const {
    std::ostringstream oss;
    oss << std::uppercase << std::showpoint << std::setprecision(12) << val;
    // Remove the trailing zeroes that showpoint leaves on the mantissa
    string work=oss.str();
    size_t eSpot = work.find('E');
    bool hasExp = (eSpot != string::npos);
    size_t last = (hasExp ? eSpot : work.size()) - 1;
    while (last>0 && work[last]=='0' && work[last-1]!='.') last--;
    string out = work.substr(0,last+1);
    if (hasExp) out += work.substr(eSpot);
    return out;
  }

  std::ostream&
  operator<<(std::ostream& os, const Header& h) {
    for (Header::const_iterator i=h.begin(); i!=h.end(); ++i)
      os << (*i)->writeCard() << endl;
    for (auto& s : h.comments())
      os << "COMMENT " << s << endl;
    for (auto& s : h.history())
      os << "HISTORY " << s << endl;
    os << "END" << endl;
    return os;
  }

} // namespace astrodata

void
Header::copyFrom(const Header& rhs) {
  hlist.clear();
  for (const_iterator i=rhs.hlist.begin(); i!=rhs.hlist.end(); ++i)
    hlist.push_back(std::unique_ptr<HdrRecordBase>((*i)->duplicate()));
  lcomment = rhs.lcomment;
  lhistory = rhs.lhistory;
}

Header::RecordList::iterator
Header::locate(const string& keyword) {
  string key = KeyFormat(keyword);
  RecordList::iterator i=hlist.begin();
  for ( ; i!=hlist.end(); ++i)
    if ((*i)->getKeyword()==key) break;
  return i;
}

Header::RecordList::const_iterator
Header::locate(const string& keyword) const {
  string key = KeyFormat(keyword);
  RecordList::const_iterator i=hlist.begin();
  for ( ; i!=hlist.end(); ++i)
    if ((*i)->getKeyword()==key) break;
  return i;
}

void
Header::append(HdrRecordBase* record) {
  if (!record) throw HeaderError("append() of null record");
  hlist.push_back(std::unique_ptr<HdrRecordBase>(record));
}

void
Header::operator+=(const Header& rhs) {
  if (this==&rhs) return;
  for (const_iterator i=rhs.hlist.begin(); i!=rhs.hlist.end(); ++i) {
    RecordList::iterator mine = locate((*i)->getKeyword());
    if (mine!=hlist.end()) hlist.erase(mine);
    hlist.push_back(std::unique_ptr<HdrRecordBase>((*i)->duplicate()));
  }
  lcomment.insert(lcomment.end(), rhs.lcomment.begin(), rhs.lcomment.end());
  lhistory.insert(lhistory.end(), rhs.lhistory.begin(), rhs.lhistory.end());
}

bool
Header::hasKey(const string& keyword) const {
  return locate(keyword)!=hlist.end();
}

const HdrRecordBase*
Header::find(const string& keyword) const {
  const_iterator i = locate(keyword);
  return i==hlist.end() ? 0 : i->get();
}

HdrRecordBase*
Header::find(const string& keyword) {
  RecordList::iterator i = locate(keyword);
  return i==hlist.end() ? 0 : i->get();
}

void
Header::erase(const string& keyword) {
  RecordList::iterator i = locate(keyword);
  if (i==hlist.end())
    throw HeaderError("Cannot find record with keyword " + keyword);
  hlist.erase(i);
}
