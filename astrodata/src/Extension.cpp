#include "Extension.h"

using namespace astrodata;

const string astrodata::EXTNAME_KEY = "EXTNAME";
const string astrodata::EXTVER_KEY = "EXTVER";
const string astrodata::PARENT_KEY = "ADPARENT";

std::ostream&
astrodata::operator<<(std::ostream& os, const ExtensionKey& k) {
  os << "(" << k.name << ", ";
  if (k.version==NO_VERSION) os << "no version";
  else os << k.version;
  os << ")";
  return os;
}

Extension::Extension(const string& name_, int version_, const Header& h,
		     PayloadPtr data): name(name_),
				       version(version_),
				       hdr(h),
				       payload(data) {
  if (name.empty())
    throw ValueError("Extension must have a name");
  if (version < 0)
    FormatAndThrow<ValueError>() << "Version " << version << " of extension " << name
				 << " is not a positive integer";
  if (!payload)
    throw ValueError("Extension " + name + " has no data");
  syncHeader();
}

void
Extension::syncHeader() {
  hdr.replace(EXTNAME_KEY, name);
  if (version==NO_VERSION) {
    if (hdr.hasKey(EXTVER_KEY)) hdr.erase(EXTVER_KEY);
  } else {
    hdr.replace(EXTVER_KEY, version);
  }
}

void
Extension::setName(const string& name_) {
  if (name_.empty()) throw ValueError("Extension must have a name");
  name = name_;
  syncHeader();
}

void
Extension::setVersion(int version_) {
  if (version_ < 0)
    FormatAndThrow<ValueError>() << "Version " << version_ << " of extension " << name
				 << " is not a positive integer";
  version = version_;
  syncHeader();
}

void
Extension::setData(PayloadPtr data) {
  if (!data) throw ValueError("Extension " + name + " cannot have null data");
  payload = data;
}

void
Extension::attach(const string& attachName, PayloadPtr p) {
  if (attachName.empty()) throw ValueError("Attachment needs a name");
  if (!p) throw ValueError("Attachment " + attachName + " has no data");
  for (auto& a : attached)
    if (a.first==attachName) {
      a.second = p;
      return;
    }
  attached.push_back(std::make_pair(attachName, p));
}

bool
Extension::hasAttachment(const string& attachName) const {
  for (auto& a : attached)
    if (a.first==attachName) return true;
  return false;
}

PayloadPtr
Extension::attachment(const string& attachName) const {
  for (auto& a : attached)
    if (a.first==attachName) return a.second;
  throw NotFoundError("Extension " + name + " has no attachment " + attachName);
}

void
Extension::detach(const string& attachName) {
  for (auto i=attached.begin(); i!=attached.end(); ++i)
    if (i->first==attachName) {
      attached.erase(i);
      return;
    }
  throw NotFoundError("Extension " + name + " has no attachment " + attachName);
}

vector<string>
Extension::attachmentNames() const {
  vector<string> out;
  for (auto& a : attached) out.push_back(a.first);
  return out;
}

string
Extension::describe() const {
  std::ostringstream oss;
  oss << name << " ";
  if (isVersioned()) oss << version;
  else oss << "-";
  oss << "  " << payload->describe();
  if (maskData) oss << "  +mask";
  if (varData) oss << "  +variance";
  for (auto& a : attached) oss << "  +" << a.first;
  return oss.str();
}
