#include "AstroData.h"
#include <algorithm>
#include <iomanip>

using namespace astrodata;

int
astrodata::HeaderVersion(const Header& h) {
  int v;
  if (h.getValue(EXTVER_KEY, v)) return v;
  long lv;
  if (h.getValue(EXTVER_KEY, lv)) return static_cast<int>(lv);
  return NO_VERSION;
}

AstroData::AstroData(const AstroDataConfig& config): primary(new Header),
						      cfg(config),
						      singleView(false) {}

AstroData::AstroData(const Header& phu, const AstroDataConfig& config):
  primary(new Header(phu)),
  cfg(config),
  singleView(false) {}

AstroData::AstroData(const DataProvider& provider, const AstroDataConfig& config):
  primary(new Header(provider.primaryHeader())),
  cfg(config),
  singleView(false),
  source(provider.source()) {
  // Attachments are placed after all top-level extensions exist
  vector<int> attachments;
  for (int i=0; i<provider.size(); i++) {
    Header h = provider.header(i);
    if (h.hasKey(PARENT_KEY)) {
      attachments.push_back(i);
      continue;
    }
    PayloadPtr d = provider.data(i);
    string extname;
    if (!h.getValue(EXTNAME_KEY, extname) || extname.empty()) {
      if (d->payloadType()!=ImagePayload)
	FormatAndThrow<ValueError>() << "Record " << i << " of " << source
				     << " has no EXTNAME";
      extname = cfg.rules.scienceName();
    }
    bool versioned = cfg.rules.isVersioned(extname);
    int v = VersionPolicy::assign(index, extname, versioned,
				  versioned ? HeaderVersion(h) : NO_VERSION,
				  false);
    index.insert(ExtensionPtr(new Extension(extname, v, h, d)));
  }

  for (auto i : attachments) {
    Header h = provider.header(i);
    string parent;
    string attachName;
    if (!h.getValue(PARENT_KEY, parent) || !h.getValue(EXTNAME_KEY, attachName))
      FormatAndThrow<ValueError>() << "Attachment record " << i << " of " << source
				   << " needs string " << PARENT_KEY << " and " << EXTNAME_KEY;
    ExtensionPtr target = index.lookup(parent, HeaderVersion(h));
    attachTo(target, provider.data(i), attachName, NO_VERSION);
  }
  dbg << "Loaded " << size() << " extensions from " << source << endl;
}

AstroData
AstroData::makeView(bool single) const {
  AstroData view(cfg);
  view.primary = primary;
  view.singleView = single;
  view.source = source;
  return view;
}

int
AstroData::normalize(int position) const {
  int p = position < 0 ? position + size() : position;
  if (p < 0 || p >= size())
    FormatAndThrow<NotFoundError>() << "Extension position " << position
				    << " in container of " << size();
  return p;
}

AstroData
AstroData::operator[](int position) const {
  AstroData view = makeView(true);
  view.index.insert(index.at(normalize(position)));
  return view;
}

AstroData
AstroData::operator()(const string& name, int version) const {
  AstroData view = makeView(true);
  view.index.insert(index.lookup(name, version));
  return view;
}

AstroData
AstroData::select(const string& name) const {
  AstroData view = makeView(false);
  for (auto& e : index.lookup(name))
    view.index.insert(e);
  return view;
}

AstroData
AstroData::slice(int start, int stop, int step) const {
  if (step <= 0)
    FormatAndThrow<ValueError>() << "Slice step " << step << " must be positive";
  int n = size();
  if (start < 0) start = std::max(0, start+n);
  if (stop < 0) stop = std::max(0, stop+n);
  stop = std::min(stop, n);
  AstroData view = makeView(false);
  for (int i=start; i<stop; i+=step)
    view.index.insert(index.at(i));
  return view;
}

AstroData
AstroData::deepCopy() const {
  AstroData out(*primary, cfg);
  out.source = source;
  out.singleView = singleView;
  for (auto& e : index) {
    ExtensionPtr copy(new Extension(*e));
    copy->setData(PayloadPtr(e->data()->duplicate()));
    if (e->mask()) copy->setMask(PayloadPtr(e->mask()->duplicate()));
    if (e->variance()) copy->setVariance(PayloadPtr(e->variance()->duplicate()));
    for (auto& a : e->attachmentNames())
      copy->attach(a, PayloadPtr(e->attachment(a)->duplicate()));
    out.index.insert(copy);
  }
  return out;
}

ExtensionPtr
AstroData::extension(int position) const {
  return index.at(normalize(position));
}

ExtensionPtr
AstroData::extension(const string& name, int version) const {
  return index.lookup(name, version);
}

bool
AstroData::hasExtension(const string& name, int version) const {
  return index.has(name, version);
}

ExtensionPtr
AstroData::single() const {
  if (!singleView)
    FormatAndThrow<ValueError>() << "Container of " << size()
				 << " extensions is not a single-extension view";
  return index.at(0);
}

ExtensionPtr
AstroData::append(PayloadPtr data, const string& name, int version, bool autoNumber) {
  if (!data) throw ValueError("append() of null data");
  if (singleView) return attachTo(single(), data, name, version);
  if (name.empty())
    throw ValueError("A name is required to append a bare " + data->describe()
		     + " at the top level");
  if (cfg.rules.isAttachmentName(name))
    throw ValueError(name + " data must be appended to a single extension,"
		     " not at the top level");
  return addExtension(Header(), data, name, version, NO_VERSION, autoNumber);
}

ExtensionPtr
AstroData::append(const Header& h, PayloadPtr data, const string& name,
		  int version, bool autoNumber) {
  if (!data) throw ValueError("append() of null data");
  string extname = name;
  if (extname.empty() && !h.getValue(EXTNAME_KEY, extname))
    throw ValueError("Appended header has no " + EXTNAME_KEY + " and no name was given");
  if (singleView) return attachTo(single(), data, extname, version);
  return addExtension(h, data, extname, version, HeaderVersion(h), autoNumber);
}

ExtensionPtr
AstroData::addExtension(const Header& h, PayloadPtr data, const string& name,
			int version, int headerVersion, bool autoNumber) {
  bool versioned = cfg.rules.isVersioned(name);
  if (!versioned && data->payloadType()==ImagePayload)
    throw ValueError("Image extension " + name + " at the top level needs a versioned name");
  // A version carried in the header counts only when not auto-numbering
  int requested = version;
  if (requested==NO_VERSION && versioned && !autoNumber)
    requested = headerVersion;
  int v = VersionPolicy::assign(index, name, versioned, requested, autoNumber);
  ExtensionPtr e(new Extension(name, v, h, data));
  index.insert(e);
  dbg << "Appended " << e->key() << " as extension " << size()-1 << endl;
  return e;
}

ExtensionPtr
AstroData::attachTo(ExtensionPtr target, PayloadPtr data,
		    const string& name, int version) {
  if (name.empty())
    throw ValueError("A name is required to attach data to extension "
		     + target->getName());
  if (version != NO_VERSION)
    throw ValueError("Data attached to an extension takes no version");
  if (cfg.rules.isRootOnly(name))
    throw ValueError(name + " can only be appended at the top level");
  if (name==cfg.rules.maskName())
    target->setMask(data);
  else if (name==cfg.rules.varianceName())
    target->setVariance(data);
  else
    target->attach(name, data);
  xdbg << "Attached " << name << " to " << target->key() << endl;
  return target;
}

void
AstroData::append(const AstroData& other, bool autoNumber) {
  if (singleView)
    throw ValueError("Cannot merge a container into a single-extension view");
  vector<VersionPolicy::Request> incoming;
  for (auto& e : other.index)
    incoming.push_back(VersionPolicy::Request(e->getName(), e->getVersion(),
					      cfg.rules.isVersioned(e->getName())));
  vector<int> versions = VersionPolicy::assignMerge(index, incoming, autoNumber);

  // Build the result on a copy so a conflict leaves this container untouched
  ExtensionIndex trial(index);
  int i = 0;
  for (auto& e : other.index) {
    ExtensionPtr copy(new Extension(*e));
    copy->setVersion(versions[i++]);
    trial.insert(copy);
  }
  index.swap(trial);
  dbg << "Merged " << other.size() << " extensions, now " << size() << endl;
}

void
AstroData::remove(int position) {
  index.remove(normalize(position));
}

void
AstroData::remove(const string& name, int version) {
  index.remove(name, version);
}

void
AstroData::remove(const string& name) {
  if (!index.hasName(name)) throw NotFoundError("No extension named " + name);
  for (int i=size()-1; i>=0; i--)
    if (index.at(i)->getName()==name) index.remove(i);
}

vector<string>
AstroData::tableNames() const {
  vector<string> out;
  for (auto& e : index)
    if (e->data()->payloadType()==TablePayload) out.push_back(e->getName());
  return out;
}

void
AstroData::info(ostream& os) const {
  os << "AstroData";
  if (!source.empty()) os << " from " << source;
  if (singleView) os << " (single extension)";
  os << endl;
  os << "PHU: " << primary->size() << " header entries" << endl;
  os << "Index  Name       Ver  Content" << endl;
  int i = 0;
  for (auto& e : index) {
    os << std::right << std::setw(5) << i++ << "  "
       << std::left << std::setw(9) << e->getName() << "  ";
    if (e->isVersioned()) os << std::right << std::setw(3) << e->getVersion();
    else os << "  -";
    os << "  " << e->data()->describe();
    if (e->mask()) os << "  +mask";
    if (e->variance()) os << "  +variance";
    for (auto& a : e->attachmentNames()) os << "  +" << a;
    os << endl;
  }
  os << std::right;
}

std::ostream&
astrodata::operator<<(std::ostream& os, const AstroData& ad) {
  ad.info(os);
  return os;
}

template <class T>
bool
AstroData::findKeyword(const string& keyword, T& value) const {
  if (primary->getValue(keyword, value)) return true;
  for (auto& e : index)
    if (e->header().getValue(keyword, value)) return true;
  return false;
}

bool
AstroData::getDescriptor(Descriptor d, string& value) const {
  return findKeyword(cfg.descriptors.keyword(d), value);
}

bool
AstroData::getDescriptor(Descriptor d, double& value) const {
  string keyword = cfg.descriptors.keyword(d);
  if (findKeyword(keyword, value)) return true;
  int i;
  if (findKeyword(keyword, i)) {
    value = i;
    return true;
  }
  long l;
  if (findKeyword(keyword, l)) {
    value = l;
    return true;
  }
  return false;
}

bool
AstroData::getDescriptor(Descriptor d, int& value) const {
  string keyword = cfg.descriptors.keyword(d);
  if (findKeyword(keyword, value)) return true;
  long l;
  if (findKeyword(keyword, l)) {
    value = static_cast<int>(l);
    return true;
  }
  return false;
}

string
AstroData::stringDescriptor(Descriptor d) const {
  string value;
  if (!getDescriptor(d, value))
    throw NotFoundError("Descriptor " + DescriptorName(d) + " (keyword "
			+ cfg.descriptors.keyword(d) + ")");
  return value;
}

double
AstroData::doubleDescriptor(Descriptor d) const {
  double value;
  if (!getDescriptor(d, value))
    throw NotFoundError("Descriptor " + DescriptorName(d) + " (keyword "
			+ cfg.descriptors.keyword(d) + ")");
  return value;
}
