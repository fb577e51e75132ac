#include "DataProvider.h"

using namespace astrodata;

void
MemoryProvider::add(const Header& h, PayloadPtr data) {
  if (!data) throw ValueError("MemoryProvider record with no data");
  records.push_back(std::make_pair(h, data));
}

int
MemoryProvider::checked(int record) const {
  if (record < 0 || record >= size())
    FormatAndThrow<NotFoundError>() << "Record " << record << " of " << size()
				    << " in " << source();
  return record;
}
