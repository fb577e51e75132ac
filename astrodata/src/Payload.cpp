#include "Payload.h"

using namespace astrodata;

string
astrodata::DataTypeName(DataType t) {
  switch (t) {
  case Tbool: return "bool";
  case Tbyte: return "byte";
  case Tshort: return "short";
  case Tushort: return "ushort";
  case Tint: return "int";
  case Tlong: return "long";
  case Tfloat: return "float";
  case Tdouble: return "double";
  case Tstring: return "string";
  default: return "null";
  }
}

ImageBase::ImageBase(const vector<long>& axes_): naxes(axes_) {
  for (auto n : naxes)
    if (n < 0) throw ValueError("Negative image axis length");
}

long
ImageBase::nPixels() const {
  if (naxes.empty()) return 0;
  long n = 1;
  for (auto a : naxes) n *= a;
  return n;
}

string
ImageBase::describe() const {
  std::ostringstream oss;
  oss << "Image ";
  for (size_t i=0; i<naxes.size(); i++)
    oss << (i>0 ? "x" : "") << naxes[i];
  if (naxes.empty()) oss << "(empty)";
  oss << " " << DataTypeName(pixelType());
  return oss.str();
}

TableData::TableData(const TableData& rhs): Payload(rhs), index(rhs.index), nRows(rhs.nRows) {
  for (auto& c : rhs.columns)
    columns.push_back(std::unique_ptr<ColumnBase>(c->duplicate()));
}

TableData&
TableData::operator=(const TableData& rhs) {
  if (this==&rhs) return *this;
  columns.clear();
  for (auto& c : rhs.columns)
    columns.push_back(std::unique_ptr<ColumnBase>(c->duplicate()));
  index = rhs.index;
  nRows = rhs.nRows;
  return *this;
}

string
TableData::describe() const {
  std::ostringstream oss;
  oss << "Table " << nRows << " rows x " << columns.size() << " columns";
  return oss.str();
}

vector<string>
TableData::columnNames() const {
  vector<string> out;
  for (auto& c : columns) out.push_back(c->getName());
  return out;
}

const ColumnBase&
TableData::column(const string& name) const {
  std::map<string,int>::const_iterator i = index.find(name);
  if (i==index.end()) throw NotFoundError("Table has no column " + name);
  return *columns[i->second];
}

ColumnBase&
TableData::column(const string& name) {
  std::map<string,int>::const_iterator i = index.find(name);
  if (i==index.end()) throw NotFoundError("Table has no column " + name);
  return *columns[i->second];
}

void
TableData::checkRow(const string& name, long row) const {
  if (row < 0 || row >= nRows)
    FormatAndThrow<NotFoundError>() << "Row " << row << " of column " << name
				    << " in table with " << nRows << " rows";
}

void
TableData::eraseColumn(const string& name) {
  std::map<string,int>::iterator i = index.find(name);
  if (i==index.end()) throw NotFoundError("Table has no column " + name);
  int position = i->second;
  columns.erase(columns.begin()+position);
  index.clear();
  for (size_t j=0; j<columns.size(); j++)
    index[columns[j]->getName()] = j;
  if (columns.empty()) nRows = 0;
}

bool
TableData::operator==(const TableData& rhs) const {
  if (nRows != rhs.nRows || columns.size() != rhs.columns.size()) return false;
  for (size_t j=0; j<columns.size(); j++) {
    const ColumnBase& a = *columns[j];
    const ColumnBase& b = *rhs.columns[j];
    if (a.getName()!=b.getName() || a.dataType()!=b.dataType()) return false;
    for (long row=0; row<nRows; row++)
      if (a.cellString(row)!=b.cellString(row)) return false;
  }
  return true;
}

string
RecordData::describe() const {
  std::ostringstream oss;
  oss << "Record " << fields.size() << " fields";
  return oss.str();
}
