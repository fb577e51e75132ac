// Data payloads carried by extensions: images, tables, and records.
#ifndef ASTRODATA_PAYLOAD_H
#define ASTRODATA_PAYLOAD_H

#include <map>
#include <memory>

#include "Std.h"
#include "Errors.h"
#include "Header.h"

namespace astrodata {

  enum PayloadType {ImagePayload, TablePayload, RecordPayload};

  // Intrinsic types used for pixels and table cells
  enum DataType {Tnull, Tbool, Tbyte, Tshort, Tushort, Tint, Tlong,
		 Tfloat, Tdouble, Tstring};

  template <typename T>
  inline DataType DataTypeOf() {return Tnull;}
  template <>
  inline DataType DataTypeOf<bool>() {return Tbool;}
  template <>
  inline DataType DataTypeOf<unsigned char>() {return Tbyte;}
  template <>
  inline DataType DataTypeOf<short>() {return Tshort;}
  template <>
  inline DataType DataTypeOf<unsigned short>() {return Tushort;}
  template <>
  inline DataType DataTypeOf<int>() {return Tint;}
  template <>
  inline DataType DataTypeOf<long>() {return Tlong;}
  template <>
  inline DataType DataTypeOf<float>() {return Tfloat;}
  template <>
  inline DataType DataTypeOf<double>() {return Tdouble;}
  template <>
  inline DataType DataTypeOf<string>() {return Tstring;}

  string DataTypeName(DataType t);

  // Base class for everything an Extension can hold.  Payloads are shared
  // (by std::shared_ptr) between a container and all of its views; copies
  // are made only through duplicate().
  class Payload {
  public:
    virtual ~Payload() {}
    virtual PayloadType payloadType() const =0;
    virtual Payload* duplicate() const =0;
    // One-line description for listings, e.g. "Image 100x100 float"
    virtual string describe() const =0;
  };

  typedef std::shared_ptr<Payload> PayloadPtr;

  ///////////////////////////////////////////////////////////////
  // Images: axis lengths plus pixels stored with first axis fastest.
  ///////////////////////////////////////////////////////////////
  class ImageBase: public Payload {
  public:
    virtual PayloadType payloadType() const {return ImagePayload;}
    virtual DataType pixelType() const =0;
    const vector<long>& axes() const {return naxes;}
    int dimension() const {return naxes.size();}
    long nPixels() const;
    virtual string describe() const;
  protected:
    ImageBase(const vector<long>& axes_);
    vector<long> naxes;
  };

  template <class T>
  class ImageData: public ImageBase {
  public:
    // Filled with a constant value
    ImageData(const vector<long>& axes_, const T& fill=T()):
      ImageBase(axes_), pixels(nPixels(), fill) {}
    // Two-dimensional convenience
    ImageData(long nx, long ny, const T& fill=T()):
      ImageBase(vector<long>{nx, ny}), pixels(nPixels(), fill) {}
    // Adopt pixel values; size must match the axes
    ImageData(const vector<long>& axes_, const vector<T>& values);

    virtual ImageData* duplicate() const {return new ImageData(*this);}
    virtual DataType pixelType() const {return DataTypeOf<T>();}

    vector<T>& data() {return pixels;}
    const vector<T>& data() const {return pixels;}

    T& operator[](long i) {return pixels[i];}
    const T& operator[](long i) const {return pixels[i];}
    // Range-checked (x,y) access for 2d images; x is the fast axis
    T& operator()(long x, long y) {return pixels[offset(x,y)];}
    const T& operator()(long x, long y) const {return pixels[offset(x,y)];}

  private:
    vector<T> pixels;
    long offset(long x, long y) const;
  };

  ///////////////////////////////////////////////////////////////
  // Tables: named columns of equal length
  ///////////////////////////////////////////////////////////////
  class ColumnBase {
  public:
    ColumnBase(const string& name_): name(name_) {}
    virtual ~ColumnBase() {}
    virtual ColumnBase* duplicate() const =0;
    virtual DataType dataType() const =0;
    virtual long size() const =0;
    virtual void resize(long n) =0;
    virtual string cellString(long row) const =0;
    string getName() const {return name;}
  private:
    string name;
  };

  template <class T>
  class Column: public ColumnBase {
  public:
    Column(const string& name_, const vector<T>& values_=vector<T>()):
      ColumnBase(name_), values(values_) {}
    virtual Column* duplicate() const {return new Column(*this);}
    virtual DataType dataType() const {return DataTypeOf<T>();}
    virtual long size() const {return values.size();}
    virtual void resize(long n) {values.resize(n);}
    virtual string cellString(long row) const {
      std::ostringstream oss;
      oss << values[row];
      return oss.str();
    }
    vector<T>& data() {return values;}
    const vector<T>& data() const {return values;}
  private:
    vector<T> values;
  };

  class TableData: public Payload {
  public:
    TableData(): nRows(0) {}
    TableData(const TableData& rhs);
    TableData& operator=(const TableData& rhs);
    virtual TableData* duplicate() const {return new TableData(*this);}
    virtual PayloadType payloadType() const {return TablePayload;}
    virtual string describe() const;

    long nrows() const {return nRows;}
    int ncols() const {return columns.size();}
    vector<string> columnNames() const;
    bool hasColumn(const string& name) const {return index.count(name)>0;}
    DataType columnType(const string& name) const {return column(name).dataType();}

    // The first column sets the row count; later columns must match it.
    // ConflictError if the name is taken.
    template <class T>
    void addColumn(const vector<T>& values, const string& name);

    // ValueError on a type mismatch, NotFoundError for unknown column or row
    template <class T>
    void readCell(T& value, const string& name, long row) const;
    template <class T>
    void readCells(vector<T>& values, const string& name) const;
    template <class T>
    void writeCell(const T& value, const string& name, long row);

    void eraseColumn(const string& name);

    // Whole-table equality of names, types and cell contents
    bool operator==(const TableData& rhs) const;
    bool operator!=(const TableData& rhs) const {return !(*this==rhs);}

    const ColumnBase& column(const string& name) const;
  private:
    vector<std::unique_ptr<ColumnBase> > columns;
    std::map<string,int> index;
    long nRows;
    ColumnBase& column(const string& name);
    template <class T>
    const Column<T>& typedColumn(const string& name) const;
    void checkRow(const string& name, long row) const;
  };

  ///////////////////////////////////////////////////////////////
  // A record descriptor: keyword/value structure with no pixels or rows
  ///////////////////////////////////////////////////////////////
  class RecordData: public Payload {
  public:
    RecordData() {}
    explicit RecordData(const Header& h): fields(h) {}
    virtual RecordData* duplicate() const {return new RecordData(*this);}
    virtual PayloadType payloadType() const {return RecordPayload;}
    virtual string describe() const;
    Header& record() {return fields;}
    const Header& record() const {return fields;}
  private:
    Header fields;
  };

  ///////////////////////////////////////////////////////////////
  // Template implementations
  ///////////////////////////////////////////////////////////////

  template <class T>
  ImageData<T>::ImageData(const vector<long>& axes_, const vector<T>& values):
    ImageBase(axes_), pixels(values) {
    if (long(pixels.size()) != nPixels())
      FormatAndThrow<ValueError>() << "Image has " << nPixels()
				   << " pixels but " << pixels.size() << " values given";
  }

  template <class T>
  long
  ImageData<T>::offset(long x, long y) const {
    if (naxes.size()!=2)
      throw ValueError("(x,y) pixel access to image that is not 2d");
    if (x<0 || x>=naxes[0] || y<0 || y>=naxes[1])
      FormatAndThrow<NotFoundError>() << "Pixel (" << x << "," << y
				      << ") outside image";
    return y*naxes[0] + x;
  }

  template <class T>
  void
  TableData::addColumn(const vector<T>& values, const string& name) {
    if (name.empty())
      throw ValueError("Table column needs a name");
    if (hasColumn(name))
      throw ConflictError("Table already has column " + name);
    if (!columns.empty() && long(values.size()) != nRows)
      FormatAndThrow<ValueError>() << "Column " << name << " has " << values.size()
				   << " rows, table has " << nRows;
    if (columns.empty()) nRows = values.size();
    index[name] = columns.size();
    columns.push_back(std::unique_ptr<ColumnBase>(new Column<T>(name, values)));
  }

  template <class T>
  const Column<T>&
  TableData::typedColumn(const string& name) const {
    const Column<T>* c = dynamic_cast<const Column<T>*>(&column(name));
    if (!c)
      FormatAndThrow<ValueError>() << "Column " << name << " holds "
				   << DataTypeName(column(name).dataType())
				   << ", not " << DataTypeName(DataTypeOf<T>());
    return *c;
  }

  template <class T>
  void
  TableData::readCell(T& value, const string& name, long row) const {
    checkRow(name, row);
    value = typedColumn<T>(name).data()[row];
  }

  template <class T>
  void
  TableData::readCells(vector<T>& values, const string& name) const {
    values = typedColumn<T>(name).data();
  }

  template <class T>
  void
  TableData::writeCell(const T& value, const string& name, long row) {
    checkRow(name, row);
    const_cast<Column<T>&>(typedColumn<T>(name)).data()[row] = value;
  }

} // namespace astrodata

#endif // ASTRODATA_PAYLOAD_H
