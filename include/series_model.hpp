#ifndef SERIES_MODEL_H
#define   SERIES_MODEL_H

#include <string>
#include <vector>
#include <deque>
#include <datetime.hpp>

namespace series2nc {

static const size_t MISSING_FLAG = 0xffffffff;

typedef size_t AxisHandle;
typedef size_t CoordinateHandle;

struct Attribute {
  Attribute() : name(), value() { }
  Attribute(std::string name_, std::string value_) : name(name_), value(
      value_) { }

  std::string name, value;
};

class AttributeList {
public:
  AttributeList() : list() { }
  bool empty() const { return list.empty(); }
  std::string get(std::string name) const;
  bool has(std::string name) const;
  const std::vector<Attribute>& items() const { return list; }
  void set(std::string name, std::string value);
  size_t size() const { return list.size(); }

private:
  std::vector<Attribute> list;
};

enum class AxisType { dimension, numeric, time };

// An axis is never modified after it has been added to a Dataset; variables
// share it through its handle
struct Axis {
  Axis() : name(), atts(), type(AxisType::dimension), length(0), values(),
      times() { }

  size_t size() const { return length; }

  std::string name;
  AttributeList atts;
  AxisType type;
  size_t length;
  std::vector<double> values;
  std::vector<DateTime> times;
};

extern Axis make_dimension(std::string name, size_t length);
extern Axis make_axis(std::string name, const AttributeList& atts, const std::
    vector<double>& values);
extern Axis make_time_axis(std::string name, const AttributeList& atts, const
    std::vector<DateTime>& times);

// record indices for the leading ("outer") axes of a variable, row-major;
// negative values flag a missing record
struct RecordIdArray {
  RecordIdArray() : shape(), ids() { }
  RecordIdArray(const std::vector<size_t>& shape_);

  size_t ndim() const { return shape.size(); }
  size_t size() const { return ids.size(); }
  bool squeeze(size_t axis);

  std::vector<size_t> shape;
  std::vector<long long> ids;
};

struct Variable {
  Variable() : name(), atts(), axes(), deps(), record_id(), chars(), values(),
      times() { }

  std::string name;
  AttributeList atts;
  std::vector<AxisHandle> axes;
  std::vector<CoordinateHandle> deps;
  RecordIdArray record_id;

  // payload of coordinate variables; data variables read their values from
  // the records selected by record_id
  std::vector<char> chars;
  std::vector<double> values;
  std::vector<DateTime> times;
};

class Dataset {
public:
  Dataset() : varlist(), axes(), coordinates() { }
  AxisHandle add_axis(const Axis& axis);
  CoordinateHandle add_coordinate(const Variable& coordinate);
  const Axis& axis(AxisHandle handle) const { return axes[handle]; }
  size_t axis_index(const Variable& var, std::string name) const;
  const Variable& coordinate(CoordinateHandle handle) const {
    return coordinates[handle];
  }
  std::string describe() const;
  std::vector<std::string> dims(const Variable& var) const;
  bool is_consistent(const Variable& var) const;
  size_t num_axes() const { return axes.size(); }
  size_t num_coordinates() const { return coordinates.size(); }
  bool remove_axis(Variable& var, size_t index) const;
  bool replace_axis(Variable& var, size_t index, AxisHandle handle) const;
  std::vector<size_t> shape(const Variable& var) const;

  std::vector<Variable> varlist;

private:
  std::deque<Axis> axes;
  std::deque<Variable> coordinates;
};

extern std::vector<std::string> char_rows(const Variable& coordinate, size_t
    row_length);

} // end namespace series2nc

#endif
