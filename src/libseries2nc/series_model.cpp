#include <string>
#include <sstream>
#include <vector>
#include <unordered_set>
#include <series_model.hpp>

using std::endl;
using std::string;
using std::stringstream;
using std::unordered_set;
using std::vector;

namespace series2nc {

string AttributeList::get(string name) const {
  for (const auto& a : list) {
    if (a.name == name) {
      return a.value;
    }
  }
  return "";
}

bool AttributeList::has(string name) const {
  for (const auto& a : list) {
    if (a.name == name) {
      return true;
    }
  }
  return false;
}

void AttributeList::set(string name, string value) {
  for (auto& a : list) {
    if (a.name == name) {
      a.value = value;
      return;
    }
  }
  list.emplace_back(name, value);
}

Axis make_dimension(string name, size_t length) {
  Axis a; // return value
  a.name = name;
  a.length = length;
  return a;
}

Axis make_axis(string name, const AttributeList& atts, const vector<double>&
    values) {
  Axis a; // return value
  a.name = name;
  a.atts = atts;
  a.type = AxisType::numeric;
  a.length = values.size();
  a.values = values;
  return a;
}

Axis make_time_axis(string name, const AttributeList& atts, const vector<
    DateTime>& times) {
  Axis a; // return value
  a.name = name;
  a.atts = atts;
  a.type = AxisType::time;
  a.length = times.size();
  a.times = times;
  return a;
}

RecordIdArray::RecordIdArray(const vector<size_t>& shape_) : shape(shape_),
    ids() {
  size_t n = 1;
  for (const auto& len : shape) {
    n *= len;
  }
  ids.resize(n, -1);
}

bool RecordIdArray::squeeze(size_t axis) {
  if (axis >= shape.size() || shape[axis] != 1) {
    return false;
  }

  // a unit dimension doesn't change the row-major order of the ids
  shape.erase(shape.begin() + axis);
  return true;
}

AxisHandle Dataset::add_axis(const Axis& axis) {
  axes.emplace_back(axis);
  return axes.size() - 1;
}

CoordinateHandle Dataset::add_coordinate(const Variable& coordinate) {
  coordinates.emplace_back(coordinate);
  return coordinates.size() - 1;
}

size_t Dataset::axis_index(const Variable& var, string name) const {
  for (size_t n = 0; n < var.axes.size(); ++n) {
    if (axes[var.axes[n]].name == name) {
      return n;
    }
  }
  return MISSING_FLAG;
}

vector<string> Dataset::dims(const Variable& var) const {
  vector<string> v; // return value
  for (const auto& h : var.axes) {
    v.emplace_back(axes[h].name);
  }
  return v;
}

vector<size_t> Dataset::shape(const Variable& var) const {
  vector<size_t> v; // return value
  for (const auto& h : var.axes) {
    v.emplace_back(axes[h].length);
  }
  return v;
}

bool Dataset::is_consistent(const Variable& var) const {
  if (var.record_id.ndim() > var.axes.size()) {
    return false;
  }
  for (size_t n = 0; n < var.record_id.ndim(); ++n) {
    if (var.record_id.shape[n] != axes[var.axes[n]].length) {
      return false;
    }
  }
  return true;
}

bool Dataset::remove_axis(Variable& var, size_t index) const {
  if (index >= var.axes.size() || axes[var.axes[index]].length != 1) {
    return false;
  }
  if (index < var.record_id.ndim() && !var.record_id.squeeze(index)) {
    return false;
  }
  var.axes.erase(var.axes.begin() + index);
  return true;
}

bool Dataset::replace_axis(Variable& var, size_t index, AxisHandle handle)
    const {
  if (index >= var.axes.size() || handle >= axes.size()) {
    return false;
  }
  if (axes[var.axes[index]].length != axes[handle].length) {
    return false;
  }
  var.axes[index] = handle;
  return true;
}

string Dataset::describe() const {
  stringstream ss;
  unordered_set<AxisHandle> seen;
  vector<const Variable *> vars;
  for (const auto& var : varlist) {
    vars.emplace_back(&var);
    for (const auto& d : var.deps) {
      vars.emplace_back(&coordinates[d]);
    }
  }
  ss << "dimensions:" << endl;
  for (const auto& v : vars) {
    for (const auto& h : v->axes) {
      if (seen.find(h) == seen.end()) {
        ss << "\t" << axes[h].name << " = " << axes[h].length << " ;" << endl;
        seen.emplace(h);
      }
    }
  }
  ss << "variables:" << endl;
  unordered_set<const Variable *> printed;
  for (const auto& v : vars) {
    if (printed.find(v) != printed.end()) {
      continue;
    }
    printed.emplace(v);
    ss << "\t" << v->name << "(";
    for (size_t n = 0; n < v->axes.size(); ++n) {
      if (n > 0) {
        ss << ", ";
      }
      ss << axes[v->axes[n]].name;
    }
    ss << ") ;" << endl;
    for (const auto& a : v->atts.items()) {
      ss << "\t\t" << v->name << ":" << a.name << " = \"" << a.value << "\" ;"
          << endl;
    }
    if (!v->deps.empty()) {
      ss << "\t\t" << v->name << ":coordinates = \"";
      for (size_t n = 0; n < v->deps.size(); ++n) {
        if (n > 0) {
          ss << " ";
        }
        ss << coordinates[v->deps[n]].name;
      }
      ss << "\" ;" << endl;
    }
  }
  return ss.str();
}

vector<string> char_rows(const Variable& coordinate, size_t row_length) {
  vector<string> v; // return value
  if (row_length == 0) {
    return v;
  }
  for (size_t n = 0; n + row_length <= coordinate.chars.size(); n +=
      row_length) {
    string s(&coordinate.chars[n], row_length);
    auto idx = s.find('\0');
    if (idx != string::npos) {
      s = s.substr(0, idx);
    }
    v.emplace_back(s);
  }
  return v;
}

} // end namespace series2nc
