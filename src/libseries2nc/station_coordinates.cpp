#include <string>
#include <sstream>
#include <vector>
#include <cmath>
#include <series2nc.hpp>
#include <strutils.hpp>
#include <utils.hpp>

using miscutils::this_function_label;
using std::endl;
using std::string;
using std::stringstream;
using std::vector;
using strutils::ftos;

namespace series2nc {

struct StationGroup {
  StationGroup() : axis(MISSING_FLAG), var_indexes() { }

  AxisHandle axis;
  vector<size_t> var_indexes;
};

CoordinateHandle station_subset(Dataset& dataset, const seriesAxes::Handles&
    handles, AxisHandle station_id, stringstream& warn_ss) {
  static const string F = this_function_label(__func__);
  const auto& ids = dataset.axis(station_id).values;
  const auto& station = dataset.coordinate(handles.station);
  auto nstations = dataset.axis(handles.station_id).size();
  auto slen = dataset.axis(handles.station_strlen).size();
  Variable subset;
  subset.name = "station";
  subset.axes.emplace_back(dataset.add_axis(make_axis("station_id",
      AttributeList(), ids)));
  subset.axes.emplace_back(handles.station_strlen);
  subset.chars.resize(ids.size() * slen, '\0');
  for (size_t n = 0; n < ids.size(); ++n) {

    // station ids start at 1
    auto id = llround(ids[n]);
    if (id < 1 || static_cast<size_t>(id) > nstations) {
      warn_ss << F << ": station id " << ftos(ids[n]) << " is outside of the "
          "list of " << nstations << " station names" << endl;
      continue;
    }
    for (size_t m = 0; m < slen; ++m) {
      subset.chars[n * slen + m] = station.chars[(id - 1) * slen + m];
    }
  }
  return dataset.add_coordinate(subset);
}

void bind_station_coordinates(Dataset& dataset, const seriesAxes::Handles&
    handles, stringstream& warn_ss) {
  static const string F = this_function_label(__func__);
  if (!handles.has_station()) {
    return;
  }
  vector<StationGroup> groups;
  for (size_t n = 0; n < dataset.varlist.size(); ++n) {
    auto s = dataset.axis_index(dataset.varlist[n], "station_id");
    if (s == MISSING_FLAG) {
      continue;
    }
    auto h = dataset.varlist[n].axes[s];
    auto g = groups.begin();
    for (; g != groups.end() && g->axis != h; ++g) { }
    if (g == groups.end()) {
      groups.emplace_back();
      groups.back().axis = h;
      g = groups.end() - 1;
    }
    g->var_indexes.emplace_back(n);
  }
  auto nstations = dataset.axis(handles.station_id).size();
  for (const auto& g : groups) {
    CoordinateHandle coord;
    if (dataset.axis(g.axis).size() == nstations) {

      // a full population uses the station names as they are
      for (const auto& n : g.var_indexes) {
        auto& var = dataset.varlist[n];
        if (!dataset.replace_axis(var, dataset.axis_index(var, "station_id"),
            handles.station_id)) {
          warn_ss << F << ": unable to attach the station axis to '" << var.
              name << "'" << endl;
        }
      }
      coord = handles.station;
    } else if (dataset.axis(g.axis).type == AxisType::numeric) {
      coord = station_subset(dataset, handles, g.axis, warn_ss);
    } else {
      warn_ss << F << ": no station ids available to select " << dataset.axis(
          g.axis).size() << " of " << nstations << " station names" << endl;
      continue;
    }
    for (const auto& n : g.var_indexes) {
      dataset.varlist[n].deps.emplace_back(coord);
    }
  }
}

} // end namespace series2nc
