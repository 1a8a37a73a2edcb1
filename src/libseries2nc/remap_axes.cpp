#include <string>
#include <sstream>
#include <vector>
#include <unordered_map>
#include <algorithm>
#include <series2nc.hpp>
#include <strutils.hpp>
#include <utils.hpp>

using miscutils::this_function_label;
using std::endl;
using std::find;
using std::string;
using std::stringstream;
using std::unordered_map;
using std::vector;
using strutils::itos;

namespace series2nc {

namespace remapAxes {

bool in_list(const vector<string>& list, string name) {
  return find(list.begin(), list.end(), name) != list.end();
}

void remap_station_series(Dataset& dataset, const seriesAxes::Handles&
    handles, stringstream& warn_ss) {
  static const string F = this_function_label(__func__);
  if (!handles.has_station()) {
    return;
  }
  auto nstations = dataset.axis(handles.station_id).size();
  for (auto& var : dataset.varlist) {
    if (series_kind(var) != SeriesKind::series_y) {
      continue;
    }

    // for Y grids, i already enumerates the stations
    auto i = dataset.axis_index(var, "i");
    if (i != MISSING_FLAG && dataset.axis(var.axes[i]).size() == nstations &&
        !dataset.replace_axis(var, i, handles.station_id)) {
      warn_ss << F << ": unable to attach the station axis to '" << var.name <<
          "'" << endl;
    }
  }
}

void drop_profile_levels(Dataset& dataset, stringstream& warn_ss) {
  static const string F = this_function_label(__func__);
  for (auto& var : dataset.varlist) {
    if (series_kind(var) != SeriesKind::profile) {
      continue;
    }

    // the level axis of profile data comes from ip1, which is zeroed for
    // series records
    auto l = dataset.axis_index(var, "level");
    if (l != MISSING_FLAG && !dataset.remove_axis(var, l)) {
      warn_ss << F << ": unable to drop the level axis of '" << var.name <<
          "' (length " << dataset.axis(var.axes[l]).size() << ")" << endl;
    }
  }
}

void remap_profiles(Dataset& dataset, const seriesAxes::Handles& handles,
    const Options& options, stringstream& warn_ss) {
  static const string F = this_function_label(__func__);

  // generic level dimensions, shared by every variable with the same number
  // of unidentified levels
  unordered_map<size_t, AxisHandle> known_levels;
  for (auto& var : dataset.varlist) {
    if (series_kind(var) != SeriesKind::profile) {
      continue;
    }

    // nj is the forecast time
    auto j = dataset.axis_index(var, "j");
    if (j != MISSING_FLAG && handles.forecast != MISSING_FLAG && dataset.axis(
        var.axes[j]).size() == dataset.axis(handles.forecast).size() &&
        !dataset.replace_axis(var, j, handles.forecast)) {
      warn_ss << F << ": unable to attach the forecast axis to '" << var.name <<
          "'" << endl;
    }

    // ni is the vertical level
    auto i = dataset.axis_index(var, "i");
    if (i == MISSING_FLAG) {
      continue;
    }
    auto nlev = dataset.axis(var.axes[i]).size();
    if (nlev == 1) {
      if (!dataset.remove_axis(var, i)) {
        warn_ss << F << ": unable to drop the degenerate level axis of '" <<
            var.name << "'" << endl;
      }
      continue;
    }
    auto level = MISSING_FLAG;
    if (handles.momentum != MISSING_FLAG && in_list(options.momentum_vars,
        var.name)) {
      if (nlev == dataset.axis(handles.momentum).size()) {
        level = handles.momentum;
      } else {
        warn_ss << F << ": Wrong number of momentum levels found in the data "
            "for '" << var.name << "' (" << nlev << " instead of " << dataset.
            axis(handles.momentum).size() << ")" << endl;
      }
    }
    if (handles.thermo != MISSING_FLAG && in_list(options.thermo_vars, var.
        name)) {
      if (nlev == dataset.axis(handles.thermo).size()) {
        level = handles.thermo;
      } else {
        warn_ss << F << ": Wrong number of thermodynamic levels found in the "
            "data for '" << var.name << "' (" << nlev << " instead of " <<
            dataset.axis(handles.thermo).size() << ")" << endl;
      }
    }
    if (level == MISSING_FLAG) {
      warn_ss << F << ": Unable to find the vertical coordinates for " << var.
          name << "." << endl;
      if (known_levels.find(nlev) == known_levels.end()) {
        known_levels.emplace(nlev, dataset.add_axis(make_dimension("level",
            nlev)));
      }
      level = known_levels[nlev];
    } else {

      // lets the vertical coordinate metadata be filled in downstream
      var.atts.set("kind", itos(5));
    }
    if (!dataset.replace_axis(var, i, level)) {
      warn_ss << F << ": unable to attach the level axis to '" << var.name <<
          "'" << endl;
    }
  }
}

} // end namespace series2nc::remapAxes

} // end namespace series2nc
