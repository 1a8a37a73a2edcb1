#include <iostream>
#include <string>
#include <vector>
#include <cmath>
#include <series2nc.hpp>
#include <strutils.hpp>
#include <utils.hpp>

using miscutils::this_function_label;
using std::cout;
using std::endl;
using std::string;
using std::vector;
using strutils::itos;
using strutils::trimmed;

namespace series2nc {

namespace seriesAxes {

// names are padded with blanks or NULs
static const string WHITESPACE(" \t\n\r\f\v\0", 7);

bool decode_station_names(const Record& record, vector<string>& names) {
  names.clear();
  auto slen = record.header.ni;
  auto nstations = record.header.nj * record.header.nk;
  if (slen == 0 || nstations == 0 || record.data.size() != slen *
      nstations) {
    return false;
  }

  // some files store the characters with 128 added; this can only be
  // detected from the first byte
  auto offset = (record.data.front() >= 128.) ? 128 : 0;
  for (size_t n = 0; n < nstations; ++n) {
    string s;
    for (size_t m = 0; m < slen; ++m) {
      auto c = lround(record.data[n * slen + m]) - offset;
      s.push_back(static_cast<char>(c));
    }
    auto idx = s.find_last_not_of(WHITESPACE);
    if (idx == string::npos) {
      s.clear();
    } else {
      s.erase(idx + 1);
    }
    names.emplace_back(s);
  }
  return true;
}

void forecast_hours(const Record& record, vector<double>& hours) {

  // HH holds the hour of validity; the lead time is relative to the hour of
  // the date of origin
  auto starting_hour = record.header.dateo.time() / 10000;
  hours.clear();
  for (const auto& val : record.data) {
    hours.emplace_back(val - starting_hour);
  }
}

bool vertical_levels(const Record& record, bool missing_bottom_level,
    vector<double>& levels) {
  levels.clear();
  size_t ndim = 0;
  for (const auto& len : { record.header.ni, record.header.nj, record.header.
      nk }) {
    if (len > 1) {
      ++ndim;
    }
  }
  if (ndim != 1) {
    return false;
  }
  levels = record.data;
  if (missing_bottom_level && !levels.empty()) {
    levels.pop_back();
  }
  return true;
}

AttributeList header_attributes(const RecordHeader& header) {
  AttributeList atts; // return value
  atts.set("nomvar", trimmed(header.nomvar));
  atts.set("typvar", trimmed(header.typvar));
  atts.set("etiket", trimmed(header.etiket));
  atts.set("ip1", itos(header.ip1));
  atts.set("ip2", itos(header.ip2));
  atts.set("ip3", itos(header.ip3));
  return atts;
}

void extract_axes(const RecordStore& store, const Options& options, Dataset&
    dataset, Handles& handles) {
  static const string F = this_function_label(__func__);
  handles = Handles();
  Record r;
  vector<string> names;
  if (store.find("STNS", r) && decode_station_names(r, names)) {
    auto slen = r.header.ni;
    handles.station_id = dataset.add_axis(make_dimension("station_id", names.
        size()));
    handles.station_strlen = dataset.add_axis(make_dimension("station_strlen",
        slen));
    Variable station;
    station.name = "station";
    station.axes = { handles.station_id, handles.station_strlen };
    station.chars.resize(names.size() * slen, '\0');
    for (size_t n = 0; n < names.size(); ++n) {
      names[n].copy(&station.chars[n * slen], names[n].length());
    }
    handles.station = dataset.add_coordinate(station);
  }
  if (store.find("HH", r)) {
    vector<double> hours;
    forecast_hours(r, hours);
    AttributeList atts;
    atts.set("units", "hours");
    handles.forecast = dataset.add_axis(make_axis("forecast", atts, hours));
  }
  for (const auto& vertvar : { "SH", "SV" }) {
    if (!store.find(vertvar, r)) {
      continue;
    }
    vector<double> levels;
    if (!vertical_levels(r, options.missing_bottom_profile_level, levels)) {
      continue;
    }
    auto h = dataset.add_axis(make_axis("level", header_attributes(r.header),
        levels));
    if (string(vertvar) == "SH") {
      handles.thermo = h;
    } else {
      handles.momentum = h;
    }
  }
  if (verbose_operation) {
    cout << F << ": station names " << (handles.has_station() ? "found" :
        "not found") << "; forecast axis " << (handles.forecast !=
        MISSING_FLAG ? "found" : "not found") << endl;
  }
}

} // end namespace series2nc::seriesAxes

} // end namespace series2nc
