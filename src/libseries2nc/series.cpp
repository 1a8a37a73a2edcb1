#include <iostream>
#include <string>
#include <vector>
#include <algorithm>
#include <series2nc.hpp>
#include <strutils.hpp>

using std::cout;
using std::find;
using std::string;
using std::vector;
using strutils::trimmed;

namespace series2nc {

Series::Series(RecordTable& table_, const RecordStore& store_, const Options&
    options_) : table(table_), store(store_), options(options_), warn_ss() {
  classify_records(table_);
}

vector<string> Series::meta_records() {
  return { "STNS" };
}

vector<string> Series::maybe_meta_records() {
  return { "HH", "SV", "SH" };
}

bool Series::is_meta_record(string nomvar) {
  nomvar = trimmed(nomvar);
  auto m = meta_records();
  if (find(m.begin(), m.end(), nomvar) != m.end()) {
    return true;
  }
  m = maybe_meta_records();
  return find(m.begin(), m.end(), nomvar) != m.end();
}

vector<string> Series::outer_axes(const vector<string>& generic_axes) {
  vector<string> v{ "station_id" }; // return value
  v.insert(v.end(), generic_axes.begin(), generic_axes.end());
  return v;
}

void Series::make_vars(Dataset& dataset) {
  seriesAxes::Handles handles;
  seriesAxes::extract_axes(store, options, dataset, handles);
  remapAxes::remap_station_series(dataset, handles, warn_ss);
  remapAxes::drop_profile_levels(dataset, warn_ss);
  remapAxes::remap_profiles(dataset, handles, options, warn_ss);
  if (options.squash_forecasts) {
    squash_forecasts(dataset, warn_ss);
  }
  bind_station_coordinates(dataset, handles, warn_ss);
  if (verbose_operation) {
    cout << dataset.describe();
  }
}

void Series::flush_warnings(std::ostream& outs) {
  if (!warn_ss.str().empty()) {
    outs << warn_ss.str();
    warn_ss.str("");
  }
}

} // end namespace series2nc
