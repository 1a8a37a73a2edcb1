#include <string>
#include <sstream>
#include <vector>
#include <map>
#include <cmath>
#include <series2nc.hpp>
#include <utils.hpp>

using miscutils::this_function_label;
using std::endl;
using std::make_pair;
using std::map;
using std::pair;
using std::string;
using std::stringstream;
using std::vector;

namespace series2nc {

struct SquashedForecast {
  SquashedForecast() : time(MISSING_FLAG), leadtime(MISSING_FLAG), reftime(
      MISSING_FLAG) { }

  AxisHandle time;
  CoordinateHandle leadtime, reftime;
};

SquashedForecast squashed_forecast(Dataset& dataset, AxisHandle time,
    AxisHandle forecast) {
  SquashedForecast sf; // return value
  auto time0 = dataset.axis(time).times.front();
  const auto& hours = dataset.axis(forecast).values;
  vector<DateTime> validity;
  for (const auto& h : hours) {
    validity.emplace_back(time0.seconds_added(llround(h * 3600.)));
  }
  AttributeList atts;
  atts.set("standard_name", "time");
  atts.set("long_name", "Validity time");
  atts.set("axis", "T");
  sf.time = dataset.add_axis(make_time_axis("time", atts, validity));

  // auxiliary coordinates matching the ones built for regular forecasts
  Variable leadtime;
  leadtime.name = "leadtime";
  leadtime.atts.set("standard_name", "forecast_period");
  leadtime.atts.set("long_name", "Lead time (since forecast_reference_time)");
  leadtime.atts.set("units", "hours");
  leadtime.axes.emplace_back(sf.time);
  leadtime.values = hours;
  sf.leadtime = dataset.add_coordinate(leadtime);
  Variable reftime;
  reftime.name = "reftime";
  reftime.atts.set("standard_name", "forecast_reference_time");
  reftime.times.emplace_back(time0);
  sf.reftime = dataset.add_coordinate(reftime);
  return sf;
}

void squash_forecasts(Dataset& dataset, stringstream& warn_ss) {
  static const string F = this_function_label(__func__);
  map<pair<AxisHandle, AxisHandle>, SquashedForecast> known_squashed_forecasts;
  for (auto& var : dataset.varlist) {
    auto t = dataset.axis_index(var, "time");
    auto f = dataset.axis_index(var, "forecast");
    if (t == MISSING_FLAG || f == MISSING_FLAG) {
      continue;
    }
    auto time = var.axes[t];
    auto forecast = var.axes[f];

    // the time and forecast axes are not adjacent for series data, so only a
    // single date of origin can be folded into the forecasts
    if (dataset.axis(time).size() != 1) {
      warn_ss << F << ": Can't use datev for timeseries data with multiple "
          "dates of origin (" << var.name << ").  Try re-running with the "
          "--dateo option." << endl;
      continue;
    }
    if (dataset.axis(time).type != AxisType::time || dataset.axis(forecast).
        type != AxisType::numeric) {
      warn_ss << F << ": no time or forecast values to squash for '" << var.
          name << "'" << endl;
      continue;
    }
    if (!dataset.remove_axis(var, t)) {
      warn_ss << F << ": unable to drop the time axis of '" << var.name << "'"
          << endl;
      continue;
    }
    auto key = make_pair(time, forecast);
    if (known_squashed_forecasts.find(key) == known_squashed_forecasts.end()) {
      known_squashed_forecasts.emplace(key, squashed_forecast(dataset, time,
          forecast));
    }
    const auto& sf = known_squashed_forecasts[key];
    if (!dataset.replace_axis(var, dataset.axis_index(var, "forecast"), sf.
        time)) {
      warn_ss << F << ": unable to replace the forecast axis of '" << var.name
          << "'" << endl;
      continue;
    }
    var.deps.emplace_back(sf.leadtime);
    var.deps.emplace_back(sf.reftime);
  }
}

} // end namespace series2nc
