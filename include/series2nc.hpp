#ifndef SERIES2NC_H
#define   SERIES2NC_H

#include <string>
#include <vector>
#include <sstream>
#include <datetime.hpp>
#include <series_model.hpp>

namespace series2nc {

extern bool verbose_operation;

struct Options {
  Options() : momentum_vars(), thermo_vars(), missing_bottom_profile_level(
      false), squash_forecasts(false) { }

  std::vector<std::string> momentum_vars, thermo_vars;
  bool missing_bottom_profile_level, squash_forecasts;
};

extern bool parse_args(std::string args_string, char arg_delimiter, Options&
    options);
extern std::vector<std::string> split_var_list(std::string list);

struct RecordHeader {
  RecordHeader() : nomvar(), typvar(), etiket(), grtyp(), ip1(0), ip2(0),
      ip3(0), ig1(0), ig2(0), ig3(0), ig4(0), dateo(), leadtime(0.), ni(1),
      nj(1), nk(1) { }

  std::string nomvar, typvar, etiket, grtyp;
  int ip1, ip2, ip3;
  int ig1, ig2, ig3, ig4;
  DateTime dateo;
  double leadtime;
  size_t ni, nj, nk;
};

// values are stored with i varying fastest, then j, then k
struct Record {
  Record() : header(), data() { }

  RecordHeader header;
  std::vector<double> data;
};

class RecordStore {
public:
  virtual ~RecordStore() { }

  // at most one record matches a name; returns false when there is none
  virtual bool find(std::string nomvar, Record& record) const = 0;
};

enum class SeriesKind { plain, series, series_y, profile };

extern SeriesKind series_kind(std::string typvar, std::string grtyp);
extern SeriesKind series_kind(const Variable& var);

inline bool is_series(SeriesKind kind) { return kind != SeriesKind::plain; }

template <class T>
struct MaskedColumn {
  MaskedColumn() : values(), mask() { }

  void push_back(T value, bool masked = false) {
    values.emplace_back(value);
    mask.emplace_back(masked);
  }
  bool is_valid(size_t n) const { return !mask[n]; }
  size_t size() const { return values.size(); }

  std::vector<T> values;
  std::vector<bool> mask;
};

struct RecordTable {
  RecordTable() : nomvar(), typvar(), grtyp(), ip1(), ip2(), ip3(), ig1(),
      ig2(), ig3(), ig4(), leadtime(), reftime(), station_id(), kind(),
      has_leadtime(true), has_reftime(true) { }

  void append(const RecordHeader& header);
  size_t size() const { return typvar.size(); }

  std::vector<std::string> nomvar, typvar, grtyp;
  std::vector<int> ip1, ip2, ip3;
  std::vector<int> ig1, ig2, ig3, ig4;
  MaskedColumn<double> leadtime;
  MaskedColumn<DateTime> reftime;
  MaskedColumn<int> station_id;
  std::vector<SeriesKind> kind;
  bool has_leadtime, has_reftime;
};

extern void classify_records(RecordTable& table);

namespace seriesAxes {

struct Handles {
  Handles() : station(MISSING_FLAG), station_id(MISSING_FLAG),
      station_strlen(MISSING_FLAG), forecast(MISSING_FLAG), momentum(
      MISSING_FLAG), thermo(MISSING_FLAG) { }

  bool has_station() const { return station != MISSING_FLAG; }

  CoordinateHandle station;
  AxisHandle station_id, station_strlen, forecast, momentum, thermo;
};

extern bool decode_station_names(const Record& record, std::vector<std::
    string>& names);
extern void extract_axes(const RecordStore& store, const Options& options,
    Dataset& dataset, Handles& handles);
extern void forecast_hours(const Record& record, std::vector<double>& hours);
extern bool vertical_levels(const Record& record, bool
    missing_bottom_level, std::vector<double>& levels);

} // end namespace series2nc::seriesAxes

namespace remapAxes {

extern void drop_profile_levels(Dataset& dataset, std::stringstream& warn_ss);
extern void remap_profiles(Dataset& dataset, const seriesAxes::Handles&
    handles, const Options& options, std::stringstream& warn_ss);
extern void remap_station_series(Dataset& dataset, const seriesAxes::Handles&
    handles, std::stringstream& warn_ss);

} // end namespace series2nc::remapAxes

extern void squash_forecasts(Dataset& dataset, std::stringstream& warn_ss);
extern void bind_station_coordinates(Dataset& dataset, const seriesAxes::
    Handles& handles, std::stringstream& warn_ss);

class Series {
public:
  Series(RecordTable& table, const RecordStore& store, const Options& options);
  Series(const Series& source) = delete;
  Series& operator=(const Series& source) = delete;
  void flush_warnings(std::ostream& outs);
  static bool is_meta_record(std::string nomvar);
  void make_vars(Dataset& dataset);
  static std::vector<std::string> maybe_meta_records();
  static std::vector<std::string> meta_records();
  static std::vector<std::string> outer_axes(const std::vector<std::string>&
      generic_axes);
  const RecordTable& records() const { return table; }
  std::string warnings() const { return warn_ss.str(); }

private:
  const RecordTable& table;
  const RecordStore& store;
  Options options;
  std::stringstream warn_ss;
};

} // end namespace series2nc

#endif
