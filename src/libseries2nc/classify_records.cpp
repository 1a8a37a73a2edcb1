#include <string>
#include <series2nc.hpp>
#include <strutils.hpp>

using std::string;
using strutils::trimmed;

namespace series2nc {

SeriesKind series_kind(string typvar, string grtyp) {

  // typvar is blank-padded to two characters in the record headers
  if (trimmed(typvar) != "T") {
    return SeriesKind::plain;
  }
  auto g = trimmed(grtyp);
  if (g == "+") {
    return SeriesKind::profile;
  } else if (g == "Y") {
    return SeriesKind::series_y;
  } else if (g == "T") {
    return SeriesKind::series;
  }
  return SeriesKind::plain;
}

SeriesKind series_kind(const Variable& var) {
  return series_kind(var.atts.get("typvar"), var.atts.get("grtyp"));
}

void RecordTable::append(const RecordHeader& header) {
  nomvar.emplace_back(header.nomvar);
  typvar.emplace_back(header.typvar);
  grtyp.emplace_back(header.grtyp);
  ip1.emplace_back(header.ip1);
  ip2.emplace_back(header.ip2);
  ip3.emplace_back(header.ip3);
  ig1.emplace_back(header.ig1);
  ig2.emplace_back(header.ig2);
  ig3.emplace_back(header.ig3);
  ig4.emplace_back(header.ig4);
  if (has_leadtime) {
    leadtime.push_back(header.leadtime);
  }
  if (has_reftime) {
    reftime.push_back(header.dateo);
  }
}

void classify_records(RecordTable& table) {
  auto nrecs = table.size();
  table.kind.clear();
  table.station_id = MaskedColumn<int>();
  for (size_t n = 0; n < nrecs; ++n) {
    auto kind = series_kind(table.typvar[n], table.grtyp[n]);
    table.kind.emplace_back(kind);

    // profile data is split one station per record, numbered by ip3
    table.station_id.push_back(table.ip3[n], kind !=
        SeriesKind::profile);
    if (!is_series(kind)) {
      continue;
    }

    // forecast information for series comes from the HH record instead of
    // the record dates
    if (table.has_leadtime && table.leadtime.size() == nrecs) {
      table.leadtime.mask[n] = true;
    }
    if (table.has_reftime && table.reftime.size() == nrecs) {
      table.reftime.mask[n] = true;
    }

    // ig1-ig4 hold station coordinates rather than grid descriptors, and ip1
    // is not a vertical level
    table.ig1[n] = 0;
    table.ig2[n] = 0;
    table.ig3[n] = 0;
    table.ig4[n] = 0;
    table.ip1[n] = 0;
  }
}

} // end namespace series2nc
