#include <string>
#include <vector>
#include <series2nc.hpp>
#include <strutils.hpp>
#include <utils.hpp>
#include <myerror.hpp>

using miscutils::this_function_label;
using std::string;
using std::vector;
using strutils::split;
using strutils::substitute;

namespace series2nc {

vector<string> split_var_list(string list) {
  vector<string> v; // return value
  list = substitute(list, ",", " ");
  list = substitute(list, "\t", " ");
  for (const auto& s : split(list, " ")) {
    if (!s.empty()) {
      v.emplace_back(s);
    }
  }
  return v;
}

bool parse_args(string args_string, char arg_delimiter, Options& options) {
  static const string F = this_function_label(__func__);
  options = Options();
  if (args_string.empty()) {
    return true;
  }
  auto sp = split(args_string, string(1, arg_delimiter));
  for (size_t n = 0; n < sp.size(); ++n) {
    if (sp[n].empty()) {
      continue;
    }
    if (sp[n] == "--profile-momentum-vars" || sp[n] ==
        "--profile-thermodynamic-vars") {
      if (n + 1 == sp.size()) {
        myerror = "Error: " + F + ": missing variable list for '" + sp[n] +
            "'";
        return false;
      }
      auto& list = (sp[n] == "--profile-momentum-vars") ? options.
          momentum_vars : options.thermo_vars;
      for (const auto& v : split_var_list(sp[++n])) {
        list.emplace_back(v);
      }
    } else if (sp[n] == "--missing-bottom-profile-level") {
      options.missing_bottom_profile_level = true;
    } else if (sp[n] == "--squash-forecasts") {
      options.squash_forecasts = true;
    } else if (sp[n] == "-V") {
      verbose_operation = true;
    } else {
      myerror = "Error: " + F + ": invalid flag '" + sp[n] + "'";
      return false;
    }
  }
  return true;
}

} // end namespace series2nc
