#pragma once

#include "common.h"

#include <map>
#include <optional>
#include <string>

namespace scifmt {

// Exponent to prefix token; `std::nullopt` suppresses substitution for that exponent
using prefix_table = std::map<int, std::optional<std::string>>;

SCIFMT_EXPORT const prefix_table& si_prefixes();
SCIFMT_EXPORT const prefix_table& iec_prefixes();
SCIFMT_EXPORT const prefix_table& parts_per_forms();

// `c` for 10^-2
SCIFMT_EXPORT const prefix_table& c_prefix();
// `c`, `d`, `da` and `h`
SCIFMT_EXPORT const prefix_table& small_si_prefixes();
// `ppth` for 10^-3
SCIFMT_EXPORT const prefix_table& ppth_form();

// Entries of `extra` override entries of `base`
SCIFMT_EXPORT prefix_table merge_prefix_tables(const prefix_table& base, const prefix_table& extra);

// Token for `exp`, or `std::nullopt` if there is no entry or the entry is suppressed
SCIFMT_EXPORT std::optional<std::string> find_prefix(const prefix_table& tbl, int exp);

}  // namespace scifmt
