#pragma once

#include "common.h"

#include <string>
#include <string_view>

namespace scifmt {

SCIFMT_EXPORT std::string_view trim_string(std::string_view s);

// Replaces every non-overlapping occurrence of `what`, scanning left to right
SCIFMT_EXPORT std::string replace_strings(std::string_view s, std::string_view what, std::string_view with);

// Drops every character contained in `chars`
SCIFMT_EXPORT std::string remove_chars(std::string_view s, std::string_view chars);

SCIFMT_EXPORT int compare_strings_nocase(std::string_view lhs, std::string_view rhs);
SCIFMT_EXPORT std::string to_upper(std::string_view s);

}  // namespace scifmt
