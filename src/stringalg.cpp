#include "scifmt/stringalg.h"

#include "scifmt/chars.h"

#include <algorithm>
#include <iterator>

namespace scifmt {

std::string_view trim_string(std::string_view s) {
    auto p1 = s.begin();
    auto p2 = s.end();
    while (p1 != p2 && is_space(*p1)) { ++p1; }
    while (p1 != p2 && is_space(*(p2 - 1))) { --p2; }
    return s.substr(p1 - s.begin(), p2 - p1);
}

std::string replace_strings(std::string_view s, std::string_view what, std::string_view with) {
    if (what.empty()) { return std::string(s); }
    std::string result;
    result.reserve(s.size());
    for (std::size_t pos = 0;;) {
        const std::size_t next = s.find(what, pos);
        if (next == std::string_view::npos) {
            result.append(s, pos, std::string_view::npos);
            break;
        }
        result.append(s, pos, next - pos);
        result += with;
        pos = next + what.size();
    }
    return result;
}

std::string remove_chars(std::string_view s, std::string_view chars) {
    std::string result;
    result.reserve(s.size());
    std::copy_if(s.begin(), s.end(), std::back_inserter(result),
                 [chars](char ch) { return chars.find(ch) == std::string_view::npos; });
    return result;
}

int compare_strings_nocase(std::string_view lhs, std::string_view rhs) {
    auto p1_end = lhs.begin() + std::min(lhs.size(), rhs.size());
    for (auto p1 = lhs.begin(), p2 = rhs.begin(); p1 != p1_end; ++p1, ++p2) {
        const char ch1 = to_lower(*p1);
        const char ch2 = to_lower(*p2);
        if (std::string_view::traits_type::lt(ch1, ch2)) { return -1; }
        if (std::string_view::traits_type::lt(ch2, ch1)) { return 1; }
    }
    if (lhs.size() < rhs.size()) { return -1; }
    if (rhs.size() < lhs.size()) { return 1; }
    return 0;
}

std::string to_upper(std::string_view s) {
    std::string upper(s);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](char c) { return scifmt::to_upper(c); });
    return upper;
}

}  // namespace scifmt
