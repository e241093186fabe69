#include "scifmt/prefix.h"

namespace scifmt {

const prefix_table& si_prefixes() {
    static const prefix_table tbl{
        {30, "Q"},  {27, "R"},  {24, "Y"},  {21, "Z"},  {18, "E"},  {15, "P"},   {12, "T"},
        {9, "G"},   {6, "M"},   {3, "k"},   {0, ""},    {-3, "m"},  {-6, "μ"}, {-9, "n"},
        {-12, "p"}, {-15, "f"}, {-18, "a"}, {-21, "z"}, {-24, "y"}, {-27, "r"}, {-30, "q"},
    };
    return tbl;
}

const prefix_table& iec_prefixes() {
    static const prefix_table tbl{
        {0, ""},    {10, "Ki"}, {20, "Mi"}, {30, "Gi"}, {40, "Ti"},
        {50, "Pi"}, {60, "Ei"}, {70, "Zi"}, {80, "Yi"},
    };
    return tbl;
}

const prefix_table& parts_per_forms() {
    static const prefix_table tbl{{0, ""}, {-6, "ppm"}, {-9, "ppb"}, {-12, "ppt"}, {-15, "ppq"}};
    return tbl;
}

const prefix_table& c_prefix() {
    static const prefix_table tbl{{-2, "c"}};
    return tbl;
}

const prefix_table& small_si_prefixes() {
    static const prefix_table tbl{{-2, "c"}, {-1, "d"}, {1, "da"}, {2, "h"}};
    return tbl;
}

const prefix_table& ppth_form() {
    static const prefix_table tbl{{-3, "ppth"}};
    return tbl;
}

prefix_table merge_prefix_tables(const prefix_table& base, const prefix_table& extra) {
    prefix_table result(base);
    for (const auto& item : extra) { result[item.first] = item.second; }
    return result;
}

std::optional<std::string> find_prefix(const prefix_table& tbl, int exp) {
    auto it = tbl.find(exp);
    if (it == tbl.end()) { return std::nullopt; }
    return it->second;
}

}  // namespace scifmt
