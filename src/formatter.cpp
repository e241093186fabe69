#include "scifmt/formatter.h"

#include "scifmt/fsml.h"

namespace scifmt {

formatter::formatter() = default;

formatter::formatter(user_options opts) : opts_(std::move(opts)) {
    populated_options();  // validate
}

formatter formatter::from_format_spec(std::string_view spec) { return formatter(parse_format_spec(spec)); }

resolved_options formatter::populated_options() const { return defaults_registry::instance().resolve(opts_); }

formatted_number formatter::report(formatted_number result) const {
    for (const auto& w : result.warnings()) { defaults_registry::instance().warn(w); }
    return result;
}

formatted_number formatter::operator()(const decimal& value) const {
    return report(format(value, populated_options()));
}

formatted_number formatter::operator()(const decimal& value, const decimal& uncertainty) const {
    return report(format(value, uncertainty, populated_options()));
}

}  // namespace scifmt
