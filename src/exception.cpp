#include "scifmt/exception.h"

namespace scifmt {
format_error::format_error(const char* message) : std::runtime_error(message) {}
format_error::format_error(const std::string& message) : std::runtime_error(message) {}
const char* format_error::what() const noexcept { return std::runtime_error::what(); }

config_error::config_error(const char* message) : format_error(message) {}
config_error::config_error(const std::string& message) : format_error(message) {}

parse_error::parse_error(std::string_view spec, const std::string& message)
    : format_error(message + ": '" + std::string(spec) + "'"), spec_(spec) {}
}  // namespace scifmt
