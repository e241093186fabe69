#pragma once

#include "common.h"

#include <stdexcept>
#include <string>
#include <string_view>

namespace scifmt {

class SCIFMT_EXPORT_ALL_STUFF_FOR_GNUC format_error : public std::runtime_error {
 public:
    SCIFMT_EXPORT explicit format_error(const char* message);
    SCIFMT_EXPORT explicit format_error(const std::string& message);
    SCIFMT_EXPORT const char* what() const noexcept override;
};

// Invalid or mutually inconsistent formatting options
class SCIFMT_EXPORT_ALL_STUFF_FOR_GNUC config_error : public format_error {
 public:
    SCIFMT_EXPORT explicit config_error(const char* message);
    SCIFMT_EXPORT explicit config_error(const std::string& message);
};

// Format specification string not matching the mini-language grammar
class SCIFMT_EXPORT_ALL_STUFF_FOR_GNUC parse_error : public format_error {
 public:
    SCIFMT_EXPORT parse_error(std::string_view spec, const std::string& message);
    const std::string& spec() const noexcept { return spec_; }

 private:
    std::string spec_;
};

}  // namespace scifmt
