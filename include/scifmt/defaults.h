#pragma once

#include "options.h"

#include <functional>
#include <mutex>
#include <string_view>

namespace scifmt {

using warning_handler = std::function<void(std::string_view)>;

// Process-wide default options used by the `formatter` facade
class defaults_registry {
 public:
    SCIFMT_EXPORT static defaults_registry& instance();

    defaults_registry(const defaults_registry&) = delete;
    defaults_registry& operator=(const defaults_registry&) = delete;

    SCIFMT_EXPORT user_options get() const;

    // Replaces the global defaults; the new set is validated first
    SCIFMT_EXPORT void set(const user_options& opts);

    // Overrides only the fields set in `opts`
    SCIFMT_EXPORT void update(const user_options& opts);

    // Restores the built-in defaults
    SCIFMT_EXPORT void reset();

    SCIFMT_EXPORT resolved_options resolve(const user_options& user) const;

    SCIFMT_EXPORT warning_handler get_warning_handler() const;
    // `nullptr` silences warnings
    SCIFMT_EXPORT void set_warning_handler(warning_handler handler);
    SCIFMT_EXPORT void warn(std::string_view message) const;

 private:
    mutable std::mutex mutex_;
    user_options opts_;
    warning_handler handler_;

    friend class scoped_defaults;

    defaults_registry();

    // Puts back a snapshot taken by `get`; it was valid when taken
    void restore(user_options&& opts) noexcept;
};

SCIFMT_EXPORT void print_warning(std::string_view message);

// Overrides the global defaults until destroyed
class scoped_defaults {
 public:
    SCIFMT_EXPORT explicit scoped_defaults(const user_options& opts);
    SCIFMT_EXPORT ~scoped_defaults();
    scoped_defaults(const scoped_defaults&) = delete;
    scoped_defaults& operator=(const scoped_defaults&) = delete;

 private:
    user_options saved_;
};

}  // namespace scifmt
