#include "scifmt/defaults.h"

#include <cstdio>
#include <string>
#include <utility>

namespace scifmt {

void print_warning(std::string_view message) {
    std::fprintf(stderr, "scifmt: warning: %.*s\n", static_cast<int>(message.size()), message.data());
}

defaults_registry::defaults_registry() : opts_(builtin_defaults()), handler_(print_warning) {}

defaults_registry& defaults_registry::instance() {
    static defaults_registry registry;
    return registry;
}

user_options defaults_registry::get() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return opts_;
}

void defaults_registry::set(const user_options& opts) {
    user_options new_opts = builtin_defaults();
    new_opts.merge(opts);
    populate_options(new_opts);  // validate
    std::lock_guard<std::mutex> lk(mutex_);
    opts_ = std::move(new_opts);
}

void defaults_registry::update(const user_options& opts) {
    std::lock_guard<std::mutex> lk(mutex_);
    user_options new_opts = opts_;
    new_opts.merge(opts);
    populate_options(new_opts);
    opts_ = std::move(new_opts);
}

void defaults_registry::restore(user_options&& opts) noexcept {
    std::lock_guard<std::mutex> lk(mutex_);
    opts_ = std::move(opts);
}

void defaults_registry::reset() {
    std::lock_guard<std::mutex> lk(mutex_);
    opts_ = builtin_defaults();
}

resolved_options defaults_registry::resolve(const user_options& user) const {
    const user_options defaults = get();
    return populate_options(user, defaults);
}

warning_handler defaults_registry::get_warning_handler() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return handler_;
}

void defaults_registry::set_warning_handler(warning_handler handler) {
    std::lock_guard<std::mutex> lk(mutex_);
    handler_ = std::move(handler);
}

void defaults_registry::warn(std::string_view message) const {
    const warning_handler handler = get_warning_handler();
    if (handler) { handler(message); }
}

// --------------------------

scoped_defaults::scoped_defaults(const user_options& opts) : saved_(defaults_registry::instance().get()) {
    defaults_registry::instance().update(opts);
}

scoped_defaults::~scoped_defaults() { defaults_registry::instance().restore(std::move(saved_)); }

}  // namespace scifmt
