#include "rlscript/extensions.hpp"

#include <charconv>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace rlscript {

registrar::registrar(env_ptr global_env) : global_env_(std::move(global_env)) {
    if (!global_env_) {
        throw std::invalid_argument("registrar: null global environment");
    }
}

void registrar::register_builtin(const std::string& full_name, std::size_t arity, native_fn fn) {
    ensure_registerable_name(full_name, "registrar.register_builtin");
    if (!fn) {
        throw std::invalid_argument("registrar.register_builtin: empty callback for " + full_name);
    }
    define(global_env_, full_name, make_function(make_native(full_name, arity, std::move(fn))));
}

void registrar::register_value(const std::string& full_name, value bound_value) {
    ensure_registerable_name(full_name, "registrar.register_value");
    define(global_env_, full_name, std::move(bound_value));
}

void registrar::ensure_registerable_name(const std::string& full_name, const char* where) const {
    if (full_name.empty()) {
        throw std::invalid_argument(std::string(where) + ": name must not be empty");
    }
    if (global_env_->bindings.find(full_name) != global_env_->bindings.end()) {
        throw std::invalid_argument(std::string(where) + ": name already defined: " + full_name);
    }
}

std::optional<std::size_t> parse_call_depth(std::string_view text) {
    std::size_t parsed = 0;
    const char* first = text.data();
    const char* last = first + text.size();
    const auto [end, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc{} || end != last || parsed == 0 || parsed > max_call_depth_ceiling) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace rlscript
