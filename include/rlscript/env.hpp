#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

#include "rlscript/value.hpp"

namespace rlscript {

struct env final {
    explicit env(env_ptr parent_env = nullptr);

    env_ptr parent = nullptr;
    std::unordered_map<std::string, value> bindings;
};

env_ptr make_env(env_ptr parent = nullptr);

// Binds in `scope` itself, overwriting any existing binding there.
void define(const env_ptr& scope, const std::string& name, value bound_value);

value lookup(const env_ptr& scope, const std::string& name);

// Rebinds `name` in the nearest scope that already defines it. Never creates a binding.
void assign(const env_ptr& scope, const std::string& name, value bound_value);

// Nearest scope on the chain that defines `name`, or null.
[[nodiscard]] env_ptr resolve(const env_ptr& scope, const std::string& name);

[[nodiscard]] std::size_t scope_depth(const env_ptr& scope) noexcept;

}  // namespace rlscript
