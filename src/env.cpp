#include "rlscript/env.hpp"

#include <stdexcept>
#include <utility>

#include "rlscript/error.hpp"

namespace rlscript {

env::env(env_ptr parent_env) : parent(std::move(parent_env)) {}

env_ptr make_env(env_ptr parent) {
    return std::make_shared<env>(std::move(parent));
}

void define(const env_ptr& scope, const std::string& name, value bound_value) {
    if (!scope) {
        throw std::invalid_argument("define: null environment");
    }
    scope->bindings[name] = std::move(bound_value);
}

env_ptr resolve(const env_ptr& scope, const std::string& name) {
    for (env_ptr cursor = scope; cursor; cursor = cursor->parent) {
        if (cursor->bindings.find(name) != cursor->bindings.end()) {
            return cursor;
        }
    }
    return nullptr;
}

value lookup(const env_ptr& scope, const std::string& name) {
    for (const env* cursor = scope.get(); cursor; cursor = cursor->parent.get()) {
        const auto it = cursor->bindings.find(name);
        if (it != cursor->bindings.end()) {
            return it->second;
        }
    }
    throw name_error(name);
}

void assign(const env_ptr& scope, const std::string& name, value bound_value) {
    for (env* cursor = scope.get(); cursor; cursor = cursor->parent.get()) {
        const auto it = cursor->bindings.find(name);
        if (it != cursor->bindings.end()) {
            it->second = std::move(bound_value);
            return;
        }
    }
    throw name_error(name);
}

std::size_t scope_depth(const env_ptr& scope) noexcept {
    std::size_t depth = 0;
    for (const env* cursor = scope.get(); cursor && cursor->parent; cursor = cursor->parent.get()) {
        ++depth;
    }
    return depth;
}

}  // namespace rlscript
