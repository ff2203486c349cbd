#include "rlscript/value.hpp"

#include <stdexcept>
#include <utility>

#include "rlscript/ast.hpp"
#include "rlscript/error.hpp"

namespace rlscript {
namespace {

[[noreturn]] void throw_wrong_type(const value& v, value_type expected, const char* where) {
    throw eval_error(error_kind::type_mismatch,
                     std::string(where) + ": expected " + std::string(type_name(expected)) + ", got " +
                         std::string(type_name(type_of(v))));
}

}  // namespace

std::size_t function_object::arity() const noexcept {
    if (definition) {
        return definition->params.size();
    }
    return native_arity;
}

value make_nil() {
    return value{};
}

value make_boolean(bool v) {
    return value(value::storage(std::in_place_type<bool>, v));
}

value make_number(double v) {
    return value(value::storage(std::in_place_type<double>, v));
}

value make_string(const std::string& text) {
    return value(value::storage(std::in_place_type<std::string>, text));
}

value make_function(function_ptr fn) {
    if (!fn) {
        throw std::invalid_argument("make_function: null function");
    }
    return value(value::storage(std::in_place_type<function_ptr>, std::move(fn)));
}

function_ptr make_closure(std::string name,
                          std::shared_ptr<const ast::function_decl> definition,
                          env_ptr captured_env,
                          std::uint64_t id) {
    auto fn = std::make_shared<function_object>();
    fn->name = std::move(name);
    fn->id = id;
    fn->definition = std::move(definition);
    fn->closure = std::move(captured_env);
    return fn;
}

function_ptr make_native(std::string name, std::size_t arity, native_fn fn, std::uint64_t id) {
    auto out = std::make_shared<function_object>();
    out->name = std::move(name);
    out->id = id;
    out->native_arity = arity;
    out->native = std::move(fn);
    return out;
}

value_type type_of(const value& v) noexcept {
    switch (v.data().index()) {
        case 1:
            return value_type::boolean;
        case 2:
            return value_type::number;
        case 3:
            return value_type::string;
        case 4:
            return value_type::function;
        default:
            return value_type::nil;
    }
}

std::string_view type_name(value_type t) noexcept {
    switch (t) {
        case value_type::nil:
            return "nil";
        case value_type::boolean:
            return "bool";
        case value_type::number:
            return "number";
        case value_type::string:
            return "string";
        case value_type::function:
            return "function";
    }
    return "unknown";
}

bool is_nil(const value& v) noexcept {
    return std::holds_alternative<std::monostate>(v.data());
}

bool is_boolean(const value& v) noexcept {
    return std::holds_alternative<bool>(v.data());
}

bool is_number(const value& v) noexcept {
    return std::holds_alternative<double>(v.data());
}

bool is_string(const value& v) noexcept {
    return std::holds_alternative<std::string>(v.data());
}

bool is_function(const value& v) noexcept {
    return std::holds_alternative<function_ptr>(v.data());
}

bool boolean_value(const value& v) {
    if (!is_boolean(v)) {
        throw_wrong_type(v, value_type::boolean, "boolean_value");
    }
    return std::get<bool>(v.data());
}

double number_value(const value& v) {
    if (!is_number(v)) {
        throw_wrong_type(v, value_type::number, "number_value");
    }
    return std::get<double>(v.data());
}

const std::string& string_value(const value& v) {
    if (!is_string(v)) {
        throw_wrong_type(v, value_type::string, "string_value");
    }
    return std::get<std::string>(v.data());
}

const function_ptr& function_value(const value& v) {
    if (!is_function(v)) {
        throw_wrong_type(v, value_type::function, "function_value");
    }
    return std::get<function_ptr>(v.data());
}

bool eq_values(const value& lhs, const value& rhs) {
    if (type_of(lhs) != type_of(rhs)) {
        return false;
    }

    switch (type_of(lhs)) {
        case value_type::nil:
            return true;
        case value_type::boolean:
            return boolean_value(lhs) == boolean_value(rhs);
        case value_type::number:
            return number_value(lhs) == number_value(rhs);
        case value_type::string:
            return string_value(lhs) == string_value(rhs);
        case value_type::function:
            return function_value(lhs) == function_value(rhs);
    }
    return false;
}

}  // namespace rlscript
