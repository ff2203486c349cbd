#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rlscript {

enum class error_kind {
    syntax,
    undefined_variable,
    not_callable,
    arity_mismatch,
    type_mismatch,
    recursion_limit
};

[[nodiscard]] std::string_view error_kind_name(error_kind kind) noexcept;

class script_error : public std::runtime_error {
public:
    script_error(error_kind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

class parse_error : public script_error {
public:
    parse_error(const std::string& message, bool incomplete)
        : script_error(error_kind::syntax, message), incomplete_(incomplete) {}

    [[nodiscard]] bool incomplete() const noexcept { return incomplete_; }

private:
    bool incomplete_;
};

class eval_error : public script_error {
public:
    eval_error(error_kind kind, const std::string& message) : script_error(kind, message) {}
};

class name_error : public eval_error {
public:
    explicit name_error(const std::string& name)
        : eval_error(error_kind::undefined_variable, "undefined variable '" + name + "'"), name_(name) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

class not_callable_error : public eval_error {
public:
    explicit not_callable_error(const std::string& callee_type)
        : eval_error(error_kind::not_callable, "attempt to call non-function value of type " + callee_type),
          callee_type_(callee_type) {}

    [[nodiscard]] const std::string& callee_type() const noexcept { return callee_type_; }

private:
    std::string callee_type_;
};

class arity_error : public eval_error {
public:
    arity_error(const std::string& callee, std::size_t expected, std::size_t got)
        : eval_error(error_kind::arity_mismatch,
                     callee + ": expected " + std::to_string(expected) + " arguments, got " + std::to_string(got)),
          expected_(expected),
          got_(got) {}

    [[nodiscard]] std::size_t expected() const noexcept { return expected_; }
    [[nodiscard]] std::size_t got() const noexcept { return got_; }

private:
    std::size_t expected_;
    std::size_t got_;
};

class type_error : public eval_error {
public:
    type_error(const std::string& op, const std::string& operand_kinds)
        : eval_error(error_kind::type_mismatch, "operator '" + op + "' is not defined for " + operand_kinds),
          op_(op),
          operand_kinds_(operand_kinds) {}

    [[nodiscard]] const std::string& op() const noexcept { return op_; }
    [[nodiscard]] const std::string& operand_kinds() const noexcept { return operand_kinds_; }

private:
    std::string op_;
    std::string operand_kinds_;
};

class recursion_error : public eval_error {
public:
    explicit recursion_error(std::size_t limit)
        : eval_error(error_kind::recursion_limit, "maximum call depth of " + std::to_string(limit) + " exceeded"),
          limit_(limit) {}

    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }

private:
    std::size_t limit_;
};

}  // namespace rlscript
