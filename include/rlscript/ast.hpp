#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "rlscript/value.hpp"

namespace rlscript::ast {

struct expr;
struct stmt;

using expr_ptr = std::unique_ptr<expr>;
using stmt_ptr = std::unique_ptr<stmt>;
using program = std::vector<stmt_ptr>;

enum class unary_op {
    negate,
    logical_not
};

enum class binary_op {
    add,
    subtract,
    multiply,
    divide,
    less,
    less_equal,
    greater,
    greater_equal,
    equal,
    not_equal
};

enum class logical_op {
    logical_and,
    logical_or
};

// Shared by every function value created from it, so it outlives the program that declared it.
struct function_decl {
    std::string name;
    std::vector<std::string> params;
    std::vector<stmt_ptr> body;
    std::size_t line = 0;
};

using function_decl_ptr = std::shared_ptr<const function_decl>;

struct literal_expr {
    value literal;
};

struct grouping_expr {
    expr_ptr inner;
};

struct variable_expr {
    std::string name;
};

struct assign_expr {
    std::string name;
    expr_ptr assigned;
};

struct unary_expr {
    unary_op op = unary_op::negate;
    expr_ptr operand;
};

struct binary_expr {
    binary_op op = binary_op::add;
    expr_ptr lhs;
    expr_ptr rhs;
};

struct logical_expr {
    logical_op op = logical_op::logical_and;
    expr_ptr lhs;
    expr_ptr rhs;
};

struct call_expr {
    expr_ptr callee;
    std::vector<expr_ptr> args;
};

struct function_expr {
    function_decl_ptr decl;
};

struct expr {
    using node_type = std::variant<literal_expr,
                                   grouping_expr,
                                   variable_expr,
                                   assign_expr,
                                   unary_expr,
                                   binary_expr,
                                   logical_expr,
                                   call_expr,
                                   function_expr>;

    node_type node;
    std::size_t line = 0;
    // Longest path to a leaf, counting this node.
    std::size_t height = 1;
};

struct expression_stmt {
    expr_ptr expression;
};

struct print_stmt {
    expr_ptr expression;
};

struct var_stmt {
    std::string name;
    expr_ptr initializer;
};

struct block_stmt {
    std::vector<stmt_ptr> statements;
};

struct if_stmt {
    expr_ptr condition;
    stmt_ptr then_branch;
    stmt_ptr else_branch;
};

struct while_stmt {
    expr_ptr condition;
    stmt_ptr body;
};

struct function_stmt {
    function_decl_ptr decl;
};

struct return_stmt {
    expr_ptr result;
};

struct stmt {
    using node_type = std::variant<expression_stmt,
                                   print_stmt,
                                   var_stmt,
                                   block_stmt,
                                   if_stmt,
                                   while_stmt,
                                   function_stmt,
                                   return_stmt>;

    node_type node;
    std::size_t line = 0;
};

template <typename Node>
expr_ptr make_expr(Node node, std::size_t line = 0) {
    return std::make_unique<expr>(expr{std::move(node), line, 1});
}

template <typename Node>
stmt_ptr make_stmt(Node node, std::size_t line = 0) {
    return std::make_unique<stmt>(stmt{std::move(node), line});
}

[[nodiscard]] const char* binary_op_symbol(binary_op op) noexcept;
[[nodiscard]] const char* unary_op_symbol(unary_op op) noexcept;
[[nodiscard]] const char* logical_op_symbol(logical_op op) noexcept;

}  // namespace rlscript::ast
