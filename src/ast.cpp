#include "rlscript/ast.hpp"

namespace rlscript::ast {

const char* binary_op_symbol(binary_op op) noexcept {
    switch (op) {
        case binary_op::add:
            return "+";
        case binary_op::subtract:
            return "-";
        case binary_op::multiply:
            return "*";
        case binary_op::divide:
            return "/";
        case binary_op::less:
            return "<";
        case binary_op::less_equal:
            return "<=";
        case binary_op::greater:
            return ">";
        case binary_op::greater_equal:
            return ">=";
        case binary_op::equal:
            return "==";
        case binary_op::not_equal:
            return "!=";
    }
    return "?";
}

const char* unary_op_symbol(unary_op op) noexcept {
    switch (op) {
        case unary_op::negate:
            return "-";
        case unary_op::logical_not:
            return "!";
    }
    return "?";
}

const char* logical_op_symbol(logical_op op) noexcept {
    switch (op) {
        case logical_op::logical_and:
            return "and";
        case logical_op::logical_or:
            return "or";
    }
    return "?";
}

}  // namespace rlscript::ast
