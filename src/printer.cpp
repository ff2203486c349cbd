#include "rlscript/printer.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <sstream>

namespace rlscript {
namespace {

std::string escape_string(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        switch (c) {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    return out;
}

std::string print_function(const function_object& fn) {
    if (fn.is_native()) {
        return "<native fn " + fn.name + "/" + std::to_string(fn.arity()) + ">";
    }
    return "<fn " + fn.name + "/" + std::to_string(fn.arity()) + " #" + std::to_string(fn.id) + ">";
}

std::string literal_text(const value& v) {
    if (is_string(v)) {
        return "\"" + escape_string(string_value(v)) + "\"";
    }
    return print_value(v);
}

std::string param_list(const std::vector<std::string>& params) {
    std::string out = "(";
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            out += " ";
        }
        out += params[i];
    }
    return out + ")";
}

std::string body_text(const std::vector<ast::stmt_ptr>& body) {
    std::string out;
    for (const auto& s : body) {
        out += " " + print_stmt(*s);
    }
    return out;
}

class expr_printer {
public:
    std::string operator()(const ast::literal_expr& node) const { return literal_text(node.literal); }

    std::string operator()(const ast::grouping_expr& node) const { return "(group " + print_expr(*node.inner) + ")"; }

    std::string operator()(const ast::variable_expr& node) const { return "(var " + node.name + ")"; }

    std::string operator()(const ast::assign_expr& node) const {
        return "(" + node.name + " = " + print_expr(*node.assigned) + ")";
    }

    std::string operator()(const ast::unary_expr& node) const {
        return std::string("(") + ast::unary_op_symbol(node.op) + " " + print_expr(*node.operand) + ")";
    }

    std::string operator()(const ast::binary_expr& node) const {
        return std::string("(") + ast::binary_op_symbol(node.op) + " " + print_expr(*node.lhs) + " " +
               print_expr(*node.rhs) + ")";
    }

    std::string operator()(const ast::logical_expr& node) const {
        return std::string("(") + ast::logical_op_symbol(node.op) + " " + print_expr(*node.lhs) + " " +
               print_expr(*node.rhs) + ")";
    }

    std::string operator()(const ast::call_expr& node) const {
        std::string out = "(call " + print_expr(*node.callee);
        for (const auto& arg : node.args) {
            out += " " + print_expr(*arg);
        }
        return out + ")";
    }

    std::string operator()(const ast::function_expr& node) const {
        return "(fn " + param_list(node.decl->params) + body_text(node.decl->body) + ")";
    }
};

class stmt_printer {
public:
    std::string operator()(const ast::expression_stmt& node) const { return print_expr(*node.expression); }

    std::string operator()(const ast::print_stmt& node) const { return "(print " + print_expr(*node.expression) + ")"; }

    std::string operator()(const ast::var_stmt& node) const {
        if (!node.initializer) {
            return "(var " + node.name + ")";
        }
        return "(var " + node.name + " " + print_expr(*node.initializer) + ")";
    }

    std::string operator()(const ast::block_stmt& node) const { return "(block" + body_text(node.statements) + ")"; }

    std::string operator()(const ast::if_stmt& node) const {
        std::string out = "(if " + print_expr(*node.condition) + " " + print_stmt(*node.then_branch);
        if (node.else_branch) {
            out += " " + print_stmt(*node.else_branch);
        }
        return out + ")";
    }

    std::string operator()(const ast::while_stmt& node) const {
        return "(while " + print_expr(*node.condition) + " " + print_stmt(*node.body) + ")";
    }

    std::string operator()(const ast::function_stmt& node) const {
        return "(fn " + node.decl->name + " " + param_list(node.decl->params) + body_text(node.decl->body) + ")";
    }

    std::string operator()(const ast::return_stmt& node) const {
        if (!node.result) {
            return "(return)";
        }
        return "(return " + print_expr(*node.result) + ")";
    }
};

}  // namespace

std::string format_number(double v) {
    if (std::isnan(v)) {
        return "nan";
    }
    if (std::isinf(v)) {
        return v < 0.0 ? "-inf" : "inf";
    }
    if (std::trunc(v) == v && std::fabs(v) < 1e15) {
        return std::to_string(static_cast<std::int64_t>(v));
    }

    std::ostringstream out;
    out.setf(std::ios::fmtflags(0), std::ios::floatfield);
    out << std::setprecision(15) << v;
    return out.str();
}

std::string print_value(const value& v) {
    switch (type_of(v)) {
        case value_type::nil:
            return "nil";
        case value_type::boolean:
            return boolean_value(v) ? "true" : "false";
        case value_type::number:
            return format_number(number_value(v));
        case value_type::string:
            return string_value(v);
        case value_type::function:
            return print_function(*function_value(v));
    }
    return "<unknown>";
}

std::string print_expr(const ast::expr& e) {
    return std::visit(expr_printer{}, e.node);
}

std::string print_stmt(const ast::stmt& s) {
    return std::visit(stmt_printer{}, s.node);
}

}  // namespace rlscript
