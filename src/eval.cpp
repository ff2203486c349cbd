#include "rlscript/eval.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

#include "rlscript/builtins.hpp"
#include "rlscript/parser.hpp"
#include "rlscript/printer.hpp"

namespace rlscript {
namespace {

class call_depth_guard {
public:
    call_depth_guard(std::size_t& depth, std::size_t limit) : depth_(depth) {
        if (depth_ >= limit) {
            throw recursion_error(limit);
        }
        ++depth_;
    }

    ~call_depth_guard() { --depth_; }

    call_depth_guard(const call_depth_guard&) = delete;
    call_depth_guard& operator=(const call_depth_guard&) = delete;

private:
    std::size_t& depth_;
};

// Result of executing a statement: either fall through or unwind to the enclosing call.
struct flow {
    bool returning = false;
    value result;
};

std::string kind_of(const value& v) {
    return std::string(type_name(type_of(v)));
}

std::string operand_kinds(const value& lhs, const value& rhs) {
    return kind_of(lhs) + " and " + kind_of(rhs);
}

bool is_truthy(const value& v) {
    switch (type_of(v)) {
        case value_type::nil:
            return false;
        case value_type::boolean:
            return boolean_value(v);
        case value_type::number:
            return number_value(v) != 0.0;
        case value_type::string:
            return !string_value(v).empty();
        case value_type::function:
            break;
    }
    throw type_error("condition", kind_of(v));
}

value compare(ast::binary_op op, const value& lhs, const value& rhs) {
    if (is_number(lhs) && is_number(rhs)) {
        const double a = number_value(lhs);
        const double b = number_value(rhs);
        switch (op) {
            case ast::binary_op::less:
                return make_boolean(a < b);
            case ast::binary_op::less_equal:
                return make_boolean(a <= b);
            case ast::binary_op::greater:
                return make_boolean(a > b);
            default:
                return make_boolean(a >= b);
        }
    }
    if (is_string(lhs) && is_string(rhs)) {
        const std::string& a = string_value(lhs);
        const std::string& b = string_value(rhs);
        switch (op) {
            case ast::binary_op::less:
                return make_boolean(a < b);
            case ast::binary_op::less_equal:
                return make_boolean(a <= b);
            case ast::binary_op::greater:
                return make_boolean(a > b);
            default:
                return make_boolean(a >= b);
        }
    }
    throw type_error(ast::binary_op_symbol(op), operand_kinds(lhs, rhs));
}

value arithmetic(ast::binary_op op, const value& lhs, const value& rhs) {
    if (op == ast::binary_op::add) {
        if (is_string(lhs) && is_string(rhs)) {
            return make_string(string_value(lhs) + string_value(rhs));
        }
        if (is_string(lhs) && is_number(rhs)) {
            return make_string(string_value(lhs) + format_number(number_value(rhs)));
        }
    }

    if (!is_number(lhs) || !is_number(rhs)) {
        throw type_error(ast::binary_op_symbol(op), operand_kinds(lhs, rhs));
    }

    const double a = number_value(lhs);
    const double b = number_value(rhs);
    switch (op) {
        case ast::binary_op::add:
            return make_number(a + b);
        case ast::binary_op::subtract:
            return make_number(a - b);
        case ast::binary_op::multiply:
            return make_number(a * b);
        default:
            return make_number(a / b);
    }
}

value apply_binary(ast::binary_op op, const value& lhs, const value& rhs) {
    switch (op) {
        case ast::binary_op::equal:
            return make_boolean(eq_values(lhs, rhs));
        case ast::binary_op::not_equal:
            return make_boolean(!eq_values(lhs, rhs));
        case ast::binary_op::less:
        case ast::binary_op::less_equal:
        case ast::binary_op::greater:
        case ast::binary_op::greater_equal:
            return compare(op, lhs, rhs);
        case ast::binary_op::add:
        case ast::binary_op::subtract:
        case ast::binary_op::multiply:
        case ast::binary_op::divide:
            return arithmetic(op, lhs, rhs);
    }
    throw type_error(ast::binary_op_symbol(op), operand_kinds(lhs, rhs));
}

}  // namespace

class interpreter::evaluator {
public:
    explicit evaluator(interpreter& owner) : owner_(owner) {}

    flow exec(const ast::stmt& s, const env_ptr& scope) {
        return std::visit([&](const auto& node) { return exec_node(node, scope); }, s.node);
    }

    flow exec_sequence(const std::vector<ast::stmt_ptr>& statements, const env_ptr& scope) {
        for (const auto& s : statements) {
            flow out = exec(*s, scope);
            if (out.returning) {
                return out;
            }
        }
        return {};
    }

    value eval(const ast::expr& e, const env_ptr& scope) {
        return std::visit([&](const auto& node) { return eval_node(node, scope); }, e.node);
    }

    value call(const value& callee, const std::vector<value>& args) {
        if (!is_function(callee)) {
            throw not_callable_error(kind_of(callee));
        }

        const function_ptr fn = function_value(callee);
        if (args.size() != fn->arity()) {
            throw arity_error(fn->name, fn->arity(), args.size());
        }

        call_depth_guard depth(owner_.call_depth_, owner_.config_.max_call_depth);
        if (owner_.log_enabled(log_level::debug)) {
            owner_.log(log_level::debug, "call", fn->name + "/" + std::to_string(args.size()));
        }

        if (fn->is_native()) {
            return fn->native(args);
        }

        env_ptr frame = owner_.heap_.make_env(fn->closure);
        const auto& params = fn->definition->params;
        for (std::size_t i = 0; i < params.size(); ++i) {
            define(frame, params[i], args[i]);
        }

        flow out = exec_sequence(fn->definition->body, frame);
        return out.returning ? std::move(out.result) : make_nil();
    }

private:
    flow exec_node(const ast::expression_stmt& node, const env_ptr& scope) {
        (void)eval(*node.expression, scope);
        return {};
    }

    flow exec_node(const ast::print_stmt& node, const env_ptr& scope) {
        const value printed = eval(*node.expression, scope);
        owner_.config_.output->write_line(print_value(printed));
        return {};
    }

    flow exec_node(const ast::var_stmt& node, const env_ptr& scope) {
        value initial = node.initializer ? eval(*node.initializer, scope) : make_nil();
        define(scope, node.name, std::move(initial));
        return {};
    }

    flow exec_node(const ast::block_stmt& node, const env_ptr& scope) {
        env_ptr block_scope = owner_.heap_.make_env(scope);
        return exec_sequence(node.statements, block_scope);
    }

    flow exec_node(const ast::if_stmt& node, const env_ptr& scope) {
        if (is_truthy(eval(*node.condition, scope))) {
            return exec(*node.then_branch, scope);
        }
        if (node.else_branch) {
            return exec(*node.else_branch, scope);
        }
        return {};
    }

    flow exec_node(const ast::while_stmt& node, const env_ptr& scope) {
        while (is_truthy(eval(*node.condition, scope))) {
            flow out = exec(*node.body, scope);
            if (out.returning) {
                return out;
            }
        }
        return {};
    }

    flow exec_node(const ast::function_stmt& node, const env_ptr& scope) {
        function_ptr fn = make_closure(node.decl->name, node.decl, scope, owner_.next_function_id());
        define(scope, node.decl->name, make_function(std::move(fn)));
        return {};
    }

    flow exec_node(const ast::return_stmt& node, const env_ptr& scope) {
        flow out;
        out.returning = true;
        out.result = node.result ? eval(*node.result, scope) : make_nil();
        return out;
    }

    value eval_node(const ast::literal_expr& node, const env_ptr&) { return node.literal; }

    value eval_node(const ast::grouping_expr& node, const env_ptr& scope) { return eval(*node.inner, scope); }

    value eval_node(const ast::variable_expr& node, const env_ptr& scope) { return lookup(scope, node.name); }

    value eval_node(const ast::assign_expr& node, const env_ptr& scope) {
        value assigned = eval(*node.assigned, scope);
        assign(scope, node.name, assigned);
        return assigned;
    }

    value eval_node(const ast::unary_expr& node, const env_ptr& scope) {
        const value operand = eval(*node.operand, scope);
        if (node.op == ast::unary_op::logical_not) {
            return make_boolean(!is_truthy(operand));
        }
        if (!is_number(operand)) {
            throw type_error(ast::unary_op_symbol(node.op), kind_of(operand));
        }
        return make_number(-number_value(operand));
    }

    value eval_node(const ast::binary_expr& node, const env_ptr& scope) {
        const value lhs = eval(*node.lhs, scope);
        const value rhs = eval(*node.rhs, scope);
        return apply_binary(node.op, lhs, rhs);
    }

    value eval_node(const ast::logical_expr& node, const env_ptr& scope) {
        value lhs = eval(*node.lhs, scope);
        const bool lhs_truthy = is_truthy(lhs);
        if (node.op == ast::logical_op::logical_or ? lhs_truthy : !lhs_truthy) {
            return lhs;
        }
        return eval(*node.rhs, scope);
    }

    value eval_node(const ast::call_expr& node, const env_ptr& scope) {
        const value callee = eval(*node.callee, scope);
        if (!is_function(callee)) {
            throw not_callable_error(kind_of(callee));
        }

        std::vector<value> args;
        args.reserve(node.args.size());
        for (const auto& arg : node.args) {
            args.push_back(eval(*arg, scope));
        }
        return call(callee, args);
    }

    value eval_node(const ast::function_expr& node, const env_ptr& scope) {
        return make_function(make_closure(node.decl->name, node.decl, scope, owner_.next_function_id()));
    }

    interpreter& owner_;
};

interpreter::interpreter(runtime_config config) : config_(std::move(config)) {
    if (config_.max_call_depth == 0 || config_.max_call_depth > max_call_depth_ceiling) {
        throw std::invalid_argument("interpreter: max_call_depth must be between 1 and " +
                                    std::to_string(max_call_depth_ceiling));
    }
    if (!config_.output) {
        config_.output = std::make_shared<stream_output_sink>(std::cout);
    }
}

interpreter::~interpreter() = default;

env_ptr interpreter::create_global_env() {
    env_ptr global = heap_.make_env();
    registrar r(global);
    install_core_builtins(r);
    if (config_.extension_register_hook) {
        config_.extension_register_hook(&r, config_.extension_register_user);
    }
    return global;
}

void interpreter::execute(const ast::program& prog, const env_ptr& global) {
    if (!global) {
        throw std::invalid_argument("execute: null global environment");
    }

    evaluator ev(*this);
    for (const auto& s : prog) {
        if (ev.exec(*s, global).returning) {
            break;
        }
    }
}

std::optional<eval_failure> interpreter::run(const ast::program& prog, const env_ptr& global) {
    log(log_level::info, "run", "begin: " + std::to_string(prog.size()) + " statements");
    try {
        execute(prog, global);
    } catch (const eval_error& e) {
        log(log_level::error, "error", std::string(error_kind_name(e.kind())) + ": " + e.what());
        return eval_failure{e.kind(), e.what()};
    }
    log(log_level::info, "run", "end");
    return std::nullopt;
}

std::optional<eval_failure> interpreter::run_source(std::string_view source, const env_ptr& global) {
    ast::program prog;
    try {
        prog = parse_program(source);
    } catch (const parse_error& e) {
        log(log_level::error, "error", std::string("syntax: ") + e.what());
        return eval_failure{error_kind::syntax, e.what()};
    }
    return run(prog, global);
}

std::optional<eval_failure> interpreter::run_file(const std::string& path, const env_ptr& global) {
    return run_source(read_text_file(path), global);
}

value interpreter::call(const value& callee, const std::vector<value>& args) {
    evaluator ev(*this);
    return ev.call(callee, args);
}

bool interpreter::log_enabled(log_level level) const noexcept {
    return config_.log && level >= config_.min_log_level;
}

void interpreter::log(log_level level, const char* category, const std::string& message) {
    if (!log_enabled(level)) {
        return;
    }

    log_record rec;
    rec.ts = std::chrono::steady_clock::now();
    rec.level = level;
    rec.call_depth = call_depth_;
    rec.category = category;
    rec.message = message;
    config_.log->write(rec);
}

std::string read_text_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace rlscript
