#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "rlscript/env.hpp"
#include "rlscript/error.hpp"
#include "rlscript/eval.hpp"
#include "rlscript/extensions.hpp"
#include "rlscript/heap.hpp"
#include "rlscript/lexer.hpp"
#include "rlscript/logging.hpp"
#include "rlscript/output.hpp"
#include "rlscript/parser.hpp"
#include "rlscript/printer.hpp"

namespace {

const char* const k_counter_program = R"(
fn make_counter() {
    var count = 0;
    fn counter() {
        count = count + 1;
        print count;
    }
    return counter;
}
var counter1 = make_counter();
var counter2 = make_counter();
)";

void check(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

void check_close(double actual, double expected, double epsilon, const std::string& message) {
    if (std::fabs(actual - expected) > epsilon) {
        throw std::runtime_error(message + " (expected " + std::to_string(expected) + ", got " + std::to_string(actual) + ")");
    }
}

struct script_run {
    std::vector<std::string> lines;
    std::optional<rlscript::eval_failure> failure;
};

script_run run_script(const std::string& source, rlscript::runtime_config config = {}) {
    auto out = std::make_shared<rlscript::buffer_output_sink>();
    config.output = out;
    rlscript::interpreter interp(std::move(config));
    rlscript::env_ptr global = interp.create_global_env();

    script_run result;
    result.failure = interp.run_source(source, global);
    result.lines = out->lines();
    return result;
}

std::vector<std::string> run_ok(const std::string& source) {
    script_run result = run_script(source);
    if (result.failure) {
        throw std::runtime_error("unexpected failure: " + result.failure->message);
    }
    return result.lines;
}

rlscript::eval_failure run_failing(const std::string& source, rlscript::error_kind expected) {
    script_run result = run_script(source);
    check(result.failure.has_value(), "expected failure for: " + source);
    check(result.failure->kind == expected,
          "wrong error kind for: " + source + " (got " + std::string(rlscript::error_kind_name(result.failure->kind)) + ": " +
              result.failure->message + ")");
    return *result.failure;
}

std::string joined(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out += ",";
        }
        out += lines[i];
    }
    return out;
}

std::filesystem::path temp_file_path(const std::string& stem) {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("rlscript_" + stem + "_" + std::to_string(now) + ".rl");
}

void write_text_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("failed to open file for test write: " + path.string());
    }
    out << content;
    if (!out) {
        throw std::runtime_error("failed while writing test file: " + path.string());
    }
}

void test_lexer_tokens() {
    using namespace rlscript;

    const std::vector<token> tokens = scan_tokens("var x = \"a\\n\"; // trailing\nx >= 1.5;");
    check(tokens.size() == 10, "unexpected token count: " + std::to_string(tokens.size()));
    check(tokens[0].type == token_type::kw_var, "var keyword");
    check(tokens[1].type == token_type::identifier && tokens[1].lexeme == "x", "identifier");
    check(tokens[3].type == token_type::string && tokens[3].text == "a\n", "string escape decoding");
    check(tokens[5].line == 2 && tokens[5].column == 1, "line/column tracking after comment");
    check(tokens[6].type == token_type::greater_equal, ">= operator");
    check_close(tokens[7].number, 1.5, 1e-12, "number literal");
    check(tokens.back().type == token_type::eof, "eof token");

    bool threw = false;
    try {
        (void)scan_tokens("print \"open");
    } catch (const parse_error& e) {
        threw = e.incomplete();
    }
    check(threw, "unterminated string should be incomplete");

    threw = false;
    try {
        (void)scan_tokens("print @;");
    } catch (const parse_error& e) {
        threw = !e.incomplete() && std::string(e.what()).find("unexpected character '@'") != std::string::npos;
    }
    check(threw, "unexpected character should be a hard error");
}

void test_parser_and_ast_dump() {
    using namespace rlscript;

    ast::program prog = parse_program("-123 * (45.67);");
    check(prog.size() == 1, "one statement expected");
    check(print_stmt(*prog[0]) == "(* (- 123) (group 45.67))", "ast dump: " + print_stmt(*prog[0]));

    prog = parse_program("fn add(a, b) { return a + b; } print add(1, 2);");
    check(print_stmt(*prog[0]) == "(fn add (a b) (return (+ (var a) (var b))))", "fn dump: " + print_stmt(*prog[0]));
    check(print_stmt(*prog[1]) == "(print (call (var add) 1 2))", "call dump: " + print_stmt(*prog[1]));

    prog = parse_program("for (var i = 0; i < 3; i = i + 1) print i;");
    check(print_stmt(*prog[0]) == "(block (var i 0) (while (< (var i) 3) (block (print (var i)) (i = (+ (var i) 1)))))",
          "for desugaring: " + print_stmt(*prog[0]));

    prog = parse_program("var s = \"q\\\"\"; var f = fn (x) { return x; };");
    check(print_stmt(*prog[0]) == "(var s \"q\\\"\")", "string literal dump: " + print_stmt(*prog[0]));
    check(print_stmt(*prog[1]) == "(var f (fn (x) (return (var x))))", "anonymous fn dump: " + print_stmt(*prog[1]));
}

void test_parse_errors_and_incomplete_input() {
    using namespace rlscript;

    auto parse_failure = [](const std::string& source) -> std::optional<parse_error> {
        try {
            (void)parse_program(source);
        } catch (const parse_error& e) {
            return e;
        }
        return std::nullopt;
    };

    std::optional<parse_error> e = parse_failure("fn f() {");
    check(e && e->incomplete(), "open function body should be incomplete");
    e = parse_failure("print 1");
    check(e && e->incomplete(), "missing semicolon at end should be incomplete");
    e = parse_failure("print 1 +;");
    check(e && !e->incomplete(), "missing operand is a hard error");
    check(std::string(e->what()).find("expected expression") != std::string::npos, "expected expression message");

    e = parse_failure("return 1;");
    check(e && !e->incomplete(), "top-level return is a hard error");
    check(std::string(e->what()).find("cannot return from top-level code") != std::string::npos, "top-level return message");

    e = parse_failure("1 = 2;");
    check(e && std::string(e->what()).find("invalid assignment target") != std::string::npos, "invalid assignment target");

    e = parse_failure("var = 1;\nprint ;\n");
    check(e.has_value(), "two bad statements should fail");
    const std::string message = e->what();
    check(message.find("line 1") != std::string::npos && message.find("line 2") != std::string::npos,
          "parser should report every statement-level error: " + message);

    const rlscript::eval_failure failure = run_failing("print 1;\nprint (;", error_kind::syntax);
    check(failure.message.find("line 2") != std::string::npos, "syntax failure carries the line");
}

void test_deep_nesting_is_reported() {
    using namespace rlscript;

    auto repeated = [](const std::string& piece, std::size_t count) {
        std::string out;
        out.reserve(piece.size() * count);
        for (std::size_t i = 0; i < count; ++i) {
            out += piece;
        }
        return out;
    };
    auto expect_too_deep = [](const std::string& source, const std::string& label) {
        const eval_failure failure = run_failing(source, error_kind::syntax);
        check(failure.message.find("nested too deeply") != std::string::npos, label + ": " + failure.message.substr(0, 120));
    };

    expect_too_deep("print " + repeated("(", 100000) + "1" + repeated(")", 100000) + ";", "deep parentheses");
    expect_too_deep("print " + repeated("-", 30000) + "1;", "deep unary chain");
    expect_too_deep("print 1" + repeated("+1", 200000) + ";", "long binary chain");
    expect_too_deep(repeated("{", 100000) + repeated("}", 100000), "deep blocks");
    expect_too_deep(repeated("if (true) ", 10000) + "print 1;", "deep if chain");

    check(joined(run_ok("print " + repeated("(", 200) + "1" + repeated(")", 200) + ";")) == "1", "moderate grouping");
    check(joined(run_ok("print " + repeated("-", 100) + "1;")) == "1", "moderate unary chain");
    check(joined(run_ok("print 1" + repeated("+1", 499) + ";")) == "500", "moderate binary chain");

    const ast::program prog = parse_program("1 + 2 + 3;");
    const auto& stmt = std::get<ast::expression_stmt>(prog[0]->node);
    check(stmt.expression->height == 3, "left-nested sum height: " + std::to_string(stmt.expression->height));
}

void test_value_printing_and_equality() {
    using namespace rlscript;

    check(print_value(make_nil()) == "nil", "nil print");
    check(print_value(make_boolean(true)) == "true", "true print");
    check(print_value(make_number(3)) == "3", "integral number print");
    check(print_value(make_number(-0.5)) == "-0.5", "fractional number print");
    check(print_value(make_number(1e20)) == "1e+20", "large number print");
    check(print_value(make_number(std::numeric_limits<double>::infinity())) == "inf", "inf print");
    check(print_value(make_string("hi")) == "hi", "raw string print");

    check(eq_values(make_number(2), make_number(2)), "number equality");
    check(!eq_values(make_number(0), make_boolean(false)), "different tags are never equal");
    check(!eq_values(make_string("1"), make_number(1)), "string and number differ");
    check(eq_values(make_nil(), make_nil()), "nil equals nil");

    const function_ptr fn = make_native("id", 1, [](const std::vector<value>& args) { return args[0]; });
    const value a = make_function(fn);
    const value b = a;
    check(eq_values(a, b), "copies of a function value alias one object");
    check(!eq_values(a, make_function(make_native("id", 1, [](const std::vector<value>& args) { return args[0]; }))),
          "distinct function objects are not equal");
    check(print_value(a) == "<native fn id/1>", "native print");

    bool threw = false;
    try {
        (void)number_value(make_string("x"));
    } catch (const eval_error& e) {
        threw = e.kind() == error_kind::type_mismatch;
    }
    check(threw, "accessor on wrong tag should raise type_mismatch");

    threw = false;
    try {
        (void)make_function(nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "null function should be rejected");
}

void test_environment_binding_rules() {
    using namespace rlscript;

    env_ptr global = make_env();
    define(global, "a", make_number(1));
    env_ptr inner = make_env(global);
    define(inner, "b", make_number(2));

    check(number_value(lookup(inner, "a")) == 1, "lookup walks to parent");
    check(resolve(inner, "a") == global, "resolve finds defining scope");
    check(resolve(inner, "b") == inner, "resolve finds local scope");
    check(resolve(inner, "missing") == nullptr, "resolve returns null when unbound");
    check(scope_depth(inner) == 1 && scope_depth(global) == 0, "scope depth");

    define(inner, "a", make_number(10));
    check(number_value(lookup(inner, "a")) == 10, "shadowing in child");
    check(number_value(lookup(global, "a")) == 1, "shadowing leaves parent intact");

    assign(inner, "b", make_number(5));
    check(number_value(lookup(inner, "b")) == 5, "assign overwrites nearest binding");

    env_ptr sibling = make_env(global);
    assign(sibling, "a", make_number(7));
    check(number_value(lookup(global, "a")) == 7, "assign updates the defining ancestor");
    check(sibling->bindings.empty(), "assign must not create a local binding");

    bool threw = false;
    try {
        assign(sibling, "nope", make_nil());
    } catch (const name_error& e) {
        threw = e.name() == "nope" && e.kind() == error_kind::undefined_variable;
    }
    check(threw, "assign to unbound name should raise name_error");
    check(resolve(sibling, "nope") == nullptr, "failed assign must not introduce a binding");

    threw = false;
    try {
        (void)lookup(inner, "ghost");
    } catch (const name_error& e) {
        threw = std::string(e.what()) == "undefined variable 'ghost'";
    }
    check(threw, "lookup of unbound name should raise name_error");
}

void test_counter_closures() {
    const std::string sequential = std::string(k_counter_program) + "counter1(); counter1(); counter2(); counter2();";
    check(joined(run_ok(sequential)) == "1,2,1,2", "sequential counters: " + joined(run_ok(sequential)));

    const std::string interleaved = std::string(k_counter_program) + "counter1(); counter2(); counter1(); counter2();";
    check(joined(run_ok(interleaved)) == "1,1,2,2", "interleaved counters: " + joined(run_ok(interleaved)));
}

void test_counter_driven_from_host() {
    using namespace rlscript;

    auto out = std::make_shared<buffer_output_sink>();
    runtime_config config;
    config.output = out;
    interpreter interp(config);
    env_ptr global = interp.create_global_env();
    check(!interp.run_source(k_counter_program, global), "counter program should run");

    const value counter1 = lookup(global, "counter1");
    const value counter2 = lookup(global, "counter2");
    check(!eq_values(counter1, counter2), "each make_counter call yields a distinct function");

    (void)interp.call(counter1, {});
    (void)interp.call(counter1, {});
    (void)interp.call(counter2, {});
    check(out->joined(",") == "1,2,1", "host calls share the captured state: " + out->joined(","));

    const env_ptr captured = function_value(counter1)->closure;
    check(number_value(lookup(captured, "count")) == 2, "captured count mutated in defining scope");
    check(captured->parent == global, "make_counter frame is parented to the global scope");

    bool threw = false;
    try {
        (void)interp.call(counter1, {make_number(1)});
    } catch (const arity_error& e) {
        threw = e.expected() == 0 && e.got() == 1;
    }
    check(threw, "host call with wrong arity should raise arity_error");
}

void test_deterministic_reruns() {
    const std::string program = std::string(k_counter_program) +
                                "print counter1; print counter2; print make_counter; print clock;"
                                "counter1(); counter2(); counter2();";
    const std::vector<std::string> first = run_ok(program);
    const std::vector<std::string> second = run_ok(program);
    check(first == second, "fresh runs should produce identical output");
    check(first.size() == 7, "unexpected line count");
    check(first[0] == "<fn counter/0 #2>" && first[1] == "<fn counter/0 #3>", "function identity tokens: " + first[0]);
    check(first[2] == "<fn make_counter/0 #1>", "named function token: " + first[2]);
    check(first[3] == "<native fn clock/0>", "native token: " + first[3]);
}

void test_lexical_scope_not_call_site() {
    const std::vector<std::string> lines = run_ok(R"(
var x = "global";
fn show() { print x; }
fn wrapper() {
    var x = "local";
    show();
}
wrapper();
{
    var x = "block";
    show();
}
)");
    check(joined(lines) == "global,global", "closures resolve in defining scope: " + joined(lines));

    const std::vector<std::string> outer = run_ok(R"(
fn outer() {
    var secret = "inner";
    fn reveal() { return secret; }
    return reveal;
}
var secret = "shadow";
print outer()();
)");
    check(joined(outer) == "inner", "returned closure keeps its defining frame");
}

void test_independent_invocations() {
    const std::vector<std::string> lines = run_ok(R"(
fn make_account(balance) {
    fn deposit(amount) {
        balance = balance + amount;
        return balance;
    }
    return deposit;
}
var a = make_account(100);
var b = make_account(5);
print a(10);
print b(1);
print a(10);
)");
    check(joined(lines) == "110,6,120", "each invocation owns its parameters: " + joined(lines));
}

void test_error_kinds() {
    using namespace rlscript;

    rlscript::eval_failure f = run_failing("print y;", error_kind::undefined_variable);
    check(f.message == "undefined variable 'y'", "undefined message: " + f.message);

    run_failing("z = 1;", error_kind::undefined_variable);

    f = run_failing("var a = 1; a();", error_kind::not_callable);
    check(f.message == "attempt to call non-function value of type number", "not callable message: " + f.message);

    f = run_failing("var a = \"s\"; a(undefined_arg);", error_kind::not_callable);
    check(f.message.find("string") != std::string::npos, "callee is checked before arguments");

    f = run_failing("fn f(a) {} f(1, 2);", error_kind::arity_mismatch);
    check(f.message == "f: expected 1 arguments, got 2", "arity message: " + f.message);

    f = run_failing("print 1 + true;", error_kind::type_mismatch);
    check(f.message == "operator '+' is not defined for number and bool", "type message: " + f.message);

    run_failing("print -\"a\";", error_kind::type_mismatch);
    run_failing("print 3 + \"a\";", error_kind::type_mismatch);
    run_failing("print 1 < \"a\";", error_kind::type_mismatch);

    f = run_failing("fn f() {} if (f) print 1;", error_kind::type_mismatch);
    check(f.message.find("condition") != std::string::npos, "function as condition: " + f.message);
}

void test_first_error_halts_run() {
    using namespace rlscript;

    script_run result = run_script("print 1; print missing; print 2;");
    check(result.failure && result.failure->kind == error_kind::undefined_variable, "expected undefined variable");
    check(joined(result.lines) == "1", "output before the failure stays, nothing after runs");

    result = run_script("fn side() { print \"arg\"; return 1; } fn f(a) {} f(side(), side());");
    check(result.failure && result.failure->kind == error_kind::arity_mismatch, "expected arity mismatch");
    check(joined(result.lines) == "arg,arg", "arguments are evaluated before the arity check");
}

void test_return_semantics() {
    const std::vector<std::string> lines = run_ok(R"(
fn early() {
    print "before";
    return "done";
    print "after";
}
print early();
fn nothing() {}
print nothing();
fn bare() { return; }
print bare();
fn find(limit) {
    var i = 0;
    while (true) {
        if (i == limit) return i * 10;
        i = i + 1;
    }
}
print find(4);
)");
    check(joined(lines) == "before,done,nil,nil,40", "return semantics: " + joined(lines));
}

void test_control_flow_and_operators() {
    std::vector<std::string> lines = run_ok(R"(
var a = 0;
var b = 1;
for (var i = 0; i < 10; i = i + 1) {
    print a;
    var t = a + b;
    a = b;
    b = t;
}
)");
    check(joined(lines) == "0,1,1,2,3,5,8,13,21,34", "fibonacci: " + joined(lines));

    lines = run_ok(R"(
print nil or "x";
print 0 and 1;
print 1 and 2;
print !"";
print "n=" + 3;
print "a" + "b";
print 7 / 2;
print 1 / 0;
print "abc" < "abd";
print 2 >= 2;
print 1 != 1;
if (0) print "zero"; else print "falsy";
)");
    check(joined(lines) == "x,0,2,true,n=3,ab,3.5,inf,true,true,false,falsy", "operators: " + joined(lines));

    lines = run_ok(R"(
var a = 1;
{
    var a = 2;
    print a;
}
print a;
{
    a = 5;
}
print a;
)");
    check(joined(lines) == "2,1,5", "block scoping: " + joined(lines));
}

void test_recursion_and_depth_limit() {
    using namespace rlscript;

    const std::vector<std::string> lines = run_ok(R"(
fn fib(n) {
    if (n < 2) return n;
    return fib(n - 1) + fib(n - 2);
}
print fib(15);
var apply = fn (f, x) { return f(x); };
print apply(fn (n) { return n * n; }, 9);
)");
    check(joined(lines) == "610,81", "recursion and anonymous functions: " + joined(lines));

    runtime_config config;
    config.max_call_depth = 64;
    script_run result = run_script("fn down(n) { return down(n + 1); } down(0);", config);
    check(result.failure && result.failure->kind == error_kind::recursion_limit, "runaway recursion should be reported");
    check(result.failure->message.find("64") != std::string::npos, "limit in message: " + result.failure->message);

    result = run_script("fn down(n) { if (n == 0) return 0; return down(n - 1); } print down(60);", config);
    check(!result.failure && joined(result.lines) == "0", "recursion under the limit should succeed");
}

void test_call_depth_configuration() {
    using namespace rlscript;

    check(parse_call_depth("64") == std::optional<std::size_t>(64), "plain depth accepted");
    check(parse_call_depth("1024") == std::optional<std::size_t>(max_call_depth_ceiling), "ceiling accepted");
    for (const char* text : {"-5", "0", "", "+5", " 5", "5x", "1025", "99999999999999999999999"}) {
        check(!parse_call_depth(text), std::string("depth should be rejected: '") + text + "'");
    }

    for (const std::size_t depth : {std::size_t{0}, std::size_t{5000}}) {
        runtime_config config;
        config.max_call_depth = depth;
        bool threw = false;
        try {
            interpreter interp(config);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "interpreter should reject max_call_depth " + std::to_string(depth));
    }
}

void test_heap_reclamation() {
    using namespace rlscript;

    auto out = std::make_shared<buffer_output_sink>();
    runtime_config config;
    config.output = out;
    interpreter interp(config);
    env_ptr global = interp.create_global_env();
    check(!interp.run_source(std::string(k_counter_program) + "counter1(); counter1(); counter2(); counter2();", global),
          "counter program should run");

    heap_stats_snapshot stats = interp.memory().stats();
    check(stats.total_allocated_envs == 7, "global + 2 factory frames + 4 call frames: " +
                                               std::to_string(stats.total_allocated_envs));
    check(stats.live_envs == 3, "uncaptured call frames are reclaimed on return: " + std::to_string(stats.live_envs));

    std::weak_ptr<env> captured = function_value(lookup(global, "counter1"))->closure;
    interp.memory().collect();
    check(!captured.expired(), "frames reachable from the global scope survive collection");
    check(interp.memory().stats().live_envs == 3, "collection keeps every reachable frame");

    check(!interp.run_source("counter1 = nil; counter2 = nil;", global), "dropping the counters should run");
    check(!captured.expired(), "a frame cycle outlives its last outside reference until collected");
    interp.memory().collect();
    check(captured.expired(), "collection reclaims the unreachable frame cycle");
    stats = interp.memory().stats();
    check(stats.live_envs == 1, "only the global scope remains: " + std::to_string(stats.live_envs));
    check(stats.reclaimed_envs == 2, "both factory frames reclaimed: " + std::to_string(stats.reclaimed_envs));
    check(resolve(global, "make_counter") == global, "reachable scopes keep their bindings");

    std::weak_ptr<env> weak_global = global;
    global.reset();
    check(!weak_global.expired(), "make_counter's closure keeps the global scope in a cycle");
    interp.memory().collect();
    check(weak_global.expired(), "global reclaimed once the host drops it");
    check(interp.memory().stats().live_envs == 0, "no tracked environments remain");
}

void test_nested_helper_frames_stay_bounded() {
    using namespace rlscript;

    auto out = std::make_shared<buffer_output_sink>();
    runtime_config config;
    config.output = out;
    interpreter interp(config);
    env_ptr global = interp.create_global_env();
    check(!interp.run_source(R"(
fn work(n) {
    fn helper() { return n; }
    return helper() + 1;
}
var total = 0;
for (var i = 0; i < 5000; i = i + 1) {
    total = total + work(i);
}
print total;
)",
                             global),
          "helper loop should run");
    check(out->joined(",") == "12502500", "helper loop result: " + out->joined(","));

    heap_stats_snapshot stats = interp.memory().stats();
    check(stats.total_allocated_envs > 10000, "every iteration allocates frames");
    check(stats.collections > 0, "crossing the threshold triggers collection");
    check(stats.live_envs < 300, "self-referencing work frames are reclaimed while running: " +
                                     std::to_string(stats.live_envs));

    interp.memory().collect();
    check(interp.memory().stats().live_envs == 1, "only the global scope survives a full collection");
}

void test_teardown_keeps_host_held_closures() {
    using namespace rlscript;

    std::weak_ptr<env> dropped;
    value kept;
    {
        runtime_config config;
        config.output = std::make_shared<buffer_output_sink>();
        interpreter interp(config);
        env_ptr global = interp.create_global_env();
        check(!interp.run_source(std::string(k_counter_program) + "counter1(); var scratch = make_counter();", global),
              "counter program should run");
        kept = lookup(global, "counter1");
        dropped = function_value(lookup(global, "scratch"))->closure;
        check(!interp.run_source("scratch = nil;", global), "dropping scratch should run");
        global.reset();
        check(!dropped.expired(), "unreachable frame cycle stays until collected");
    }
    check(dropped.expired(), "interpreter teardown reclaims unreachable cycles");

    const env_ptr frame = function_value(kept)->closure;
    check(number_value(lookup(frame, "count")) == 1, "a closure the host kept still sees its captured state");
    check(frame->parent && resolve(frame, "counter2"), "the kept frame's enclosing scope is intact");

    // Cycles the host holds past teardown are the host's to break.
    const env_ptr outer = frame->parent;
    frame->bindings.clear();
    outer->bindings.clear();
}

void test_registrar_and_extension_hook() {
    using namespace rlscript;

    auto hook = [](registrar* r, void* user) {
        const double scale = *static_cast<double*>(user);
        r->register_builtin("scale", 1, [scale](const std::vector<value>& args) {
            return make_number(number_value(args[0]) * scale);
        });
        r->register_value("version", make_string("test"));
    };

    double factor = 2.5;
    auto out = std::make_shared<buffer_output_sink>();
    runtime_config config;
    config.output = out;
    config.extension_register_hook = hook;
    config.extension_register_user = &factor;
    interpreter interp(config);
    env_ptr global = interp.create_global_env();
    check(global->parent == nullptr, "global scope has no parent");

    check(!interp.run_source("print scale(4); print version; print scale;", global), "extension script should run");
    check(out->joined(",") == "10,test,<native fn scale/1>", "extension output: " + out->joined(","));

    std::optional<eval_failure> failure = interp.run_source("scale(1, 2);", global);
    check(failure && failure->kind == error_kind::arity_mismatch, "native arity is checked");

    registrar r(global);
    bool threw = false;
    try {
        r.register_builtin("clock", 0, [](const std::vector<value>&) { return make_nil(); });
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "duplicate builtin name should be rejected");

    threw = false;
    try {
        r.register_value("", make_nil());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "empty name should be rejected");

    out->clear();
    check(!interp.run_source("var t = clock(); print t > 0;", global), "clock should run");
    check(out->joined(",") == "true", "clock returns a positive number");
}

void test_logging_records() {
    using namespace rlscript;

    auto sink = std::make_shared<memory_log_sink>(64);
    runtime_config config;
    config.output = std::make_shared<buffer_output_sink>();
    config.log = sink;
    config.min_log_level = log_level::debug;

    script_run result = run_script("fn f(a) { return a; } f(1); print missing;", config);
    check(result.failure.has_value(), "script should fail");

    const std::vector<log_record> records = sink->snapshot();
    check(records.size() == 3, "begin, call and failure records expected: " + std::to_string(records.size()));
    check(records[0].category == "run" && records[0].level == log_level::info, "run begin record");
    check(records[1].category == "call" && records[1].message == "f/1", "call record: " + records[1].message);
    check(records[1].call_depth == 1 && records[1].level == log_level::debug, "call record depth and level");
    check(records[2].category == "error" && records[2].level == log_level::error, "failure record");
    check(records[2].sequence == 3, "records are sequenced");

    auto quiet = std::make_shared<memory_log_sink>(64);
    config.log = quiet;
    config.min_log_level = log_level::info;
    result = run_script("fn f() {} f();", config);
    check(!result.failure, "quiet script should run");
    check(quiet->size() == 2, "debug records are filtered at info level");

    memory_log_sink bounded(2);
    for (int i = 0; i < 3; ++i) {
        log_record rec;
        rec.message = std::to_string(i);
        bounded.write(rec);
    }
    const std::vector<log_record> kept = bounded.snapshot();
    check(kept.size() == 2 && kept[0].message == "1" && kept[1].message == "2", "ring drops the oldest record");
    bounded.clear();
    check(bounded.size() == 0 && bounded.capacity() == 2, "clear keeps capacity");
}

void test_run_file() {
    using namespace rlscript;

    const auto path = temp_file_path("counter");
    write_text_file(path, std::string(k_counter_program) + "counter1(); counter2(); counter1(); counter2();\n");

    auto out = std::make_shared<buffer_output_sink>();
    runtime_config config;
    config.output = out;
    interpreter interp(config);
    env_ptr global = interp.create_global_env();
    const std::optional<eval_failure> failure = interp.run_file(path.string(), global);
    std::filesystem::remove(path);
    check(!failure, "script file should run");
    check(out->joined(",") == "1,1,2,2", "script file output: " + out->joined(","));

    bool threw = false;
    try {
        (void)interp.run_file(temp_file_path("missing").string(), global);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("failed to open file") != std::string::npos;
    }
    check(threw, "missing script should raise an I/O error");
}

}  // namespace

int main() {
    const std::vector<std::pair<std::string, std::function<void()>>> tests = {
        {"lexer tokens", test_lexer_tokens},
        {"parser and ast dump", test_parser_and_ast_dump},
        {"parse errors and incomplete input", test_parse_errors_and_incomplete_input},
        {"deep nesting is reported", test_deep_nesting_is_reported},
        {"value printing and equality", test_value_printing_and_equality},
        {"environment binding rules", test_environment_binding_rules},
        {"counter closures", test_counter_closures},
        {"counter driven from host", test_counter_driven_from_host},
        {"deterministic reruns", test_deterministic_reruns},
        {"lexical scope not call site", test_lexical_scope_not_call_site},
        {"independent invocations", test_independent_invocations},
        {"error kinds", test_error_kinds},
        {"first error halts run", test_first_error_halts_run},
        {"return semantics", test_return_semantics},
        {"control flow and operators", test_control_flow_and_operators},
        {"recursion and depth limit", test_recursion_and_depth_limit},
        {"call depth configuration", test_call_depth_configuration},
        {"heap reclamation", test_heap_reclamation},
        {"nested helper frames stay bounded", test_nested_helper_frames_stay_bounded},
        {"teardown keeps host-held closures", test_teardown_keeps_host_held_closures},
        {"registrar and extension hook", test_registrar_and_extension_hook},
        {"logging records", test_logging_records},
        {"run file", test_run_file},
    };

    std::size_t passed = 0;
    for (const auto& [name, test_fn] : tests) {
        try {
            test_fn();
            ++passed;
            std::cout << "[PASS] " << name << '\n';
        } catch (const std::exception& e) {
            std::cerr << "[FAIL] " << name << ": " << e.what() << '\n';
            return 1;
        }
    }

    std::cout << "All tests passed (" << passed << "/" << tests.size() << ").\n";
    return 0;
}
