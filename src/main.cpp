#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "rlscript/error.hpp"
#include "rlscript/eval.hpp"
#include "rlscript/logging.hpp"
#include "rlscript/parser.hpp"
#include "rlscript/printer.hpp"

namespace {

constexpr const char* k_version = "rlscript 0.3.0";

struct cli_options {
    bool trace = false;
    bool dump_ast = false;
    bool show_help = false;
    bool show_version = false;
    std::size_t max_depth = 512;
    std::string script_path;
};

void print_usage(std::ostream& out) {
    out << "usage: rlscript [options] [script.rl]\n"
           "  --trace           write debug log records to stderr\n"
           "  --dump-ast        print the parsed AST instead of executing\n"
           "  --max-depth N     maximum call depth, 1..1024 (default 512)\n"
           "  -h, --help        show this message\n"
           "  -v, --version     show version\n";
}

// Returns nullopt after reporting the problem on stderr.
std::optional<cli_options> parse_args(int argc, char** argv) {
    cli_options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--trace") {
            opts.trace = true;
        } else if (arg == "--dump-ast") {
            opts.dump_ast = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            opts.show_version = true;
        } else if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                std::cerr << "rlscript: --max-depth requires a value\n";
                return std::nullopt;
            }
            const std::string text = argv[++i];
            const std::optional<std::size_t> parsed = rlscript::parse_call_depth(text);
            if (!parsed) {
                std::cerr << "rlscript: invalid --max-depth value '" << text << "' (expected 1.."
                          << rlscript::max_call_depth_ceiling << ")\n";
                return std::nullopt;
            }
            opts.max_depth = *parsed;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "rlscript: unknown option '" << arg << "'\n";
            return std::nullopt;
        } else if (opts.script_path.empty()) {
            opts.script_path = arg;
        } else {
            std::cerr << "rlscript: only one script may be given\n";
            return std::nullopt;
        }
    }
    return opts;
}

void report(const rlscript::eval_failure& failure) {
    if (failure.kind == rlscript::error_kind::syntax) {
        std::cerr << "parse error: " << failure.message << '\n';
        return;
    }
    std::cerr << "error [" << rlscript::error_kind_name(failure.kind) << "]: " << failure.message << '\n';
}

int dump_ast(const std::string& source) {
    try {
        const rlscript::ast::program prog = rlscript::parse_program(source);
        for (const auto& s : prog) {
            std::cout << rlscript::print_stmt(*s) << '\n';
        }
    } catch (const rlscript::parse_error& e) {
        std::cerr << "parse error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}

int run_script(rlscript::interpreter& interp, const cli_options& opts) {
    if (opts.dump_ast) {
        return dump_ast(rlscript::read_text_file(opts.script_path));
    }

    rlscript::env_ptr global = interp.create_global_env();
    if (const auto failure = interp.run_file(opts.script_path, global)) {
        report(*failure);
        return 1;
    }
    return 0;
}

bool is_quit_command(const std::string& line) {
    return line == ":q" || line == "quit" || line == "exit";
}

int run_repl(rlscript::interpreter& interp, const cli_options& opts) {
    rlscript::env_ptr global = interp.create_global_env();
    std::string buffer;
    while (true) {
        std::cout << (buffer.empty() ? "rl> " : "... ");
        std::cout.flush();

        std::string line;
        if (!std::getline(std::cin, line)) {
            std::cout << '\n';
            break;
        }

        if (buffer.empty() && is_quit_command(line)) {
            break;
        }

        buffer += line;
        buffer.push_back('\n');

        rlscript::ast::program prog;
        try {
            prog = rlscript::parse_program(buffer);
        } catch (const rlscript::parse_error& e) {
            if (e.incomplete()) {
                continue;
            }
            std::cerr << "parse error: " << e.what() << '\n';
            buffer.clear();
            continue;
        }
        buffer.clear();

        if (opts.dump_ast) {
            for (const auto& s : prog) {
                std::cout << rlscript::print_stmt(*s) << '\n';
            }
            continue;
        }

        if (const auto failure = interp.run(prog, global)) {
            report(*failure);
        }
    }

    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const std::optional<cli_options> opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(std::cerr);
        return 2;
    }
    if (opts->show_help) {
        print_usage(std::cout);
        return 0;
    }
    if (opts->show_version) {
        std::cout << k_version << '\n';
        return 0;
    }

    try {
        rlscript::runtime_config config;
        config.max_call_depth = opts->max_depth;
        if (opts->trace) {
            config.log = std::make_shared<rlscript::stream_log_sink>(std::cerr);
            config.min_log_level = rlscript::log_level::debug;
        }

        rlscript::interpreter interp(std::move(config));
        if (!opts->script_path.empty()) {
            return run_script(interp, *opts);
        }
        return run_repl(interp, *opts);
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
