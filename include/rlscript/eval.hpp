#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rlscript/ast.hpp"
#include "rlscript/env.hpp"
#include "rlscript/error.hpp"
#include "rlscript/extensions.hpp"
#include "rlscript/heap.hpp"

namespace rlscript {

struct eval_failure {
    error_kind kind = error_kind::syntax;
    std::string message;
};

class interpreter {
public:
    explicit interpreter(runtime_config config = {});
    ~interpreter();

    interpreter(const interpreter&) = delete;
    interpreter& operator=(const interpreter&) = delete;

    env_ptr create_global_env();

    // Runs `prog` to completion or to its first error, which is returned rather than thrown.
    std::optional<eval_failure> run(const ast::program& prog, const env_ptr& global);
    std::optional<eval_failure> run_source(std::string_view source, const env_ptr& global);
    std::optional<eval_failure> run_file(const std::string& path, const env_ptr& global);

    // Throwing variant of run(): eval_error propagates to the caller.
    void execute(const ast::program& prog, const env_ptr& global);

    value call(const value& callee, const std::vector<value>& args);

    [[nodiscard]] const runtime_config& config() const noexcept { return config_; }
    [[nodiscard]] heap& memory() noexcept { return heap_; }

private:
    class evaluator;
    friend class evaluator;

    [[nodiscard]] bool log_enabled(log_level level) const noexcept;
    void log(log_level level, const char* category, const std::string& message);
    std::uint64_t next_function_id() noexcept { return next_function_id_++; }

    runtime_config config_;
    heap heap_;
    std::uint64_t next_function_id_ = 1;
    std::size_t call_depth_ = 0;
};

std::string read_text_file(const std::string& path);

}  // namespace rlscript
