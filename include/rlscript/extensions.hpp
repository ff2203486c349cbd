#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "rlscript/env.hpp"
#include "rlscript/logging.hpp"
#include "rlscript/output.hpp"
#include "rlscript/value.hpp"

namespace rlscript {

class registrar {
public:
    explicit registrar(env_ptr global_env);

    void register_builtin(const std::string& full_name, std::size_t arity, native_fn fn);
    void register_value(const std::string& full_name, value bound_value);

private:
    void ensure_registerable_name(const std::string& full_name, const char* where) const;

    env_ptr global_env_;
};

using extension_register_hook_fn = void (*)(registrar* r, void* user);

// Deepest call nesting an interpreter accepts; each script call costs several native frames.
constexpr std::size_t max_call_depth_ceiling = 1024;

struct runtime_config {
    std::shared_ptr<output_sink> output;
    std::shared_ptr<log_sink> log;
    log_level min_log_level = log_level::info;
    std::size_t max_call_depth = 512;

    extension_register_hook_fn extension_register_hook = nullptr;
    void* extension_register_user = nullptr;
};

// Parses a decimal call depth in [1, max_call_depth_ceiling]; nullopt for anything else.
[[nodiscard]] std::optional<std::size_t> parse_call_depth(std::string_view text);

}  // namespace rlscript
