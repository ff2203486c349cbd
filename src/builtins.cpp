#include "rlscript/builtins.hpp"

#include <chrono>
#include <vector>

namespace rlscript {
namespace {

value builtin_clock(const std::vector<value>&) {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return make_number(std::chrono::duration<double>(since_epoch).count());
}

}  // namespace

void install_core_builtins(registrar& r) {
    r.register_builtin("clock", 0, builtin_clock);
}

}  // namespace rlscript
