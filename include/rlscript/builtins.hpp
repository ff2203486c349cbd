#pragma once

#include "rlscript/extensions.hpp"

namespace rlscript {

void install_core_builtins(registrar& r);

}  // namespace rlscript
