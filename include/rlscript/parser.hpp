#pragma once

#include <string_view>

#include "rlscript/ast.hpp"

namespace rlscript {

ast::program parse_program(std::string_view source);

}  // namespace rlscript
