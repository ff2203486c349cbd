#pragma once

#include <string>

#include "rlscript/ast.hpp"
#include "rlscript/value.hpp"

namespace rlscript {

std::string print_value(const value& v);
std::string format_number(double v);

// S-expression dumps used by `--dump-ast`, e.g. "(* (- 123) (group 45.67))".
std::string print_expr(const ast::expr& e);
std::string print_stmt(const ast::stmt& s);

}  // namespace rlscript
