#include "rlscript/error.hpp"

namespace rlscript {

std::string_view error_kind_name(error_kind kind) noexcept {
    switch (kind) {
        case error_kind::syntax:
            return "syntax";
        case error_kind::undefined_variable:
            return "undefined_variable";
        case error_kind::not_callable:
            return "not_callable";
        case error_kind::arity_mismatch:
            return "arity_mismatch";
        case error_kind::type_mismatch:
            return "type_mismatch";
        case error_kind::recursion_limit:
            return "recursion_limit";
    }
    return "unknown";
}

}  // namespace rlscript
