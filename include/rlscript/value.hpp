#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rlscript {

namespace ast {
struct function_decl;
}

struct env;
struct function_object;

using env_ptr = std::shared_ptr<env>;
using function_ptr = std::shared_ptr<function_object>;

enum class value_type {
    nil,
    boolean,
    number,
    string,
    function
};

class value {
public:
    using storage = std::variant<std::monostate, bool, double, std::string, function_ptr>;

    value() = default;
    explicit value(storage data) : data_(std::move(data)) {}

    [[nodiscard]] const storage& data() const noexcept { return data_; }

private:
    storage data_;
};

using native_fn = std::function<value(const std::vector<value>&)>;

// A function value's identity. Copies of a function value alias one object.
struct function_object {
    std::string name;
    std::uint64_t id = 0;

    std::shared_ptr<const ast::function_decl> definition;
    env_ptr closure;

    std::size_t native_arity = 0;
    native_fn native;

    [[nodiscard]] bool is_native() const noexcept { return static_cast<bool>(native); }
    [[nodiscard]] std::size_t arity() const noexcept;
};

value make_nil();
value make_boolean(bool v);
value make_number(double v);
value make_string(const std::string& text);
value make_function(function_ptr fn);
function_ptr make_closure(std::string name,
                          std::shared_ptr<const ast::function_decl> definition,
                          env_ptr captured_env,
                          std::uint64_t id);
function_ptr make_native(std::string name, std::size_t arity, native_fn fn, std::uint64_t id = 0);

[[nodiscard]] value_type type_of(const value& v) noexcept;
[[nodiscard]] std::string_view type_name(value_type t) noexcept;

[[nodiscard]] bool is_nil(const value& v) noexcept;
[[nodiscard]] bool is_boolean(const value& v) noexcept;
[[nodiscard]] bool is_number(const value& v) noexcept;
[[nodiscard]] bool is_string(const value& v) noexcept;
[[nodiscard]] bool is_function(const value& v) noexcept;

[[nodiscard]] bool boolean_value(const value& v);
[[nodiscard]] double number_value(const value& v);
[[nodiscard]] const std::string& string_value(const value& v);
[[nodiscard]] const function_ptr& function_value(const value& v);

[[nodiscard]] bool eq_values(const value& lhs, const value& rhs);

}  // namespace rlscript
