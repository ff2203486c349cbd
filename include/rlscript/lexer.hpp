#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rlscript {

enum class token_type {
    left_paren,
    right_paren,
    left_brace,
    right_brace,
    comma,
    minus,
    plus,
    semicolon,
    slash,
    star,

    bang,
    bang_equal,
    equal,
    equal_equal,
    greater,
    greater_equal,
    less,
    less_equal,

    identifier,
    string,
    number,

    kw_and,
    kw_else,
    kw_false,
    kw_fn,
    kw_for,
    kw_if,
    kw_nil,
    kw_or,
    kw_print,
    kw_return,
    kw_true,
    kw_var,
    kw_while,

    eof
};

struct token {
    token_type type = token_type::eof;
    std::string lexeme;
    std::string text;   // decoded contents of string literals
    double number = 0.0;
    std::size_t line = 1;
    std::size_t column = 1;
};

// Throws parse_error; an unterminated string is reported as incomplete input.
std::vector<token> scan_tokens(std::string_view source);

const char* token_type_name(token_type type) noexcept;

}  // namespace rlscript
