#include "rlscript/lexer.hpp"

#include <cctype>
#include <cstdlib>
#include <string>
#include <unordered_map>

#include "rlscript/error.hpp"

namespace rlscript {
namespace {

const std::unordered_map<std::string_view, token_type>& keywords() {
    static const std::unordered_map<std::string_view, token_type> table = {
        {"and", token_type::kw_and},
        {"else", token_type::kw_else},
        {"false", token_type::kw_false},
        {"fn", token_type::kw_fn},
        {"for", token_type::kw_for},
        {"if", token_type::kw_if},
        {"nil", token_type::kw_nil},
        {"or", token_type::kw_or},
        {"print", token_type::kw_print},
        {"return", token_type::kw_return},
        {"true", token_type::kw_true},
        {"var", token_type::kw_var},
        {"while", token_type::kw_while},
    };
    return table;
}

[[nodiscard]] bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

[[nodiscard]] bool is_ident_char(char c) {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

[[nodiscard]] bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

class scanner {
public:
    explicit scanner(std::string_view source) : source_(source) {}

    std::vector<token> scan_all() {
        std::string errors;
        std::vector<token> tokens;

        while (true) {
            skip_ws_and_comments();
            if (eof()) {
                break;
            }

            start_ = pos_;
            start_line_ = line_;
            start_column_ = column_;
            try {
                tokens.push_back(scan_token());
            } catch (const parse_error& e) {
                if (e.incomplete()) {
                    throw;
                }
                if (!errors.empty()) {
                    errors.push_back('\n');
                }
                errors += e.what();
            }
        }

        if (!errors.empty()) {
            throw parse_error(errors, false);
        }

        token end;
        end.type = token_type::eof;
        end.line = line_;
        end.column = column_;
        tokens.push_back(std::move(end));
        return tokens;
    }

private:
    [[nodiscard]] parse_error error_here(const std::string& message, bool incomplete) const {
        return parse_error("line " + std::to_string(start_line_) + ", column " + std::to_string(start_column_) + ": " +
                               message,
                           incomplete);
    }

    [[nodiscard]] bool eof() const {
        return pos_ >= source_.size();
    }

    [[nodiscard]] char peek() const {
        return eof() ? '\0' : source_[pos_];
    }

    [[nodiscard]] char peek_next() const {
        return pos_ + 1 >= source_.size() ? '\0' : source_[pos_ + 1];
    }

    char get() {
        const char c = source_[pos_++];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        return c;
    }

    bool match(char expected) {
        if (eof() || peek() != expected) {
            return false;
        }
        (void)get();
        return true;
    }

    void skip_ws_and_comments() {
        while (!eof()) {
            const char c = peek();
            if (std::isspace(static_cast<unsigned char>(c))) {
                (void)get();
                continue;
            }
            if (c == '/' && peek_next() == '/') {
                while (!eof() && peek() != '\n') {
                    (void)get();
                }
                continue;
            }
            break;
        }
    }

    [[nodiscard]] token make_token(token_type type) const {
        token out;
        out.type = type;
        out.lexeme = std::string(source_.substr(start_, pos_ - start_));
        out.line = start_line_;
        out.column = start_column_;
        return out;
    }

    token scan_token() {
        const char c = get();
        switch (c) {
            case '(':
                return make_token(token_type::left_paren);
            case ')':
                return make_token(token_type::right_paren);
            case '{':
                return make_token(token_type::left_brace);
            case '}':
                return make_token(token_type::right_brace);
            case ',':
                return make_token(token_type::comma);
            case '-':
                return make_token(token_type::minus);
            case '+':
                return make_token(token_type::plus);
            case ';':
                return make_token(token_type::semicolon);
            case '*':
                return make_token(token_type::star);
            case '/':
                return make_token(token_type::slash);
            case '!':
                return make_token(match('=') ? token_type::bang_equal : token_type::bang);
            case '=':
                return make_token(match('=') ? token_type::equal_equal : token_type::equal);
            case '<':
                return make_token(match('=') ? token_type::less_equal : token_type::less);
            case '>':
                return make_token(match('=') ? token_type::greater_equal : token_type::greater);
            case '"':
                return scan_string();
            default:
                break;
        }

        if (is_digit(c)) {
            return scan_number();
        }
        if (is_ident_start(c)) {
            return scan_identifier();
        }
        throw error_here(std::string("unexpected character '") + c + "'", false);
    }

    token scan_string() {
        std::string out;
        while (true) {
            if (eof()) {
                throw error_here("unterminated string", true);
            }

            const char c = get();
            if (c == '"') {
                token t = make_token(token_type::string);
                t.text = std::move(out);
                return t;
            }
            if (c == '\\') {
                if (eof()) {
                    throw error_here("unterminated string escape", true);
                }
                const char escaped = get();
                switch (escaped) {
                    case 'n':
                        out.push_back('\n');
                        break;
                    case 't':
                        out.push_back('\t');
                        break;
                    case 'r':
                        out.push_back('\r');
                        break;
                    case '"':
                        out.push_back('"');
                        break;
                    case '\\':
                        out.push_back('\\');
                        break;
                    default:
                        while (!eof() && get() != '"') {
                        }
                        throw error_here("unknown string escape", false);
                }
                continue;
            }
            out.push_back(c);
        }
    }

    token scan_number() {
        while (is_digit(peek())) {
            (void)get();
        }
        if (peek() == '.' && is_digit(peek_next())) {
            (void)get();
            while (is_digit(peek())) {
                (void)get();
            }
        }

        token t = make_token(token_type::number);
        char* parse_end = nullptr;
        t.number = std::strtod(t.lexeme.c_str(), &parse_end);
        if (parse_end != t.lexeme.c_str() + t.lexeme.size()) {
            throw error_here("malformed number '" + t.lexeme + "'", false);
        }
        return t;
    }

    token scan_identifier() {
        while (is_ident_char(peek())) {
            (void)get();
        }

        token t = make_token(token_type::identifier);
        const auto found = keywords().find(t.lexeme);
        if (found != keywords().end()) {
            t.type = found->second;
        }
        return t;
    }

    std::string_view source_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
    std::size_t start_ = 0;
    std::size_t start_line_ = 1;
    std::size_t start_column_ = 1;
};

}  // namespace

std::vector<token> scan_tokens(std::string_view source) {
    scanner s(source);
    return s.scan_all();
}

const char* token_type_name(token_type type) noexcept {
    switch (type) {
        case token_type::left_paren:
            return "'('";
        case token_type::right_paren:
            return "')'";
        case token_type::left_brace:
            return "'{'";
        case token_type::right_brace:
            return "'}'";
        case token_type::comma:
            return "','";
        case token_type::minus:
            return "'-'";
        case token_type::plus:
            return "'+'";
        case token_type::semicolon:
            return "';'";
        case token_type::slash:
            return "'/'";
        case token_type::star:
            return "'*'";
        case token_type::bang:
            return "'!'";
        case token_type::bang_equal:
            return "'!='";
        case token_type::equal:
            return "'='";
        case token_type::equal_equal:
            return "'=='";
        case token_type::greater:
            return "'>'";
        case token_type::greater_equal:
            return "'>='";
        case token_type::less:
            return "'<'";
        case token_type::less_equal:
            return "'<='";
        case token_type::identifier:
            return "identifier";
        case token_type::string:
            return "string";
        case token_type::number:
            return "number";
        case token_type::kw_and:
            return "'and'";
        case token_type::kw_else:
            return "'else'";
        case token_type::kw_false:
            return "'false'";
        case token_type::kw_fn:
            return "'fn'";
        case token_type::kw_for:
            return "'for'";
        case token_type::kw_if:
            return "'if'";
        case token_type::kw_nil:
            return "'nil'";
        case token_type::kw_or:
            return "'or'";
        case token_type::kw_print:
            return "'print'";
        case token_type::kw_return:
            return "'return'";
        case token_type::kw_true:
            return "'true'";
        case token_type::kw_var:
            return "'var'";
        case token_type::kw_while:
            return "'while'";
        case token_type::eof:
            return "end of input";
    }
    return "unknown";
}

}  // namespace rlscript
