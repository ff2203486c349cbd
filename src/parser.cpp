#include "rlscript/parser.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "rlscript/error.hpp"
#include "rlscript/lexer.hpp"

namespace rlscript {
namespace {

constexpr std::size_t max_arguments = 255;
constexpr std::size_t max_nesting = 256;
constexpr std::size_t max_expression_height = 1024;

class depth_scope {
public:
    explicit depth_scope(std::size_t& depth) : depth_(depth) { ++depth_; }
    ~depth_scope() { --depth_; }

    depth_scope(const depth_scope&) = delete;
    depth_scope& operator=(const depth_scope&) = delete;

private:
    std::size_t& depth_;
};

class parser {
public:
    explicit parser(std::vector<token> tokens) : tokens_(std::move(tokens)) {}

    ast::program parse_all() {
        ast::program prog;
        std::string errors;
        bool incomplete = true;

        while (!at_end()) {
            try {
                prog.push_back(declaration());
            } catch (const parse_error& e) {
                if (!errors.empty()) {
                    errors.push_back('\n');
                }
                errors += e.what();
                incomplete = incomplete && e.incomplete();
                synchronize();
            }
        }

        if (!errors.empty()) {
            throw parse_error(errors, incomplete);
        }
        return prog;
    }

private:
    [[nodiscard]] parse_error error_at(const token& t, const std::string& message) const {
        const bool at_eof = t.type == token_type::eof;
        std::string where = at_eof ? "end of input" : "'" + t.lexeme + "'";
        return parse_error("line " + std::to_string(t.line) + ", column " + std::to_string(t.column) + ": " + message +
                               " (at " + where + ")",
                           at_eof);
    }

    [[nodiscard]] const token& peek() const {
        return tokens_[pos_];
    }

    [[nodiscard]] const token& previous() const {
        return tokens_[pos_ - 1];
    }

    [[nodiscard]] bool at_end() const {
        return peek().type == token_type::eof;
    }

    [[nodiscard]] bool check(token_type type) const {
        return peek().type == type;
    }

    const token& advance() {
        if (!at_end()) {
            ++pos_;
        }
        return previous();
    }

    bool match(token_type type) {
        if (!check(type)) {
            return false;
        }
        (void)advance();
        return true;
    }

    const token& consume(token_type type, const std::string& message) {
        if (check(type)) {
            return advance();
        }
        throw error_at(peek(), message);
    }

    void check_nesting(const char* what) const {
        if (nesting_depth_ > max_nesting) {
            throw error_at(peek(), std::string(what) + " nested too deeply");
        }
    }

    // Builds a node over children at most `child_height` high. Bounding the height keeps
    // evaluation, printing and destruction of any accepted tree within the native stack.
    template <typename Node>
    ast::expr_ptr composite(Node node, std::size_t line, std::size_t child_height) {
        if (child_height >= max_expression_height) {
            throw error_at(previous(), "expression nested too deeply");
        }
        ast::expr_ptr out = ast::make_expr(std::move(node), line);
        out->height = child_height + 1;
        return out;
    }

    // Skips to the next statement boundary after an error.
    void synchronize() {
        (void)advance();
        while (!at_end()) {
            if (previous().type == token_type::semicolon) {
                return;
            }
            switch (peek().type) {
                case token_type::kw_fn:
                case token_type::kw_var:
                case token_type::kw_for:
                case token_type::kw_if:
                case token_type::kw_while:
                case token_type::kw_print:
                case token_type::kw_return:
                    return;
                default:
                    break;
            }
            (void)advance();
        }
    }

    ast::stmt_ptr declaration() {
        if (check(token_type::kw_fn) && tokens_[pos_ + 1].type == token_type::identifier) {
            (void)advance();
            return function_declaration();
        }
        if (match(token_type::kw_var)) {
            return var_declaration();
        }
        return statement();
    }

    ast::stmt_ptr function_declaration() {
        const token& name = consume(token_type::identifier, "expected function name");
        const std::size_t line = name.line;
        std::string fn_name = name.lexeme;
        consume(token_type::left_paren, "expected '(' after function name");
        return ast::make_stmt(ast::function_stmt{function_body(std::move(fn_name), line)}, line);
    }

    // Parses "PARAMS) { BODY }" once the opening parenthesis has been consumed.
    ast::function_decl_ptr function_body(std::string name, std::size_t line) {
        auto decl = std::make_shared<ast::function_decl>();
        decl->name = std::move(name);
        decl->line = line;

        if (!check(token_type::right_paren)) {
            do {
                if (decl->params.size() >= max_arguments) {
                    throw error_at(peek(), "cannot have more than 255 parameters");
                }
                decl->params.push_back(consume(token_type::identifier, "expected parameter name").lexeme);
            } while (match(token_type::comma));
        }
        consume(token_type::right_paren, "expected ')' after parameters");
        consume(token_type::left_brace, "expected '{' before function body");

        depth_scope nested(nesting_depth_);
        check_nesting("function");
        depth_scope scope(function_depth_);
        decl->body = block_statements();
        return decl;
    }

    ast::stmt_ptr var_declaration() {
        const token& name = consume(token_type::identifier, "expected variable name");
        ast::var_stmt node;
        node.name = name.lexeme;
        const std::size_t line = name.line;
        if (match(token_type::equal)) {
            node.initializer = expression();
        }
        consume(token_type::semicolon, "expected ';' after variable declaration");
        return ast::make_stmt(std::move(node), line);
    }

    ast::stmt_ptr statement() {
        depth_scope nested(nesting_depth_);
        check_nesting("statement");

        if (match(token_type::kw_print)) {
            const std::size_t line = previous().line;
            ast::expr_ptr value = expression();
            consume(token_type::semicolon, "expected ';' after value");
            return ast::make_stmt(ast::print_stmt{std::move(value)}, line);
        }
        if (match(token_type::left_brace)) {
            const std::size_t line = previous().line;
            return ast::make_stmt(ast::block_stmt{block_statements()}, line);
        }
        if (match(token_type::kw_if)) {
            return if_statement();
        }
        if (match(token_type::kw_while)) {
            return while_statement();
        }
        if (match(token_type::kw_for)) {
            return for_statement();
        }
        if (match(token_type::kw_return)) {
            return return_statement();
        }

        const std::size_t line = peek().line;
        ast::expr_ptr value = expression();
        consume(token_type::semicolon, "expected ';' after expression");
        return ast::make_stmt(ast::expression_stmt{std::move(value)}, line);
    }

    std::vector<ast::stmt_ptr> block_statements() {
        std::vector<ast::stmt_ptr> statements;
        while (!check(token_type::right_brace) && !at_end()) {
            statements.push_back(declaration());
        }
        consume(token_type::right_brace, "expected '}' after block");
        return statements;
    }

    ast::stmt_ptr if_statement() {
        const std::size_t line = previous().line;
        consume(token_type::left_paren, "expected '(' after 'if'");
        ast::if_stmt node;
        node.condition = expression();
        consume(token_type::right_paren, "expected ')' after if condition");
        node.then_branch = statement();
        if (match(token_type::kw_else)) {
            node.else_branch = statement();
        }
        return ast::make_stmt(std::move(node), line);
    }

    ast::stmt_ptr while_statement() {
        const std::size_t line = previous().line;
        consume(token_type::left_paren, "expected '(' after 'while'");
        ast::while_stmt node;
        node.condition = expression();
        consume(token_type::right_paren, "expected ')' after condition");
        node.body = statement();
        return ast::make_stmt(std::move(node), line);
    }

    // for (init; cond; step) body  =>  { init; while (cond) { body; step; } }
    ast::stmt_ptr for_statement() {
        const std::size_t line = previous().line;
        consume(token_type::left_paren, "expected '(' after 'for'");

        ast::stmt_ptr initializer;
        if (match(token_type::kw_var)) {
            initializer = var_declaration();
        } else if (!match(token_type::semicolon)) {
            const std::size_t init_line = peek().line;
            ast::expr_ptr init = expression();
            consume(token_type::semicolon, "expected ';' after loop initializer");
            initializer = ast::make_stmt(ast::expression_stmt{std::move(init)}, init_line);
        }

        ast::expr_ptr condition;
        if (!check(token_type::semicolon)) {
            condition = expression();
        }
        consume(token_type::semicolon, "expected ';' after loop condition");

        ast::expr_ptr increment;
        if (!check(token_type::right_paren)) {
            increment = expression();
        }
        consume(token_type::right_paren, "expected ')' after for clauses");

        ast::stmt_ptr body = statement();
        if (increment) {
            ast::block_stmt with_step;
            with_step.statements.push_back(std::move(body));
            with_step.statements.push_back(ast::make_stmt(ast::expression_stmt{std::move(increment)}, line));
            body = ast::make_stmt(std::move(with_step), line);
        }

        if (!condition) {
            condition = ast::make_expr(ast::literal_expr{make_boolean(true)}, line);
        }
        ast::stmt_ptr loop = ast::make_stmt(ast::while_stmt{std::move(condition), std::move(body)}, line);

        if (!initializer) {
            return loop;
        }
        ast::block_stmt outer;
        outer.statements.push_back(std::move(initializer));
        outer.statements.push_back(std::move(loop));
        return ast::make_stmt(std::move(outer), line);
    }

    ast::stmt_ptr return_statement() {
        const token& keyword = previous();
        if (function_depth_ == 0) {
            throw error_at(keyword, "cannot return from top-level code");
        }
        const std::size_t line = keyword.line;
        ast::return_stmt node;
        if (!check(token_type::semicolon)) {
            node.result = expression();
        }
        consume(token_type::semicolon, "expected ';' after return value");
        return ast::make_stmt(std::move(node), line);
    }

    ast::expr_ptr expression() {
        return assignment();
    }

    ast::expr_ptr assignment() {
        depth_scope nested(nesting_depth_);
        check_nesting("expression");

        ast::expr_ptr target = logic_or();

        if (match(token_type::equal)) {
            const token& equals = previous();
            ast::expr_ptr assigned = assignment();

            if (const auto* variable = std::get_if<ast::variable_expr>(&target->node)) {
                const std::size_t height = assigned->height;
                return composite(ast::assign_expr{variable->name, std::move(assigned)}, target->line, height);
            }
            throw error_at(equals, "invalid assignment target");
        }
        return target;
    }

    ast::expr_ptr logic_or() {
        ast::expr_ptr lhs = logic_and();
        while (match(token_type::kw_or)) {
            const std::size_t line = previous().line;
            ast::expr_ptr rhs = logic_and();
            const std::size_t height = std::max(lhs->height, rhs->height);
            lhs = composite(ast::logical_expr{ast::logical_op::logical_or, std::move(lhs), std::move(rhs)}, line, height);
        }
        return lhs;
    }

    ast::expr_ptr logic_and() {
        ast::expr_ptr lhs = equality();
        while (match(token_type::kw_and)) {
            const std::size_t line = previous().line;
            ast::expr_ptr rhs = equality();
            const std::size_t height = std::max(lhs->height, rhs->height);
            lhs = composite(ast::logical_expr{ast::logical_op::logical_and, std::move(lhs), std::move(rhs)}, line, height);
        }
        return lhs;
    }

    ast::expr_ptr equality() {
        ast::expr_ptr lhs = comparison();
        while (check(token_type::equal_equal) || check(token_type::bang_equal)) {
            const token& op = advance();
            const ast::binary_op kind = op.type == token_type::equal_equal ? ast::binary_op::equal : ast::binary_op::not_equal;
            const std::size_t line = op.line;
            ast::expr_ptr rhs = comparison();
            const std::size_t height = std::max(lhs->height, rhs->height);
            lhs = composite(ast::binary_expr{kind, std::move(lhs), std::move(rhs)}, line, height);
        }
        return lhs;
    }

    ast::expr_ptr comparison() {
        ast::expr_ptr lhs = term();
        while (true) {
            ast::binary_op kind = ast::binary_op::less;
            if (check(token_type::less)) {
                kind = ast::binary_op::less;
            } else if (check(token_type::less_equal)) {
                kind = ast::binary_op::less_equal;
            } else if (check(token_type::greater)) {
                kind = ast::binary_op::greater;
            } else if (check(token_type::greater_equal)) {
                kind = ast::binary_op::greater_equal;
            } else {
                break;
            }
            const std::size_t line = advance().line;
            ast::expr_ptr rhs = term();
            const std::size_t height = std::max(lhs->height, rhs->height);
            lhs = composite(ast::binary_expr{kind, std::move(lhs), std::move(rhs)}, line, height);
        }
        return lhs;
    }

    ast::expr_ptr term() {
        ast::expr_ptr lhs = factor();
        while (check(token_type::plus) || check(token_type::minus)) {
            const token& op = advance();
            const ast::binary_op kind = op.type == token_type::plus ? ast::binary_op::add : ast::binary_op::subtract;
            const std::size_t line = op.line;
            ast::expr_ptr rhs = factor();
            const std::size_t height = std::max(lhs->height, rhs->height);
            lhs = composite(ast::binary_expr{kind, std::move(lhs), std::move(rhs)}, line, height);
        }
        return lhs;
    }

    ast::expr_ptr factor() {
        ast::expr_ptr lhs = unary();
        while (check(token_type::star) || check(token_type::slash)) {
            const token& op = advance();
            const ast::binary_op kind = op.type == token_type::star ? ast::binary_op::multiply : ast::binary_op::divide;
            const std::size_t line = op.line;
            ast::expr_ptr rhs = unary();
            const std::size_t height = std::max(lhs->height, rhs->height);
            lhs = composite(ast::binary_expr{kind, std::move(lhs), std::move(rhs)}, line, height);
        }
        return lhs;
    }

    ast::expr_ptr unary() {
        if (check(token_type::bang) || check(token_type::minus)) {
            const token& op = advance();
            const ast::unary_op kind = op.type == token_type::bang ? ast::unary_op::logical_not : ast::unary_op::negate;
            const std::size_t line = op.line;
            depth_scope nested(nesting_depth_);
            check_nesting("expression");
            ast::expr_ptr operand = unary();
            const std::size_t height = operand->height;
            return composite(ast::unary_expr{kind, std::move(operand)}, line, height);
        }
        return call();
    }

    ast::expr_ptr call() {
        ast::expr_ptr callee = primary();
        while (match(token_type::left_paren)) {
            const std::size_t line = previous().line;
            std::size_t height = callee->height;
            ast::call_expr node;
            node.callee = std::move(callee);
            if (!check(token_type::right_paren)) {
                do {
                    if (node.args.size() >= max_arguments) {
                        throw error_at(peek(), "cannot have more than 255 arguments");
                    }
                    node.args.push_back(expression());
                    height = std::max(height, node.args.back()->height);
                } while (match(token_type::comma));
            }
            consume(token_type::right_paren, "expected ')' after arguments");
            callee = composite(std::move(node), line, height);
        }
        return callee;
    }

    ast::expr_ptr primary() {
        const token& t = peek();
        const std::size_t line = t.line;

        switch (t.type) {
            case token_type::kw_false:
                (void)advance();
                return ast::make_expr(ast::literal_expr{make_boolean(false)}, line);
            case token_type::kw_true:
                (void)advance();
                return ast::make_expr(ast::literal_expr{make_boolean(true)}, line);
            case token_type::kw_nil:
                (void)advance();
                return ast::make_expr(ast::literal_expr{make_nil()}, line);
            case token_type::number: {
                const double number = advance().number;
                return ast::make_expr(ast::literal_expr{make_number(number)}, line);
            }
            case token_type::string: {
                const std::string text = advance().text;
                return ast::make_expr(ast::literal_expr{make_string(text)}, line);
            }
            case token_type::identifier: {
                std::string name = advance().lexeme;
                return ast::make_expr(ast::variable_expr{std::move(name)}, line);
            }
            case token_type::left_paren: {
                (void)advance();
                ast::expr_ptr inner = expression();
                consume(token_type::right_paren, "expected ')' after expression");
                const std::size_t height = inner->height;
                return composite(ast::grouping_expr{std::move(inner)}, line, height);
            }
            case token_type::kw_fn:
                (void)advance();
                consume(token_type::left_paren, "expected '(' after 'fn'");
                return ast::make_expr(ast::function_expr{function_body("fn", line)}, line);
            default:
                break;
        }
        throw error_at(t, "expected expression");
    }

    std::vector<token> tokens_;
    std::size_t pos_ = 0;
    std::size_t function_depth_ = 0;
    std::size_t nesting_depth_ = 0;
};

}  // namespace

ast::program parse_program(std::string_view source) {
    parser p(scan_tokens(source));
    return p.parse_all();
}

}  // namespace rlscript
