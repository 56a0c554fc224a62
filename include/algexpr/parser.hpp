#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "algexpr/ast.hpp"
#include "algexpr/token.hpp"

namespace algexpr {

struct ParseError : std::runtime_error {
    ParseError(const std::string& message, std::size_t position)
        : std::runtime_error(message), position_(position) {}

    // Byte offset of the offending token in the source string.
    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

// Recursive descent, lowest precedence first:
//   Expression -> Term (('+' | '-') Term)*
//   Term       -> Factor (('*' | '/') Factor)*
//   Factor     -> '-' Factor | Power
//   Power      -> Atom ('^' exponent)?
//   Atom       -> NUMBER | VARIABLE | '(' Expression ')'
class Parser {
public:
    // Deepest tree, and deepest '(' / unary '-' nesting, parse() accepts.
    // Every later pass over a tree recurses once per level.
    static constexpr std::size_t max_depth = 1000;

    explicit Parser(std::string_view input) : input_(input) {}

    // Throws ParseError unless the whole input is one expression.
    NodePtr parse();

private:
    const Token& current() const { return tokens_[pos_]; }
    const Token& previous() const { return tokens_[pos_ - 1]; }
    bool is_at_end() const { return current().kind == TokKind::End; }
    bool check(TokKind kind) const { return !is_at_end() && current().kind == kind; }
    const Token& advance();
    bool match(TokKind kind);
    const Token& consume(TokKind kind, const char* message);

    void check_depth(std::size_t depth) const;
    void enter();
    void leave() { --nesting_; }

    NodePtr parse_expression();
    NodePtr parse_term();
    NodePtr parse_factor();
    NodePtr parse_power();
    NodePtr parse_atom();

    std::string_view input_;
    std::vector<Token> tokens_;
    std::size_t pos_{0};
    std::size_t nesting_{0};
    std::size_t depth_{0}; // of the node most recently returned
};

NodePtr parse(std::string_view input);

// Like parse(), but returns null instead of throwing.
NodePtr try_parse(std::string_view input);

} // namespace algexpr
