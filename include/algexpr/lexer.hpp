#pragma once
#include <string_view>
#include <vector>

#include "algexpr/token.hpp"

namespace algexpr {

// Splits an expression into tokens. Never fails: bytes that start no token are
// skipped. The result always ends with exactly one End token.
class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}
    std::vector<Token> tokenize();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }
    char peek(std::size_t offset = 0) const;
    std::size_t glyph_width(TokKind& kind) const;

    void add(TokKind kind, const char* text, std::size_t width);
    void read_number();
    void read_variable();

    std::string_view s_;
    std::size_t i_{0};
    std::vector<Token> out_;
};

std::vector<Token> tokenize(std::string_view input);

} // namespace algexpr
