#pragma once
#include <optional>
#include <string>

#include "algexpr/span.hpp"

namespace algexpr {

enum class TokKind {
    Number,
    Variable,

    Plus, Minus, Multiply, Divide, Power,
    LParen, RParen,
    End,
};

struct Token {
    TokKind kind{TokKind::End};
    std::string text{};           // literal text; "*" / "/" for the unicode glyphs
    std::optional<double> value{}; // Number only
    Span span{};

    // The lexer emits a zero-width Multiply between "3" and "x" in "3x".
    bool implicit() const noexcept { return kind == TokKind::Multiply && span.empty(); }
};

const char* to_string(TokKind kind) noexcept;

} // namespace algexpr
