#include "algexpr/lexer.hpp"
#include <cctype>
#include <cstdlib>
#include <string>
#include <utility>

namespace algexpr {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
static bool is_letter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

const char* to_string(TokKind kind) noexcept {
    switch (kind) {
        case TokKind::Number:   return "NUMBER";
        case TokKind::Variable: return "VARIABLE";
        case TokKind::Plus:     return "PLUS";
        case TokKind::Minus:    return "MINUS";
        case TokKind::Multiply: return "MULTIPLY";
        case TokKind::Divide:   return "DIVIDE";
        case TokKind::Power:    return "POWER";
        case TokKind::LParen:   return "LPAREN";
        case TokKind::RParen:   return "RPAREN";
        case TokKind::End:      return "EOF";
    }
    return "?";
}

void Lexer::skip_ws() {
    while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

char Lexer::peek(std::size_t offset) const {
    return i_ + offset < s_.size() ? s_[i_ + offset] : '\0';
}

// UTF-8 operator glyphs: U+00D7 '×' and U+00B7 '·' multiply, U+00F7 '÷' divides.
// Returns the byte width of the glyph at the cursor, 0 if there is none.
std::size_t Lexer::glyph_width(TokKind& kind) const {
    const auto lead = static_cast<unsigned char>(peek());
    const auto trail = static_cast<unsigned char>(peek(1));
    if (lead == 0xC3 && trail == 0x97) { kind = TokKind::Multiply; return 2; }
    if (lead == 0xC2 && trail == 0xB7) { kind = TokKind::Multiply; return 2; }
    if (lead == 0xC3 && trail == 0xB7) { kind = TokKind::Divide; return 2; }
    return 0;
}

void Lexer::add(TokKind kind, const char* text, std::size_t width) {
    Token t{kind};
    t.text = text;
    t.span = {i_, i_ + width};
    i_ += width;
    out_.push_back(std::move(t));
}

void Lexer::read_number() {
    std::size_t start = i_;
    while (!is_end() && is_digit(s_[i_])) ++i_;
    if (peek() == '.' && is_digit(peek(1))) {
        ++i_;
        while (!is_end() && is_digit(s_[i_])) ++i_;
    }

    Token t{TokKind::Number};
    t.text = std::string(s_.substr(start, i_ - start));
    // strtod saturates to HUGE_VAL on overflow instead of throwing like stod.
    t.value = std::strtod(t.text.c_str(), nullptr);
    t.span = {start, i_};
    out_.push_back(std::move(t));

    // "3x": coefficient directly followed by a name multiplies it.
    if (!is_end() && is_letter(s_[i_])) {
        Token mul{TokKind::Multiply};
        mul.text = "*";
        mul.span = {i_, i_};
        out_.push_back(std::move(mul));
    }
}

void Lexer::read_variable() {
    std::size_t start = i_;
    while (!is_end() && is_letter(s_[i_])) ++i_;
    // subscripts: x1, y12
    while (!is_end() && is_digit(s_[i_])) ++i_;

    Token t{TokKind::Variable};
    t.text = std::string(s_.substr(start, i_ - start));
    t.span = {start, i_};
    out_.push_back(std::move(t));
}

std::vector<Token> Lexer::tokenize() {
    out_.clear();
    i_ = 0;

    while (!is_end()) {
        skip_ws();
        if (is_end()) break;

        char c = s_[i_];

        if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
            read_number();
            continue;
        }
        if (is_letter(c)) {
            read_variable();
            continue;
        }

        switch (c) {
            case '+': add(TokKind::Plus, "+", 1); continue;
            case '-': add(TokKind::Minus, "-", 1); continue;
            case '*': add(TokKind::Multiply, "*", 1); continue;
            case '/': add(TokKind::Divide, "/", 1); continue;
            case '^': add(TokKind::Power, "^", 1); continue;
            case '(': add(TokKind::LParen, "(", 1); continue;
            case ')': add(TokKind::RParen, ")", 1); continue;
            default: break;
        }

        TokKind kind{};
        if (std::size_t width = glyph_width(kind)) {
            add(kind, kind == TokKind::Multiply ? "*" : "/", width);
            continue;
        }

        ++i_; // unknown byte
    }

    Token end{TokKind::End};
    end.span = {i_, i_};
    out_.push_back(std::move(end));
    return std::move(out_);
}

std::vector<Token> tokenize(std::string_view input) {
    Lexer lex(input);
    return lex.tokenize();
}

} // namespace algexpr
