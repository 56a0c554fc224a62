#include "algexpr/parser.hpp"
#include "algexpr/lexer.hpp"

#include <algorithm>
#include <utility>

namespace algexpr {

static std::size_t start_of(const Node& n) { return n.span ? n.span->start : 0; }
static std::size_t end_of(const Node& n) { return n.span ? n.span->end : 0; }

static std::string token_text(const Token& t) {
    return t.text.empty() ? std::string("end of input") : t.text;
}

const Token& Parser::advance() {
    if (!is_at_end()) ++pos_;
    return previous();
}

bool Parser::match(TokKind kind) {
    if (!check(kind)) return false;
    advance();
    return true;
}

const Token& Parser::consume(TokKind kind, const char* message) {
    if (check(kind)) return advance();
    throw ParseError(message, current().span.start);
}

void Parser::check_depth(std::size_t depth) const {
    if (depth > max_depth) throw ParseError("Expression nested too deeply", current().span.start);
}

void Parser::enter() {
    if (++nesting_ > max_depth) throw ParseError("Expression nested too deeply", current().span.start);
}

NodePtr Parser::parse() {
    tokens_ = tokenize(input_);
    pos_ = 0;
    nesting_ = 0;
    depth_ = 0;

    NodePtr result = parse_expression();

    if (!is_at_end())
        throw ParseError("Unexpected token: " + token_text(current()), current().span.start);

    return result;
}

NodePtr Parser::parse_expression() {
    NodePtr left = parse_term();
    std::size_t depth = depth_;

    while (check(TokKind::Plus) || check(TokKind::Minus)) {
        BinaryOp op = advance().kind == TokKind::Plus ? BinaryOp::Add : BinaryOp::Sub;
        NodePtr right = parse_term();
        depth = std::max(depth, depth_) + 1;
        check_depth(depth);
        Span span{start_of(*left), end_of(*right)};
        left = make_binary(op, std::move(left), std::move(right), span);
    }

    depth_ = depth;
    return left;
}

NodePtr Parser::parse_term() {
    NodePtr left = parse_factor();
    std::size_t depth = depth_;

    while (check(TokKind::Multiply) || check(TokKind::Divide)) {
        BinaryOp op = advance().kind == TokKind::Multiply ? BinaryOp::Mul : BinaryOp::Div;
        NodePtr right = parse_factor();
        depth = std::max(depth, depth_) + 1;
        check_depth(depth);
        Span span{start_of(*left), end_of(*right)};
        left = make_binary(op, std::move(left), std::move(right), span);
    }

    depth_ = depth;
    return left;
}

// Unary minus sits above Power so that -x^2 is -(x^2).
NodePtr Parser::parse_factor() {
    if (match(TokKind::Minus)) {
        std::size_t start = previous().span.start;
        enter();
        NodePtr operand = parse_factor();
        leave();
        check_depth(++depth_);
        Span span{start, end_of(*operand)};
        return make_unary(std::move(operand), span);
    }

    return parse_power();
}

NodePtr Parser::parse_power() {
    NodePtr base = parse_atom();

    if (!match(TokKind::Power)) return base;
    check_depth(++depth_);

    if (check(TokKind::Number)) {
        const Token& exp = advance();
        Span span{start_of(*base), exp.span.end};
        return make_power(std::move(base), exp.value.value_or(2.0), span);
    }

    if (match(TokKind::Minus) && check(TokKind::Number)) {
        const Token& exp = advance();
        Span span{start_of(*base), exp.span.end};
        return make_power(std::move(base), -exp.value.value_or(1.0), span);
    }

    // Anything else after '^' squares the base. A lone '-' stays consumed.
    std::optional<Span> span = base->span;
    return make_power(std::move(base), 2.0, span);
}

NodePtr Parser::parse_atom() {
    if (match(TokKind::Number)) {
        const Token& t = previous();
        depth_ = 1;
        return make_number(t.value.value_or(0.0), t.span);
    }

    if (match(TokKind::Variable)) {
        const Token& t = previous();
        depth_ = 1;
        return make_variable(t.text, 1.0, t.span);
    }

    if (match(TokKind::LParen)) {
        std::size_t start = previous().span.start;
        enter();
        NodePtr expr = parse_expression();
        const Token& close = consume(TokKind::RParen, "Expected ')' after expression");
        leave();
        // The group's span includes its parentheses.
        if (expr->span) expr->span = Span{start, close.span.end};
        return expr;
    }

    throw ParseError("Unexpected token: " + token_text(current()), current().span.start);
}

NodePtr parse(std::string_view input) {
    Parser p(input);
    return p.parse();
}

NodePtr try_parse(std::string_view input) {
    try {
        return parse(input);
    } catch (const ParseError&) {
        return nullptr;
    }
}

} // namespace algexpr
