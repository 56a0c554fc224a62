#include "algexpr/evaluator.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace algexpr {

// nullopt for a division by zero
static std::optional<double> apply(BinaryOp op, double a, double b) {
    switch (op) {
        case BinaryOp::Add: return a + b;
        case BinaryOp::Sub: return a - b;
        case BinaryOp::Mul: return a * b;
        case BinaryOp::Div:
            if (b == 0.0) return std::nullopt;
            return a / b;
    }
    return std::nullopt;
}

EvalResult evaluate(const Node& node) {
    return std::visit([&](const auto& d) -> EvalResult {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, Number>) {
            return EvalResult::number(d.value);
        } else if constexpr (std::is_same_v<T, Variable>) {
            return EvalResult::expression(node);
        } else if constexpr (std::is_same_v<T, Unary>) {
            EvalResult r = evaluate(*d.operand);
            if (r.is_number()) return EvalResult::number(-*r.value);
            return EvalResult::expression(node);
        } else if constexpr (std::is_same_v<T, Power>) {
            EvalResult b = evaluate(*d.base);
            if (b.is_number()) return EvalResult::number(std::pow(*b.value, d.exponent));
            return EvalResult::expression(node);
        } else if constexpr (std::is_same_v<T, Binary>) {
            EvalResult l = evaluate(*d.left);
            EvalResult r = evaluate(*d.right);
            if (l.is_number() && r.is_number()) {
                if (auto v = apply(d.op, *l.value, *r.value)) return EvalResult::number(*v);
            }
            return EvalResult::expression(node);
        } else {
            static_assert(detail::unhandled_alternative_v<T>, "evaluate: unhandled node kind");
        }
    }, node.data);
}

std::optional<double> try_evaluate(const Node& node) {
    return evaluate(node).value;
}

static NodePtr simplify_binary(const Binary& b, const std::optional<Span>& span) {
    NodePtr left = simplify(*b.left);
    NodePtr right = simplify(*b.right);

    const std::optional<double> lv = try_evaluate(*left);
    const std::optional<double> rv = try_evaluate(*right);

    if (lv && rv) {
        if (auto v = apply(b.op, *lv, *rv)) return make_number(*v, span);
        return make_binary(b.op, std::move(left), std::move(right), span);
    }

    switch (b.op) {
        case BinaryOp::Add:
            if (lv == 0.0) return right;
            if (rv == 0.0) return left;
            break;
        case BinaryOp::Sub:
            if (rv == 0.0) return left;
            break;
        case BinaryOp::Mul:
            if (lv == 1.0) return right;
            if (rv == 1.0) return left;
            if (lv == 0.0 || rv == 0.0) return make_number(0.0, span);
            break;
        case BinaryOp::Div:
            if (rv == 1.0) return left;
            break;
    }

    return make_binary(b.op, std::move(left), std::move(right), span);
}

NodePtr simplify(const Node& node) {
    EvalResult whole = evaluate(node);
    if (whole.is_number()) return make_number(*whole.value, node.span);

    return std::visit([&](const auto& d) -> NodePtr {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, Number> || std::is_same_v<T, Variable>) {
            return clone(node);
        } else if constexpr (std::is_same_v<T, Unary>) {
            NodePtr operand = simplify(*d.operand);
            if (auto v = try_evaluate(*operand)) return make_number(-*v, node.span);
            return make_unary(std::move(operand), node.span);
        } else if constexpr (std::is_same_v<T, Power>) {
            NodePtr base = simplify(*d.base);
            if (auto v = try_evaluate(*base)) return make_number(std::pow(*v, d.exponent), node.span);
            return make_power(std::move(base), d.exponent, node.span);
        } else if constexpr (std::is_same_v<T, Binary>) {
            return simplify_binary(d, node.span);
        } else {
            static_assert(detail::unhandled_alternative_v<T>, "simplify: unhandled node kind");
        }
    }, node.data);
}

std::string format_number(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";

    std::ostringstream oss;
    if (value == std::floor(value)) {
        if (value == 0.0) return "0"; // also -0
        if (std::fabs(value) < 1e21)
            oss << std::fixed << std::setprecision(0) << value;
        else
            oss << value;
        return oss.str();
    }

    oss << std::fixed << std::setprecision(2) << value;
    std::string s = oss.str();
    while (s.back() == '0') s.pop_back();
    if (s.back() == '.') s.pop_back();
    return s;
}

// Exponents and coefficients are printed unrounded.
static std::string format_plain(double value) {
    if (value == std::floor(value) && std::fabs(value) < 1e21) return format_number(value);
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

static int precedence(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:
        case BinaryOp::Sub: return 1;
        case BinaryOp::Mul:
        case BinaryOp::Div: return 2;
    }
    return 0;
}

static bool needs_parens(const Node& child, BinaryOp parent, bool right_side) {
    const auto* c = std::get_if<Binary>(&child.data);
    if (!c) return false;

    const int pp = precedence(parent);
    const int cp = precedence(c->op);
    if (cp < pp) return true;

    // a - (b - c), a / (b * c)
    return right_side && cp == pp && (parent == BinaryOp::Sub || parent == BinaryOp::Div);
}

static const char* spaced_operator(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add: return " + ";
        case BinaryOp::Sub: return " - ";
        case BinaryOp::Mul: return " \xC3\x97 "; // ×
        case BinaryOp::Div: return " \xC3\xB7 "; // ÷
    }
    return " ? ";
}

std::string ast_to_string(const Node& node) {
    return std::visit([&](const auto& d) -> std::string {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, Number>) {
            return format_number(d.value);
        } else if constexpr (std::is_same_v<T, Variable>) {
            if (d.coefficient == 1.0) return d.name;
            if (d.coefficient == -1.0) return "-" + d.name;
            return format_plain(d.coefficient) + d.name;
        } else if constexpr (std::is_same_v<T, Unary>) {
            std::string s = ast_to_string(*d.operand);
            if (is_binary(*d.operand)) return "-(" + s + ")";
            return "-" + s;
        } else if constexpr (std::is_same_v<T, Power>) {
            std::string base = ast_to_string(*d.base);
            if (is_binary(*d.base) || is_unary(*d.base)) base = "(" + base + ")";
            return base + "^" + format_plain(d.exponent);
        } else if constexpr (std::is_same_v<T, Binary>) {
            std::string l = ast_to_string(*d.left);
            std::string r = ast_to_string(*d.right);
            if (needs_parens(*d.left, d.op, false)) l = "(" + l + ")";
            if (needs_parens(*d.right, d.op, true)) r = "(" + r + ")";
            return l + spaced_operator(d.op) + r;
        } else {
            static_assert(detail::unhandled_alternative_v<T>, "ast_to_string: unhandled node kind");
        }
    }, node.data);
}

} // namespace algexpr
