#include "algexpr/ast.hpp"

#include <utility>

namespace algexpr {

char symbol(BinaryOp op) noexcept {
    switch (op) {
        case BinaryOp::Add: return '+';
        case BinaryOp::Sub: return '-';
        case BinaryOp::Mul: return '*';
        case BinaryOp::Div: return '/';
    }
    return '?';
}

static NodePtr make_node(Node::Data data, std::optional<Span> span) {
    auto n = std::make_unique<Node>();
    n->data = std::move(data);
    n->span = span;
    return n;
}

NodePtr make_number(double value, std::optional<Span> span) {
    return make_node(Number{value}, span);
}

NodePtr make_variable(std::string name, double coefficient, std::optional<Span> span) {
    return make_node(Variable{std::move(name), coefficient}, span);
}

NodePtr make_binary(BinaryOp op, NodePtr left, NodePtr right, std::optional<Span> span) {
    return make_node(Binary{op, std::move(left), std::move(right)}, span);
}

NodePtr make_unary(NodePtr operand, std::optional<Span> span) {
    return make_node(Unary{std::move(operand)}, span);
}

NodePtr make_power(NodePtr base, double exponent, std::optional<Span> span) {
    return make_node(Power{std::move(base), exponent}, span);
}

NodePtr clone(const Node& node) {
    return std::visit([&](const auto& d) -> NodePtr {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, Number>) {
            return make_number(d.value, node.span);
        } else if constexpr (std::is_same_v<T, Variable>) {
            return make_variable(d.name, d.coefficient, node.span);
        } else if constexpr (std::is_same_v<T, Binary>) {
            return make_binary(d.op, clone(*d.left), clone(*d.right), node.span);
        } else if constexpr (std::is_same_v<T, Unary>) {
            return make_unary(clone(*d.operand), node.span);
        } else if constexpr (std::is_same_v<T, Power>) {
            return make_power(clone(*d.base), d.exponent, node.span);
        } else {
            static_assert(detail::unhandled_alternative_v<T>, "clone: unhandled node kind");
        }
    }, node.data);
}

bool is_additive(const Node& n) {
    const auto* b = std::get_if<Binary>(&n.data);
    return b && (b->op == BinaryOp::Add || b->op == BinaryOp::Sub);
}

bool is_multiplicative(const Node& n) {
    const auto* b = std::get_if<Binary>(&n.data);
    return b && (b->op == BinaryOp::Mul || b->op == BinaryOp::Div);
}

bool is_fraction(const Node& n) {
    const auto* b = std::get_if<Binary>(&n.data);
    return b && b->op == BinaryOp::Div;
}

bool operator==(const Node& a, const Node& b) {
    if (a.span != b.span || a.data.index() != b.data.index()) return false;

    return std::visit([&](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        const auto& y = std::get<T>(b.data);
        if constexpr (std::is_same_v<T, Number>) {
            return x.value == y.value;
        } else if constexpr (std::is_same_v<T, Variable>) {
            return x.name == y.name && x.coefficient == y.coefficient;
        } else if constexpr (std::is_same_v<T, Binary>) {
            return x.op == y.op && *x.left == *y.left && *x.right == *y.right;
        } else if constexpr (std::is_same_v<T, Unary>) {
            return *x.operand == *y.operand;
        } else if constexpr (std::is_same_v<T, Power>) {
            return x.exponent == y.exponent && *x.base == *y.base;
        } else {
            static_assert(detail::unhandled_alternative_v<T>, "operator==: unhandled node kind");
        }
    }, a.data);
}

} // namespace algexpr
