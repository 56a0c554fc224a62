#pragma once
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include "algexpr/span.hpp"

namespace algexpr {

struct Node;
using NodePtr = std::unique_ptr<Node>;

enum class BinaryOp { Add, Sub, Mul, Div };

char symbol(BinaryOp op) noexcept;

struct Number {
    double value{0.0};
};

/// A named unknown. The parser always produces coefficient 1 and spells "3x"
/// as Binary(Mul, Number 3, Variable x); other coefficients only come from
/// code that builds trees directly.
struct Variable {
    std::string name;
    double coefficient{1.0};
};

struct Binary {
    BinaryOp op{BinaryOp::Add};
    NodePtr left;
    NodePtr right;
};

// Negation.
struct Unary {
    NodePtr operand;
};

// The grammar only accepts a literal after '^', so the exponent is a constant.
struct Power {
    NodePtr base;
    double exponent{2.0};
};

/// Expression tree node. Children are owned exclusively by their parent.
/// Nodes produced by the parser always carry a span; nodes synthesized by the
/// simplifier inherit the span of the node they replace, or have none.
struct Node {
    using Data = std::variant<Number, Variable, Binary, Unary, Power>;

    Data data;
    std::optional<Span> span;
};

NodePtr make_number(double value, std::optional<Span> span = std::nullopt);
NodePtr make_variable(std::string name, double coefficient = 1.0,
                      std::optional<Span> span = std::nullopt);
NodePtr make_binary(BinaryOp op, NodePtr left, NodePtr right,
                    std::optional<Span> span = std::nullopt);
NodePtr make_unary(NodePtr operand, std::optional<Span> span = std::nullopt);
NodePtr make_power(NodePtr base, double exponent, std::optional<Span> span = std::nullopt);

NodePtr clone(const Node& node);

inline bool is_number(const Node& n) { return std::holds_alternative<Number>(n.data); }
inline bool is_variable(const Node& n) { return std::holds_alternative<Variable>(n.data); }
inline bool is_binary(const Node& n) { return std::holds_alternative<Binary>(n.data); }
inline bool is_unary(const Node& n) { return std::holds_alternative<Unary>(n.data); }
inline bool is_power(const Node& n) { return std::holds_alternative<Power>(n.data); }

bool is_additive(const Node& n);
bool is_multiplicative(const Node& n);
bool is_fraction(const Node& n);

// Structural equality, spans included.
bool operator==(const Node& a, const Node& b);
inline bool operator!=(const Node& a, const Node& b) { return !(a == b); }

namespace detail {
// Dependent false for the static_assert closing an if-constexpr visitor chain,
// so a new node kind fails to compile everywhere nodes are matched.
template <class>
inline constexpr bool unhandled_alternative_v = false;
} // namespace detail

} // namespace algexpr
