#pragma once
#include <optional>
#include <string>

#include "algexpr/ast.hpp"

namespace algexpr {

/// Outcome of constant folding: either a number, or the sub-tree at which
/// folding stopped (a variable, a division by zero, ...). The node pointer
/// borrows from the evaluated tree.
struct EvalResult {
    std::optional<double> value;
    const Node* node{nullptr};

    static EvalResult number(double v) { return {v, nullptr}; }
    static EvalResult expression(const Node& n) { return {std::nullopt, &n}; }

    bool is_number() const noexcept { return value.has_value(); }
};

// Never throws; x / 0 does not fold.
EvalResult evaluate(const Node& node);
std::optional<double> try_evaluate(const Node& node);

/// Folds constants and removes the identities x+0, 0+x, x-0, x*1, 1*x,
/// x*0, 0*x and x/1. Returns a new tree; the input is not modified.
NodePtr simplify(const Node& node);

/// Prints with minimal parentheses, using the glyphs × and ÷.
std::string ast_to_string(const Node& node);

// Integral values without decimals, others rounded to two places with
// trailing zeros dropped.
std::string format_number(double value);

} // namespace algexpr
