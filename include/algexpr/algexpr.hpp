#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "algexpr/analyzer.hpp"
#include "algexpr/ast.hpp"
#include "algexpr/evaluator.hpp"
#include "algexpr/lexer.hpp"
#include "algexpr/parser.hpp"

namespace algexpr {

/// Parses and folds `text`; nullopt if it does not parse or does not reduce
/// to a number.
std::optional<double> evaluate_string(std::string_view text);

/// Parses, simplifies and prints `text`. Unparsable input is returned as is.
std::string simplify_string(std::string_view text);

} // namespace algexpr
