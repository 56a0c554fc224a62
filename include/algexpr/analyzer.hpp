#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "algexpr/ast.hpp"
#include "algexpr/span.hpp"

namespace algexpr {

// Literals on both sides of a fraction sharing `factor`.
struct CommonFactor {
    std::uint64_t factor{1};
    std::vector<Span> numerator_spans;
    std::vector<Span> denominator_spans;
};

// Additive terms with the same variable and exponent; variable is empty for
// constant terms.
struct LikeTerms {
    std::optional<std::string> variable;
    double exponent{1.0};
    std::vector<Span> spans;
};

// A literal-over-literal division such as 6/4.
struct ReducibleFraction {
    std::uint64_t gcd{1};
    Span numerator_span;
    Span denominator_span;
};

using Opportunity = std::variant<CommonFactor, LikeTerms, ReducibleFraction>;

/// Like terms and reducible fractions inside one expression. Spans refer to
/// the string `node` was parsed from. A null node yields nothing.
std::vector<Opportunity> analyze_expression(const Node& node);
std::vector<Opportunity> analyze_expression(const Node* node);

/// Common factors between the two halves of a displayed fraction, followed by
/// analyze_expression() of each half. Numerator and denominator are parsed
/// separately, so each span set refers to its own source string.
std::vector<Opportunity> analyze_fraction(const Node& numerator, const Node& denominator);
std::vector<Opportunity> analyze_fraction(const Node* numerator, const Node* denominator);

std::vector<CommonFactor> find_common_factors(const Node& numerator, const Node& denominator);
std::vector<LikeTerms> find_like_terms(const Node& node);
std::vector<ReducibleFraction> find_reducible_fractions(const Node& node);

// Which half of the editor a span belongs to.
enum class Part { Numerator, Denominator, Expression };

bool is_span_highlighted(const Span& span, const std::vector<Opportunity>& opportunities, Part part);
std::vector<Opportunity> opportunities_at(const Span& span,
                                          const std::vector<Opportunity>& opportunities,
                                          Part part);

// One-line summary, e.g. "common factor 2: numerator [0,1) / denominator [0,1)".
std::string describe(const Opportunity& opportunity);

} // namespace algexpr
