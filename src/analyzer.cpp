#include "algexpr/analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <sstream>

namespace algexpr {

namespace {

struct Literal {
    double value;
    Span span;
};

struct TermSignature {
    std::optional<std::string> variable;
    double exponent{1.0};

    bool operator==(const TermSignature& o) const {
        return variable == o.variable && exponent == o.exponent;
    }
};

struct Term {
    TermSignature signature;
    Span span;
};

// Largest magnitude a double holds without gaps between integers.
constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53

Span span_of(const Node& n) { return n.span.value_or(Span{}); }

// |value| as an integer, if value is a whole number small enough to be exact.
std::optional<std::uint64_t> whole(double value) {
    const double a = std::fabs(value);
    if (!std::isfinite(a) || a != std::floor(a) || a > kMaxExactInteger) return std::nullopt;
    return static_cast<std::uint64_t>(a);
}

// Every numeric literal, skipping nothing but variables.
void collect_literals(const Node& node, std::vector<Literal>& out) {
    std::visit([&](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, Number>) {
            out.push_back({d.value, span_of(node)});
        } else if constexpr (std::is_same_v<T, Variable>) {
            // a variable's name is never numeric
        } else if constexpr (std::is_same_v<T, Binary>) {
            collect_literals(*d.left, out);
            collect_literals(*d.right, out);
        } else if constexpr (std::is_same_v<T, Unary>) {
            collect_literals(*d.operand, out);
        } else if constexpr (std::is_same_v<T, Power>) {
            collect_literals(*d.base, out);
        } else {
            static_assert(detail::unhandled_alternative_v<T>, "collect_literals: unhandled node kind");
        }
    }, node.data);
}

// Spans of the literals that are whole numbers divisible by factor (zero included).
std::vector<Span> divisible_by(const std::vector<Literal>& literals, std::uint64_t factor) {
    std::vector<Span> spans;
    for (const auto& lit : literals) {
        auto w = whole(lit.value);
        if (w && *w % factor == 0) spans.push_back(lit.span);
    }
    return spans;
}

// Folds the gcd of the nonzero whole literals into acc (gcd(0, n) == n) and
// returns how many took part.
std::size_t fold_gcd(const std::vector<Literal>& literals, std::uint64_t& acc) {
    std::size_t used = 0;
    for (const auto& lit : literals) {
        auto w = whole(lit.value);
        if (!w || *w == 0) continue;
        acc = std::gcd(acc, *w);
        ++used;
    }
    return used;
}

// Walks a product chain; only the left side of a division contributes.
void sign_term(const Node& node, TermSignature& sig) {
    std::visit([&](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, Number>) {
            // coefficients do not affect the signature
        } else if constexpr (std::is_same_v<T, Variable>) {
            sig.variable = d.name;
        } else if constexpr (std::is_same_v<T, Unary>) {
            sign_term(*d.operand, sig);
        } else if constexpr (std::is_same_v<T, Power>) {
            sign_term(*d.base, sig);
            sig.exponent = d.exponent;
        } else if constexpr (std::is_same_v<T, Binary>) {
            if (d.op == BinaryOp::Mul) {
                sign_term(*d.left, sig);
                sign_term(*d.right, sig);
            } else if (d.op == BinaryOp::Div) {
                sign_term(*d.left, sig);
            }
        } else {
            static_assert(detail::unhandled_alternative_v<T>, "sign_term: unhandled node kind");
        }
    }, node.data);
}

// Flattens a +/- chain into its terms.
void collect_terms(const Node& node, std::vector<Term>& out) {
    if (is_additive(node)) {
        const auto& b = std::get<Binary>(node.data);
        collect_terms(*b.left, out);
        collect_terms(*b.right, out);
        return;
    }
    Term t;
    sign_term(node, t.signature);
    t.span = span_of(node);
    out.push_back(std::move(t));
}

void collect_reducible(const Node& node, std::vector<ReducibleFraction>& out) {
    if (const auto* b = std::get_if<Binary>(&node.data)) {
        if (b->op == BinaryOp::Div) {
            const auto* num = std::get_if<Number>(&b->left->data);
            const auto* den = std::get_if<Number>(&b->right->data);
            if (num && den) {
                auto n = whole(num->value);
                auto d = whole(den->value);
                if (n && d && *d != 0) {
                    std::uint64_t g = std::gcd(*n, *d);
                    if (g > 1) out.push_back({g, span_of(*b->left), span_of(*b->right)});
                }
            }
        }
        collect_reducible(*b->left, out);
        collect_reducible(*b->right, out);
    } else if (const auto* u = std::get_if<Unary>(&node.data)) {
        collect_reducible(*u->operand, out);
    } else if (const auto* p = std::get_if<Power>(&node.data)) {
        collect_reducible(*p->base, out);
    }
}

bool any_overlap(const std::vector<Span>& spans, const Span& span) {
    return std::any_of(spans.begin(), spans.end(),
                       [&](const Span& s) { return overlaps(s, span); });
}

bool touches(const Opportunity& opp, const Span& span, Part part) {
    return std::visit([&](const auto& o) -> bool {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, CommonFactor>) {
            return any_overlap(part == Part::Denominator ? o.denominator_spans : o.numerator_spans, span);
        } else if constexpr (std::is_same_v<T, LikeTerms>) {
            return any_overlap(o.spans, span);
        } else if constexpr (std::is_same_v<T, ReducibleFraction>) {
            if (part == Part::Numerator) return overlaps(o.numerator_span, span);
            if (part == Part::Denominator) return overlaps(o.denominator_span, span);
            return false;
        } else {
            static_assert(detail::unhandled_alternative_v<T>, "touches: unhandled opportunity kind");
        }
    }, opp);
}

void write_spans(std::ostream& os, const std::vector<Span>& spans) {
    for (const auto& s : spans) os << " [" << s.start << ',' << s.end << ')';
}

} // namespace

std::vector<CommonFactor> find_common_factors(const Node& numerator, const Node& denominator) {
    std::vector<Literal> num;
    std::vector<Literal> den;
    collect_literals(numerator, num);
    collect_literals(denominator, den);

    std::vector<CommonFactor> out;
    if (num.empty() || den.empty()) return out;

    std::uint64_t g = 0;
    if (fold_gcd(num, g) == 0 || fold_gcd(den, g) == 0) return out;

    if (g > 1) {
        CommonFactor cf{g, divisible_by(num, g), divisible_by(den, g)};
        if (!cf.numerator_spans.empty() && !cf.denominator_spans.empty())
            out.push_back(std::move(cf));
    }

    // Narrower factors: a single denominator literal dividing numerator literals.
    for (const auto& lit : den) {
        auto factor = whole(lit.value);
        if (!factor || *factor <= 1) continue;

        std::vector<Span> spans = divisible_by(num, *factor);
        if (spans.empty()) continue;

        bool covered = std::any_of(out.begin(), out.end(),
                                   [&](const CommonFactor& c) { return c.factor == *factor; });
        if (!covered) out.push_back({*factor, std::move(spans), {lit.span}});
    }

    return out;
}

std::vector<LikeTerms> find_like_terms(const Node& node) {
    std::vector<Term> terms;
    collect_terms(node, terms);

    // groups in order of first appearance
    std::vector<std::pair<TermSignature, std::vector<Span>>> groups;
    for (auto& t : terms) {
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& g) { return g.first == t.signature; });
        if (it == groups.end()) {
            groups.emplace_back(std::move(t.signature), std::vector<Span>{t.span});
        } else {
            it->second.push_back(t.span);
        }
    }

    std::vector<LikeTerms> out;
    for (auto& g : groups) {
        if (g.second.size() > 1)
            out.push_back({std::move(g.first.variable), g.first.exponent, std::move(g.second)});
    }
    return out;
}

std::vector<ReducibleFraction> find_reducible_fractions(const Node& node) {
    std::vector<ReducibleFraction> out;
    collect_reducible(node, out);
    return out;
}

std::vector<Opportunity> analyze_expression(const Node& node) {
    std::vector<Opportunity> out;
    for (auto& o : find_like_terms(node)) out.emplace_back(std::move(o));
    for (auto& o : find_reducible_fractions(node)) out.emplace_back(std::move(o));
    return out;
}

std::vector<Opportunity> analyze_expression(const Node* node) {
    if (!node) return {};
    return analyze_expression(*node);
}

std::vector<Opportunity> analyze_fraction(const Node& numerator, const Node& denominator) {
    std::vector<Opportunity> out;
    for (auto& o : find_common_factors(numerator, denominator)) out.emplace_back(std::move(o));
    for (auto& o : analyze_expression(numerator)) out.push_back(std::move(o));
    for (auto& o : analyze_expression(denominator)) out.push_back(std::move(o));
    return out;
}

std::vector<Opportunity> analyze_fraction(const Node* numerator, const Node* denominator) {
    if (!numerator || !denominator) return {};
    return analyze_fraction(*numerator, *denominator);
}

bool is_span_highlighted(const Span& span, const std::vector<Opportunity>& opportunities, Part part) {
    return std::any_of(opportunities.begin(), opportunities.end(),
                       [&](const Opportunity& o) { return touches(o, span, part); });
}

std::vector<Opportunity> opportunities_at(const Span& span,
                                          const std::vector<Opportunity>& opportunities,
                                          Part part) {
    std::vector<Opportunity> out;
    std::copy_if(opportunities.begin(), opportunities.end(), std::back_inserter(out),
                 [&](const Opportunity& o) { return touches(o, span, part); });
    return out;
}

std::string describe(const Opportunity& opportunity) {
    std::ostringstream oss;
    std::visit([&](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, CommonFactor>) {
            oss << "common factor " << o.factor << ": numerator";
            write_spans(oss, o.numerator_spans);
            oss << " / denominator";
            write_spans(oss, o.denominator_spans);
        } else if constexpr (std::is_same_v<T, LikeTerms>) {
            oss << "like terms " << o.variable.value_or("constant") << '^' << o.exponent << ':';
            write_spans(oss, o.spans);
        } else if constexpr (std::is_same_v<T, ReducibleFraction>) {
            oss << "reducible fraction, gcd " << o.gcd
                << ": numerator [" << o.numerator_span.start << ',' << o.numerator_span.end << ')'
                << " / denominator [" << o.denominator_span.start << ',' << o.denominator_span.end << ')';
        } else {
            static_assert(detail::unhandled_alternative_v<T>, "describe: unhandled opportunity kind");
        }
    }, opportunity);
    return oss.str();
}

} // namespace algexpr
