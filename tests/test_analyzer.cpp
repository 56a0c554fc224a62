#include <gtest/gtest.h>
#include <algexpr/analyzer.hpp>
#include <algexpr/parser.hpp>

#include <string>
#include <vector>

namespace {

using namespace algexpr;

std::vector<Opportunity> fraction(const std::string& num, const std::string& den) {
    NodePtr n = parse(num);
    NodePtr d = parse(den);
    return analyze_fraction(*n, *d);
}

std::vector<Opportunity> expression(const std::string& text) {
    return analyze_expression(*parse(text));
}

TEST(Analyzer, CommonFactorOfTwoLiterals) {
    auto found = fraction("6", "4");
    ASSERT_EQ(found.size(), 1u);
    const auto& cf = std::get<CommonFactor>(found[0]);
    EXPECT_EQ(cf.factor, 2u);
    EXPECT_EQ(cf.numerator_spans, (std::vector<Span>{{0, 1}}));
    EXPECT_EQ(cf.denominator_spans, (std::vector<Span>{{0, 1}}));
}

TEST(Analyzer, CommonFactorIsTheGreatestOne) {
    auto found = fraction("12", "8");
    ASSERT_EQ(found.size(), 1u);
    const auto& cf = std::get<CommonFactor>(found[0]);
    EXPECT_EQ(cf.factor, 4u);
    EXPECT_EQ(cf.numerator_spans, (std::vector<Span>{{0, 2}}));
}

TEST(Analyzer, CoefficientSharesFactorWithDenominator) {
    auto found = fraction("5x", "5");
    ASSERT_EQ(found.size(), 1u);
    const auto& cf = std::get<CommonFactor>(found[0]);
    EXPECT_EQ(cf.factor, 5u);
    EXPECT_EQ(cf.numerator_spans, (std::vector<Span>{{0, 1}}));
    EXPECT_EQ(cf.denominator_spans, (std::vector<Span>{{0, 1}}));
}

TEST(Analyzer, FactorSpansEveryNumeratorTerm) {
    auto found = fraction("6x + 4", "2");
    ASSERT_EQ(found.size(), 1u);
    const auto& cf = std::get<CommonFactor>(found[0]);
    EXPECT_EQ(cf.factor, 2u);
    EXPECT_EQ(cf.numerator_spans, (std::vector<Span>{{0, 1}, {5, 6}}));
}

TEST(Analyzer, NarrowerFactorsFromSingleDenominatorLiterals) {
    auto found = fraction("6 + 9", "3 * 2");
    ASSERT_EQ(found.size(), 3u);

    const auto& three = std::get<CommonFactor>(found[0]);
    EXPECT_EQ(three.factor, 3u);
    EXPECT_EQ(three.numerator_spans, (std::vector<Span>{{0, 1}, {4, 5}}));
    EXPECT_EQ(three.denominator_spans, (std::vector<Span>{{0, 1}}));

    const auto& two = std::get<CommonFactor>(found[1]);
    EXPECT_EQ(two.factor, 2u);
    EXPECT_EQ(two.numerator_spans, (std::vector<Span>{{0, 1}}));
    EXPECT_EQ(two.denominator_spans, (std::vector<Span>{{4, 5}}));

    const auto& like = std::get<LikeTerms>(found[2]);
    EXPECT_FALSE(like.variable.has_value());
    EXPECT_EQ(like.spans, (std::vector<Span>{{0, 1}, {4, 5}}));
}

TEST(Analyzer, OnlyDivisibleLiteralsAreMarked) {
    auto found = fraction("4x + 3", "2");
    ASSERT_EQ(found.size(), 1u);
    const auto& cf = std::get<CommonFactor>(found[0]);
    EXPECT_EQ(cf.factor, 2u);
    EXPECT_EQ(cf.numerator_spans, (std::vector<Span>{{0, 1}}));
}

TEST(Analyzer, ZeroLiteralIsMarkedButIgnoredForGcd) {
    auto found = fraction("6 + 0", "4");
    ASSERT_FALSE(found.empty());
    const auto& cf = std::get<CommonFactor>(found[0]);
    EXPECT_EQ(cf.factor, 2u);
    EXPECT_EQ(cf.numerator_spans, (std::vector<Span>{{0, 1}, {4, 5}}));
}

TEST(Analyzer, NoCommonFactorWithoutWholeLiterals) {
    EXPECT_TRUE(fraction("x", "y").empty());
    EXPECT_TRUE(fraction("x", "2").empty());
    EXPECT_TRUE(fraction("1.5", "3").empty());
    EXPECT_TRUE(fraction("7", "5").empty());
}

TEST(Analyzer, NegatedLiteralSpanExcludesSign) {
    auto found = fraction("-6", "4");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(std::get<CommonFactor>(found[0]).numerator_spans, (std::vector<Span>{{1, 2}}));
}

TEST(Analyzer, LikeLinearTerms) {
    auto found = expression("3x + 2x");
    ASSERT_EQ(found.size(), 1u);
    const auto& like = std::get<LikeTerms>(found[0]);
    EXPECT_EQ(like.variable, std::optional<std::string>("x"));
    EXPECT_DOUBLE_EQ(like.exponent, 1.0);
    EXPECT_EQ(like.spans, (std::vector<Span>{{0, 2}, {5, 7}}));
}

TEST(Analyzer, LikeTermsRespectExponent) {
    auto found = find_like_terms(*parse("x^2 + 3x - 2x^2 + 5"));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].variable, std::optional<std::string>("x"));
    EXPECT_DOUBLE_EQ(found[0].exponent, 2.0);
    EXPECT_EQ(found[0].spans, (std::vector<Span>{{0, 3}, {11, 15}}));
}

TEST(Analyzer, ConstantsAreLikeTerms) {
    auto found = find_like_terms(*parse("2 + 3"));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_FALSE(found[0].variable.has_value());
}

TEST(Analyzer, DivisionSignatureUsesNumeratorOnly) {
    auto found = find_like_terms(*parse("x / 2 + x"));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].spans, (std::vector<Span>{{0, 5}, {8, 9}}));
}

TEST(Analyzer, DifferentVariablesAreNotLike) {
    EXPECT_TRUE(find_like_terms(*parse("3x + 2y")).empty());
    EXPECT_TRUE(find_like_terms(*parse("x")).empty());
}

TEST(Analyzer, VariableNamedLikeAConstantIsNotAConstant) {
    EXPECT_TRUE(find_like_terms(*parse("const + 2")).empty());
}

TEST(Analyzer, ReducibleFraction) {
    auto found = find_reducible_fractions(*parse("6 / 4"));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].gcd, 2u);
    EXPECT_EQ(found[0].numerator_span, (Span{0, 1}));
    EXPECT_EQ(found[0].denominator_span, (Span{4, 5}));

    auto nested = find_reducible_fractions(*parse("x + 6/9"));
    ASSERT_EQ(nested.size(), 1u);
    EXPECT_EQ(nested[0].gcd, 3u);
    EXPECT_EQ(nested[0].numerator_span, (Span{4, 5}));
    EXPECT_EQ(nested[0].denominator_span, (Span{6, 7}));

    auto negated = find_reducible_fractions(*parse("-(8/12)"));
    ASSERT_EQ(negated.size(), 1u);
    EXPECT_EQ(negated[0].gcd, 4u);
}

TEST(Analyzer, IrreducibleFractions) {
    EXPECT_TRUE(find_reducible_fractions(*parse("7/5")).empty());
    EXPECT_TRUE(find_reducible_fractions(*parse("6/0")).empty());
    EXPECT_TRUE(find_reducible_fractions(*parse("x/4")).empty());
}

TEST(Analyzer, ExpressionOrderIsLikeTermsThenFractions) {
    auto found = expression("6/4 + 2/4");
    ASSERT_EQ(found.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<LikeTerms>(found[0]));
    ASSERT_TRUE(std::holds_alternative<ReducibleFraction>(found[1]));
    EXPECT_EQ(std::get<ReducibleFraction>(found[1]).numerator_span, (Span{0, 1}));
    ASSERT_TRUE(std::holds_alternative<ReducibleFraction>(found[2]));
    EXPECT_EQ(std::get<ReducibleFraction>(found[2]).numerator_span, (Span{6, 7}));
}

TEST(Analyzer, NullInputsYieldNothing) {
    NodePtr n = parse("6");
    EXPECT_TRUE(analyze_expression(nullptr).empty());
    EXPECT_TRUE(analyze_fraction(n.get(), nullptr).empty());
    EXPECT_TRUE(analyze_fraction(nullptr, n.get()).empty());
    EXPECT_EQ(analyze_expression(n.get()).size(), 0u);
}

TEST(Highlight, OverlapIsHalfOpen) {
    EXPECT_TRUE(overlaps({0, 2}, {1, 3}));
    EXPECT_TRUE(overlaps({0, 5}, {2, 3}));
    EXPECT_FALSE(overlaps({0, 1}, {1, 2}));
    EXPECT_FALSE(overlaps({3, 4}, {0, 3}));
}

TEST(Highlight, CommonFactorUsesSideOfFraction) {
    auto found = fraction("5x", "5");
    EXPECT_TRUE(is_span_highlighted({0, 1}, found, Part::Numerator));
    EXPECT_FALSE(is_span_highlighted({1, 2}, found, Part::Numerator));
    EXPECT_TRUE(is_span_highlighted({0, 1}, found, Part::Denominator));
    EXPECT_FALSE(is_span_highlighted({0, 1}, {}, Part::Numerator));
}

TEST(Highlight, ReducibleFractionNeverMatchesWholeExpression) {
    auto found = expression("6 / 4");
    EXPECT_TRUE(is_span_highlighted({0, 1}, found, Part::Numerator));
    EXPECT_TRUE(is_span_highlighted({4, 5}, found, Part::Denominator));
    EXPECT_FALSE(is_span_highlighted({0, 5}, found, Part::Expression));
}

TEST(Highlight, OpportunitiesAtSpan) {
    auto found = fraction("6 + 9", "3 * 2");

    auto at_nine = opportunities_at({4, 5}, found, Part::Numerator);
    ASSERT_EQ(at_nine.size(), 2u);
    EXPECT_EQ(std::get<CommonFactor>(at_nine[0]).factor, 3u);
    EXPECT_TRUE(std::holds_alternative<LikeTerms>(at_nine[1]));

    auto at_two = opportunities_at({4, 5}, found, Part::Denominator);
    ASSERT_FALSE(at_two.empty());
    EXPECT_EQ(std::get<CommonFactor>(at_two[0]).factor, 2u);

    EXPECT_TRUE(opportunities_at({2, 3}, found, Part::Numerator).empty());
}

TEST(Highlight, Describe) {
    auto found = fraction("6 + 9", "3 * 2");
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(describe(found[0]), "common factor 3: numerator [0,1) [4,5) / denominator [0,1)");
    EXPECT_EQ(describe(found[2]), "like terms constant^1: [0,1) [4,5)");

    auto reducible = expression("6 / 4");
    ASSERT_EQ(reducible.size(), 1u);
    EXPECT_EQ(describe(reducible[0]), "reducible fraction, gcd 2: numerator [0,1) / denominator [4,5)");
}

} // namespace
