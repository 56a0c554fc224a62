#include "algexpr/algexpr.hpp"

namespace algexpr {

std::optional<double> evaluate_string(std::string_view text) {
    NodePtr ast = try_parse(text);
    if (!ast) return std::nullopt;
    return try_evaluate(*ast);
}

std::string simplify_string(std::string_view text) {
    NodePtr ast = try_parse(text);
    if (!ast) return std::string(text);
    return ast_to_string(*simplify(*ast));
}

} // namespace algexpr
