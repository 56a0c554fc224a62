#pragma once
#include <cstddef>

namespace algexpr {

// Half-open range [start, end) of UTF-8 byte offsets into the string a token
// or node came from. After non-ASCII input (the × ÷ · glyphs, for instance)
// these differ from code-point offsets.
struct Span {
    std::size_t start{0};
    std::size_t end{0};

    bool empty() const noexcept { return start == end; }
};

inline bool operator==(const Span& a, const Span& b) noexcept {
    return a.start == b.start && a.end == b.end;
}
inline bool operator!=(const Span& a, const Span& b) noexcept { return !(a == b); }

inline bool overlaps(const Span& a, const Span& b) noexcept {
    return a.start < b.end && b.start < a.end;
}

} // namespace algexpr
