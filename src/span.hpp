#pragma once

#include <cstdint>

#include "source.hpp"

namespace keel {

struct SourceLoc {
    std::uint32_t line = 1;
    std::uint32_t column = 1;
};

struct Span {
    FileId file = 0;
    SourceLoc begin{};
    SourceLoc end{};
};

// Position-less span used for diagnostics raised on compiler-generated IR.
inline constexpr Span kCodegenSpan{.file = 0,
                                   .begin = SourceLoc{0, 0},
                                   .end = SourceLoc{0, 0}};

}  // namespace keel
