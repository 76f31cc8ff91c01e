#pragma once
#include <string_view>

namespace notox {

enum class FoldAction {
    Literal,       // emit ascii text, clears the collapse flag
    Silent,        // combining mark: emit nothing, flag untouched
    HyphenLike,    // U+2013: emit '-', clears the collapse flag
    Unrecognized   // collapse placeholder, de-duplicated
};

struct Fold {
    FoldAction action{FoldAction::Unrecognized};
    std::string_view ascii;
};

// Fixed diacritic/ligature folding table. Accepts kUndecodable.
[[nodiscard]] Fold transliterate(char32_t cp);

[[nodiscard]] constexpr bool is_combining_mark(char32_t cp) noexcept {
    return (cp >= 0x0300 && cp <= 0x036F)
        || (cp >= 0x1AB0 && cp <= 0x1AFF)
        || (cp >= 0x1DC0 && cp <= 0x1DFF);
}

inline constexpr char32_t kEnDash = 0x2013;

} // namespace notox
