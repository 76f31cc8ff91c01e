#pragma once

namespace notox {

enum class AsciiClass {
    Literal,   // letters, digits, '-'
    Period,    // '.' is always kept
    Collapse   // replaced by a de-duplicated '_'
};

// Only meaningful for bytes below 0x80 seen at a sequence boundary.
[[nodiscard]] constexpr AsciiClass classify_ascii(unsigned char b) noexcept {
    if (b <= 44) return AsciiClass::Collapse;
    if (b == 46) return AsciiClass::Period;
    if (b == 47) return AsciiClass::Collapse;
    if (b >= 58 && b <= 64) return AsciiClass::Collapse;
    if (b >= 91 && b <= 96) return AsciiClass::Collapse;
    if (b >= 123) return AsciiClass::Collapse;
    return AsciiClass::Literal;
}

} // namespace notox
