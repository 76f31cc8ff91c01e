#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace notox {

// Sentinel scalar for byte sequences that do not assemble into a valid code point.
inline constexpr char32_t kUndecodable = 0xFFFFFFFFu;

enum class UnitKind { Ascii, Scalar };

// One step of the decoder: either a single ASCII byte at a sequence boundary,
// or a multi-byte sequence reassembled into a scalar (possibly kUndecodable).
struct DecodedUnit {
    UnitKind kind{UnitKind::Ascii};
    char32_t scalar{0};
    unsigned char byte{0};
    std::size_t length{0};
};

[[nodiscard]] constexpr std::size_t sequence_length(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if (lead < 0xE0) return 2;  // includes stray continuation bytes 0x80..0xBF
    if (lead < 0xF0) return 3;
    return 4;
}

[[nodiscard]] constexpr char32_t assemble_two(unsigned char b0, unsigned char b1) noexcept {
    return (static_cast<char32_t>(b0 & 0x1F) << 6) | static_cast<char32_t>(b1 & 0x3F);
}

[[nodiscard]] constexpr char32_t assemble_three(unsigned char b0, unsigned char b1,
                                                unsigned char b2) noexcept {
    return (static_cast<char32_t>(b0 & 0x0F) << 12)
         | (static_cast<char32_t>(b1 & 0x3F) << 6)
         | static_cast<char32_t>(b2 & 0x3F);
}

[[nodiscard]] constexpr char32_t assemble_four(unsigned char b0, unsigned char b1,
                                               unsigned char b2, unsigned char b3) noexcept {
    return (static_cast<char32_t>(b0 & 0x07) << 18)
         | (static_cast<char32_t>(b1 & 0x3F) << 12)
         | (static_cast<char32_t>(b2 & 0x3F) << 6)
         | static_cast<char32_t>(b3 & 0x3F);
}

[[nodiscard]] constexpr bool is_scalar_value(char32_t cp) noexcept {
    return cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
}

// Walks raw component bytes and yields decoded units lazily. Tolerant of
// malformed input: never throws, never stops early.
class Utf8Decoder {
public:
    explicit Utf8Decoder(std::string_view bytes) noexcept : bytes_(bytes) {}

    // Fills `unit` with the next step; false once all bytes are consumed.
    bool next(DecodedUnit& unit) noexcept;

    std::size_t position() const noexcept { return pos_; }

private:
    std::string_view bytes_;
    std::size_t pos_{0};
};

} // namespace notox
