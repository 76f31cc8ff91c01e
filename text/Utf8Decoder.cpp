#include "Utf8Decoder.h"

namespace notox {

bool Utf8Decoder::next(DecodedUnit& unit) noexcept {
    if (pos_ >= bytes_.size()) return false;

    const auto at = [this](std::size_t i) {
        return static_cast<unsigned char>(bytes_[pos_ + i]);
    };
    const unsigned char lead = at(0);
    const std::size_t want = sequence_length(lead);

    if (want == 1) {
        unit = DecodedUnit{UnitKind::Ascii, lead, lead, 1};
        ++pos_;
        return true;
    }

    const std::size_t avail = bytes_.size() - pos_;
    if (avail < want) {
        // Truncated tail: swallow what is left as one anomaly.
        unit = DecodedUnit{UnitKind::Scalar, kUndecodable, 0, avail};
        pos_ = bytes_.size();
        return true;
    }

    char32_t cp = 0;
    switch (want) {
        case 2: cp = assemble_two(lead, at(1)); break;
        case 3: cp = assemble_three(lead, at(1), at(2)); break;
        default: cp = assemble_four(lead, at(1), at(2), at(3)); break;
    }
    if (!is_scalar_value(cp)) cp = kUndecodable;

    unit = DecodedUnit{UnitKind::Scalar, cp, 0, want};
    pos_ += want;
    return true;
}

} // namespace notox
