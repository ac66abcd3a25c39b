#include "apps/meter/SegmentDecoder.hpp"

namespace meter {

namespace {

//                                      gfedcba
constexpr msg::SegmentMask GLYPHS[10] = {
    0x3F,   // 0  abcdef
    0x06,   // 1  bc
    0x5B,   // 2  abdeg
    0x4F,   // 3  abcdg
    0x66,   // 4  bcfg
    0x6D,   // 5  acdfg
    0x7D,   // 6  acdefg
    0x07,   // 7  abc
    0x7F,   // 8  abcdefg
    0x6F,   // 9  abcdfg
};

} // anonymous namespace

SegmentDecoder::SegmentDecoder() {
    m_table.fill(msg::INVALID_DIGIT);

    for (uint8_t d = 0; d < 10; ++d) {
        m_table[GLYPHS[d]] = static_cast<int8_t>(d);
    }

    // Blank slot (leading blank on the LCD) reads as 0.
    m_table[0] = 0;
}

msg::SegmentMask SegmentDecoder::pattern(uint8_t digit) {
    return (digit < 10) ? GLYPHS[digit] : 0;
}

int8_t SegmentDecoder::lookup(msg::SegmentMask mask) const {
    if (mask > msg::SEGMENT_ALL) return msg::INVALID_DIGIT;
    return m_table[mask];
}

int8_t SegmentDecoder::decode(msg::DigitSlot slot, msg::SegmentMask mask,
                              std::vector<msg::DecodeError>& errors) const {
    const int8_t digit = lookup(mask);
    if (digit != msg::INVALID_DIGIT) return digit;

    msg::DecodeError e{};
    e.kind     = msg::DecodeError::Kind::UNRECOGNIZED_DIGIT;
    e.slot     = static_cast<uint8_t>(slot);
    e.segments = static_cast<msg::SegmentMask>(mask & msg::SEGMENT_ALL);
    errors.push_back(e);

    return msg::INVALID_DIGIT;
}

} // namespace meter
