#pragma once
#include <array>
#include <cstdint>
#include <vector>

#include "msg/LcdState.hpp"
#include "msg/MeterReading.hpp"

namespace meter {

// ---------------------------------------------------------------------------
// SegmentDecoder: exact-match 7-segment pattern -> digit.
//
// Dense table keyed by the 7-bit mask. Only the ten canonical glyphs and the
// empty mask (blank slot, read as 0) decode; every other on-set, including
// the transitional patterns seen while the LCD refreshes, is unrecognized.
// ---------------------------------------------------------------------------
class SegmentDecoder {
public:
    SegmentDecoder();

    // Table lookup only: digit 0..9 or msg::INVALID_DIGIT.
    int8_t lookup(msg::SegmentMask mask) const;

    // Lookup for one slot. On INVALID_DIGIT exactly one UNRECOGNIZED_DIGIT
    // record is appended to 'errors'. Never aborts the cycle.
    int8_t decode(msg::DigitSlot slot, msg::SegmentMask mask,
                  std::vector<msg::DecodeError>& errors) const;

    // Canonical mask of digit 0..9 (0 for out-of-range input).
    static msg::SegmentMask pattern(uint8_t digit);

private:
    static constexpr std::size_t TABLE_SIZE = 1u << msg::SEGMENT_COUNT;
    std::array<int8_t, TABLE_SIZE> m_table{};
};

} // namespace meter
