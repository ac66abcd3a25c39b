#pragma once
#include <array>
#include <cstdint>
#include <string>

#include "msg/LcdState.hpp"
#include "msg/MeterReading.hpp"

namespace meter {

using DigitValues = std::array<int8_t, msg::DIGIT_COUNT>;   // index = DigitSlot
using DotFlags    = std::array<bool, msg::DOT_COUNT>;       // index = DotId
using ModeFlags   = std::array<bool, msg::MODE_COUNT>;      // index = ModeId

// ---------------------------------------------------------------------------
// ValueAssembler: digits + dots + modes -> value and unit label.
// Stateless; a failed cycle never reuses an earlier value.
// ---------------------------------------------------------------------------
class ValueAssembler {
public:
    // First lit dot wins: "0.1" > "0.01" > "0.001"; none lit -> 1.0.
    static double dotMultiplier(const DotFlags& dots);

    // Lit mode names joined with '+' in ModeId order, or "unknown".
    static std::string modeLabel(const ModeFlags& modes);

    // Fills value, mode, digits and valid. If any digit is INVALID_DIGIT the
    // value is 0.0 and one INVALID_READING record is appended to out.errors
    // (records already in out.errors are kept).
    void assemble(const DigitValues& digits,
                  const DotFlags& dots,
                  const ModeFlags& modes,
                  msg::DecodeResult& out) const;
};

} // namespace meter
