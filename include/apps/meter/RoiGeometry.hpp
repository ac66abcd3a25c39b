#pragma once
#include <array>
#include <cstdint>
#include <string>

#include "msg/LcdState.hpp"

namespace meter {

// ---------------------------------------------------------------------------
// Segment sub-box geometry relative to a digit box centre (tunable, no state).
// Tuned once for the physical rig at 800x600; not derived from image content.
// ---------------------------------------------------------------------------
struct SegmentGeometry {
    int SEG_SHORT = 14;   // stroke thickness [px]
    int SEG_LONG  = 36;   // stroke length [px]

    int DY_OUTER  = 56;   // a/d centre above/below the digit centre [px]
    int DX_SIDE   = 28;   // b/c/e/f centre left/right of the digit centre [px]
    int DY_SIDE   = 28;   // b/f and c/e centre above/below the digit centre [px]
};

using SegmentRois = std::array<msg::Rect, msg::SEGMENT_COUNT>;

// Derive the seven segment boxes of one digit, ordered a..g:
// (top, upper-right, lower-right, bottom, lower-left, upper-left, middle).
// Pure and deterministic.
SegmentRois segmentRois(const msg::Rect& digit_box, const SegmentGeometry& geo);

// Box of size w x h centred on (cx, cy), half-open.
msg::Rect centeredRect(int cx, int cy, int w, int h);

// ---------------------------------------------------------------------------
// Fixed layout of the meter display inside the camera frame.
// ---------------------------------------------------------------------------
struct DisplayLayout {
    // Indexed by msg::DigitSlot (D0 = rightmost).
    std::array<msg::Rect, msg::DIGIT_COUNT> DIGIT_BOXES = {{
        {560, 220, 640, 360},   // D0
        {455, 220, 535, 360},   // D1
        {350, 220, 430, 360},   // D2
        {245, 220, 325, 360},   // D3
        {140, 220, 220, 360},   // D4
    }};

    // Indexed by msg::DotId. Each dot sits left of the digit it scales.
    std::array<msg::Rect, msg::DOT_COUNT> DOT_BOXES = {{
        {541, 342, 555, 356},   // "0.1"   D1|D0
        {436, 342, 450, 356},   // "0.01"  D2|D1
        {331, 342, 345, 356},   // "0.001" D3|D2
    }};

    // Indexed by msg::ModeId (volt, curr, w, pf, kwh, hz, time).
    std::array<msg::Rect, msg::MODE_COUNT> MODE_BOXES = {{
        {140, 400, 170, 420},
        {215, 400, 245, 420},
        {290, 400, 320, 420},
        {365, 400, 395, 420},
        {440, 400, 470, 420},
        {515, 400, 545, 420},
        {590, 400, 620, 420},
    }};

    SegmentGeometry SEGMENTS{};

    // Segment boxes of one digit slot.
    SegmentRois digitSegments(msg::DigitSlot slot) const {
        return segmentRois(DIGIT_BOXES[static_cast<std::size_t>(slot)], SEGMENTS);
    }

    // Every box (digits, derived segments, dots, modes) must be non-empty and
    // lie inside a width x height frame. On failure 'why' names the first bad box.
    bool validate(uint32_t width, uint32_t height, std::string& why) const;
};

} // namespace meter
