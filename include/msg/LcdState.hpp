#pragma once
#include <cstdint>
#include <cstddef>
#include <array>

namespace msg {

// Pixel coords: origin = top-left; x -> right, y -> down (in pixels).

// Half-open box [x1,x2) x [y1,y2).
struct Rect {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    constexpr bool valid() const { return x1 < x2 && y1 < y2; }
    constexpr int  width()  const { return x2 - x1; }
    constexpr int  height() const { return y2 - y1; }
    constexpr int  area()   const { return valid() ? width() * height() : 0; }

    constexpr bool operator==(const Rect& o) const {
        return x1 == o.x1 && y1 == o.y1 && x2 == o.x2 && y2 == o.y2;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

// ----- 7-segment glyph -----
//
//     aaa
//    f   b
//    f   b
//     ggg
//    e   c
//    e   c
//     ddd
//
// One bit per segment; bit 0 = a ... bit 6 = g.
using SegmentMask = uint8_t;

enum class Segment : uint8_t { A = 0, B = 1, C = 2, D = 3, E = 4, F = 5, G = 6 };

constexpr std::size_t SEGMENT_COUNT = 7;
constexpr SegmentMask SEGMENT_ALL   = 0x7F;

constexpr SegmentMask segBit(Segment s) {
    return static_cast<SegmentMask>(1u << static_cast<uint8_t>(s));
}

constexpr char segmentName(std::size_t i) {
    return static_cast<char>('a' + i);
}

// ----- Display slots -----

// D0 is the least significant (rightmost) digit.
enum class DigitSlot : uint8_t { D0 = 0, D1 = 1, D2 = 2, D3 = 3, D4 = 4 };
constexpr std::size_t DIGIT_COUNT = 5;

// Decimal points, named by the multiplier they select.
enum class DotId : uint8_t {
    P1   = 0, // "0.1"   (between D1 and D0)
    P01  = 1, // "0.01"  (between D2 and D1)
    P001 = 2, // "0.001" (between D3 and D2)
};
constexpr std::size_t DOT_COUNT = 3;

// Unit / quantity indicators, in fixed enumeration order.
enum class ModeId : uint8_t {
    VOLT = 0,
    CURR = 1,
    WATT = 2,
    PF   = 3,
    KWH  = 4,
    HZ   = 5,
    TIME = 6,
};
constexpr std::size_t MODE_COUNT = 7;

const char* dotName(DotId d);
const char* modeName(ModeId m);

// Full decoded snapshot of the display for one cycle.
// Overwritten as a whole every cycle; never merged with the previous one.
struct LcdState {
    std::array<SegmentMask, DIGIT_COUNT> digits{};
    std::array<bool, DOT_COUNT>          dots{};
    std::array<bool, MODE_COUNT>         modes{};

    void clear() {
        digits.fill(0);
        dots.fill(false);
        modes.fill(false);
    }

    SegmentMask& digit(DigitSlot s) { return digits[static_cast<std::size_t>(s)]; }
    SegmentMask  digit(DigitSlot s) const { return digits[static_cast<std::size_t>(s)]; }

    bool dot(DotId d) const { return dots[static_cast<std::size_t>(d)]; }
    bool mode(ModeId m) const { return modes[static_cast<std::size_t>(m)]; }
};

} // namespace msg
