#include "apps/meter/RoiGeometry.hpp"
#include <iostream>
#include <string>

static int g_failures = 0;

static void check(const std::string& name, bool ok) {
    std::cout << "  " << name << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

static bool inside(const msg::Rect& inner, const msg::Rect& outer) {
    return inner.x1 >= outer.x1 && inner.y1 >= outer.y1 &&
           inner.x2 <= outer.x2 && inner.y2 <= outer.y2;
}

int main() {
    using namespace meter;

    std::cout << "=== meter_roigeometry_test ===\n";
    const DisplayLayout layout{};

    {
        std::cout << "\n[Test 0] centeredRect is half-open and sized exactly\n";
        const msg::Rect r = centeredRect(100, 50, 36, 14);
        check("x1,y1", r.x1 == 82 && r.y1 == 43);
        check("size",  r.width() == 36 && r.height() == 14 && r.area() == 36 * 14);
    }

    {
        std::cout << "\n[Test 1] segment boxes are deterministic\n";
        const SegmentRois a = layout.digitSegments(msg::DigitSlot::D3);
        const SegmentRois b = segmentRois(layout.DIGIT_BOXES[3], layout.SEGMENTS);
        check("same input, same boxes", a == b);
    }

    {
        std::cout << "\n[Test 2] a..g sit where a 7-segment glyph puts them\n";
        for (std::size_t d = 0; d < msg::DIGIT_COUNT; ++d) {
            const msg::Rect& box = layout.DIGIT_BOXES[d];
            const SegmentRois s = layout.digitSegments(static_cast<msg::DigitSlot>(d));
            const int cx = (box.x1 + box.x2) / 2;
            const int cy = (box.y1 + box.y2) / 2;

            bool ok = true;
            for (const auto& r : s) ok = ok && r.valid() && inside(r, box);

            // vertical order of the horizontal bars: a above g above d
            ok = ok && s[0].y2 <= s[6].y1 && s[6].y2 <= s[3].y1;
            // b, c right of centre; e, f left of centre
            ok = ok && s[1].x1 > cx && s[2].x1 > cx && s[4].x2 < cx && s[5].x2 < cx;
            // b, f upper half; c, e lower half
            ok = ok && s[1].y2 <= cy + 1 && s[5].y2 <= cy + 1 && s[2].y1 >= cy - 1 && s[4].y1 >= cy - 1;
            // horizontal bars are wide, vertical bars are tall
            ok = ok && s[0].width() > s[0].height() && s[1].height() > s[1].width();

            check("digit d" + std::to_string(d), ok);
        }
    }

    {
        std::cout << "\n[Test 3] digit slots run right to left\n";
        bool ok = true;
        for (std::size_t d = 1; d < msg::DIGIT_COUNT; ++d) {
            ok = ok && layout.DIGIT_BOXES[d].x2 <= layout.DIGIT_BOXES[d - 1].x1;
        }
        check("D0 rightmost", ok);
    }

    {
        std::cout << "\n[Test 4] layout validation\n";
        std::string why;
        check("800x600 fits", layout.validate(800, 600, why) && why.empty());

        const bool small = layout.validate(600, 400, why);
        std::cout << "  600x400: " << why << "\n";
        check("600x400 rejected", !small && why == "digit box d0 outside frame");

        DisplayLayout bad = layout;
        bad.MODE_BOXES[5] = msg::Rect{515, 400, 515, 420};
        const bool empty_box = bad.validate(800, 600, why);
        std::cout << "  empty mode box: " << why << "\n";
        check("empty box rejected", !empty_box && why == "mode hz outside frame");

        DisplayLayout neg = layout;
        neg.SEGMENTS.SEG_SHORT = 0;
        check("zero stroke rejected", !neg.validate(800, 600, why));
    }

    if (g_failures) {
        std::cout << "\nmeter_roigeometry_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nmeter_roigeometry_test: PASS\n";
    return 0;
}
