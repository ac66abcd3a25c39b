#include "apps/meter/SegmentDecoder.hpp"
#include "msg/MeterReading.hpp"
#include <iostream>
#include <vector>

static int g_failures = 0;

static void check(const std::string& name, bool ok) {
    std::cout << "  " << name << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

int main() {
    using namespace meter;

    std::cout << "=== meter_segmentdecoder_test ===\n";
    SegmentDecoder dec;

    {
        std::cout << "\n[Test 0] canonical glyphs decode to their digit\n";
        const uint8_t expect_mask[10] = {0x3F, 0x06, 0x5B, 0x4F, 0x66, 0x6D, 0x7D, 0x07, 0x7F, 0x6F};
        for (uint8_t d = 0; d < 10; ++d) {
            check("digit " + std::to_string(d),
                  SegmentDecoder::pattern(d) == expect_mask[d] && dec.lookup(expect_mask[d]) == d);
        }
    }

    {
        std::cout << "\n[Test 1] blank slot reads as 0 without error\n";
        std::vector<msg::DecodeError> errors;
        const int8_t v = dec.decode(msg::DigitSlot::D4, 0, errors);
        check("blank -> 0", v == 0);
        check("no error", errors.empty());
    }

    {
        std::cout << "\n[Test 2] every other mask is unrecognized with one error\n";
        int recognized = 0;
        bool all_ok = true;
        for (unsigned m = 0; m <= msg::SEGMENT_ALL; ++m) {
            std::vector<msg::DecodeError> errors;
            const int8_t v = dec.decode(msg::DigitSlot::D2, static_cast<msg::SegmentMask>(m), errors);
            if (v != msg::INVALID_DIGIT) {
                ++recognized;
                if (!errors.empty()) all_ok = false;
                continue;
            }
            if (errors.size() != 1) all_ok = false;
            else if (errors[0].kind != msg::DecodeError::Kind::UNRECOGNIZED_DIGIT ||
                     errors[0].slot != 2 || errors[0].segments != m) all_ok = false;
        }
        check("11 recognized masks (10 glyphs + blank)", recognized == 11);
        check("one UNRECOGNIZED_DIGIT per bad mask", all_ok);
    }

    {
        std::cout << "\n[Test 3] error names segments in a..g order\n";
        std::vector<msg::DecodeError> errors;
        // "7" with the middle bar caught half-lit: a b c g
        (void)dec.decode(msg::DigitSlot::D1, 0x47, errors);
        const std::string s = errors.empty() ? "" : msg::describe(errors[0]);
        std::cout << "  describe = " << s << "\n";
        check("text", s == "d1: unrecognized segments [a b c g]");
    }

    {
        std::cout << "\n[Test 4] out-of-range pattern / mask\n";
        check("pattern(10) == 0", SegmentDecoder::pattern(10) == 0);
        check("lookup(0x80) invalid", dec.lookup(0x80) == msg::INVALID_DIGIT);
    }

    if (g_failures) {
        std::cout << "\nmeter_segmentdecoder_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nmeter_segmentdecoder_test: PASS\n";
    return 0;
}
