#include "msg/MeterReading.hpp"
#include "msg/LcdState.hpp"

namespace msg {

const char* dotName(DotId d) {
    switch (d) {
        case DotId::P1:   return "0.1";
        case DotId::P01:  return "0.01";
        case DotId::P001: return "0.001";
        default:          return "?";
    }
}

const char* modeName(ModeId m) {
    switch (m) {
        case ModeId::VOLT: return "volt";
        case ModeId::CURR: return "curr";
        case ModeId::WATT: return "w";
        case ModeId::PF:   return "pf";
        case ModeId::KWH:  return "kwh";
        case ModeId::HZ:   return "hz";
        case ModeId::TIME: return "time";
        default:           return "?";
    }
}

std::string describe(const DecodeError& e) {
    switch (e.kind) {
        case DecodeError::Kind::UNRECOGNIZED_DIGIT: {
            // Bits are walked a..g, so names come out sorted.
            std::string s = "d" + std::to_string(e.slot) + ": unrecognized segments [";
            bool first = true;
            for (std::size_t i = 0; i < SEGMENT_COUNT; ++i) {
                if (!(e.segments & (1u << i))) continue;
                if (!first) s += ' ';
                s += segmentName(i);
                first = false;
            }
            s += ']';
            return s;
        }
        case DecodeError::Kind::INVALID_READING:
            return "invalid reading: " + std::to_string(e.count) + " unrecognized digit(s), value forced to 0";
        default:
            return "unknown error";
    }
}

std::string joinErrors(const std::vector<DecodeError>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += describe(e);
    }
    return out;
}

} // namespace msg
