#include "apps/meter/ValueAssembler.hpp"

namespace meter {

namespace {

// Place value of each slot, index = DigitSlot.
constexpr int32_t DIGIT_WEIGHTS[msg::DIGIT_COUNT] = { 1, 10, 100, 1000, 10000 };

} // anonymous namespace

double ValueAssembler::dotMultiplier(const DotFlags& dots) {
    if (dots[static_cast<std::size_t>(msg::DotId::P1)])   return 0.1;
    if (dots[static_cast<std::size_t>(msg::DotId::P01)])  return 0.01;
    if (dots[static_cast<std::size_t>(msg::DotId::P001)]) return 0.001;
    return 1.0;
}

std::string ValueAssembler::modeLabel(const ModeFlags& modes) {
    std::string label;
    for (std::size_t i = 0; i < msg::MODE_COUNT; ++i) {
        if (!modes[i]) continue;
        if (!label.empty()) label += '+';
        label += msg::modeName(static_cast<msg::ModeId>(i));
    }
    return label.empty() ? std::string(msg::MODE_UNKNOWN) : label;
}

void ValueAssembler::assemble(const DigitValues& digits,
                              const DotFlags& dots,
                              const ModeFlags& modes,
                              msg::DecodeResult& out) const {
    out.digits = digits;
    out.mode   = modeLabel(modes);

    uint8_t bad = 0;
    int32_t raw = 0;
    for (std::size_t i = 0; i < msg::DIGIT_COUNT; ++i) {
        if (digits[i] == msg::INVALID_DIGIT || digits[i] < 0 || digits[i] > 9) {
            ++bad;
            continue;
        }
        raw += digits[i] * DIGIT_WEIGHTS[i];
    }

    if (bad > 0) {
        msg::DecodeError e{};
        e.kind  = msg::DecodeError::Kind::INVALID_READING;
        e.count = bad;
        out.errors.push_back(e);

        out.value = 0.0;
        out.valid = false;
        return;
    }

    out.value = static_cast<double>(raw) * dotMultiplier(dots);
    out.valid = true;
}

} // namespace meter
