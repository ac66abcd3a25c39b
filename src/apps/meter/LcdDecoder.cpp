#include "apps/meter/LcdDecoder.hpp"
#include <utility>

namespace meter {
static inline LcdDecoderConfig sanitise(const LcdDecoderConfig& in) {
    LcdDecoderConfig cfg = in;

    if (cfg.BIN_THRESH == 0) cfg.BIN_THRESH = 1;     // 0 would read every box as unlit
    if (cfg.BIN_MAXVAL == 0) cfg.BIN_MAXVAL = 255;   // white must be non-zero for countNonZero
    if (cfg.ON_THRESHOLD < 1) cfg.ON_THRESHOLD = 1;

    return cfg;
}
} // namespace meter

meter::LcdDecoder::LcdDecoder(const LcdDecoderConfig& cfg)
: m_cfg(sanitise(cfg))
, m_eval(m_cfg.ON_THRESHOLD) {
}

void meter::LcdDecoder::setConfig(const LcdDecoderConfig& cfg) {
    m_cfg = sanitise(cfg);
    m_eval.setOnThreshold(m_cfg.ON_THRESHOLD);
}

void meter::LcdDecoder::evaluateRegions(const cv::Mat& binary, msg::LcdState& state) const {
    const DisplayLayout& L = m_cfg.LAYOUT;

    for (std::size_t i = 0; i < msg::DOT_COUNT; ++i) {
        state.dots[i] = m_eval.isOn(binary, L.DOT_BOXES[i]);
    }

    for (std::size_t i = 0; i < msg::MODE_COUNT; ++i) {
        state.modes[i] = m_eval.isOn(binary, L.MODE_BOXES[i]);
    }

    for (std::size_t d = 0; d < msg::DIGIT_COUNT; ++d) {
        const SegmentRois segs = L.digitSegments(static_cast<msg::DigitSlot>(d));

        msg::SegmentMask mask = 0;
        for (std::size_t s = 0; s < msg::SEGMENT_COUNT; ++s) {
            if (m_eval.isOn(binary, segs[s])) {
                mask = static_cast<msg::SegmentMask>(mask | (1u << s));
            }
        }
        state.digits[d] = mask;
    }
}

bool meter::LcdDecoder::decode(const msg::ImageFrame& frame,
                               msg::LcdState& state,
                               msg::DecodeResult& out,
                               cv::Mat* binary_out) {
    // Start every cycle from scratch; nothing carries over from the last frame.
    state.clear();
    out = msg::DecodeResult{};
    out.digits.fill(msg::INVALID_DIGIT);

    // BINARIZATION
    cv::Mat binary;
    if (!binarize(frame, m_cfg.BIN_THRESH, m_cfg.BIN_MAXVAL, binary)) {
        return false;
    }

    // REGION EVALUATION (dots, modes, segments)
    evaluateRegions(binary, state);

    // DIGIT DECODING: every slot independently, failures aggregated
    DigitValues digits{};
    for (std::size_t d = 0; d < msg::DIGIT_COUNT; ++d) {
        const auto slot = static_cast<msg::DigitSlot>(d);
        digits[d] = m_seg.decode(slot, state.digit(slot), out.errors);
    }

    // ASSEMBLY
    m_asm.assemble(digits, state.dots, state.modes, out);

    if (binary_out) *binary_out = std::move(binary);
    return true;
}
