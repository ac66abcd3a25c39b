#pragma once
#include <cstdint>
#include <opencv2/opencv.hpp>

#include "apps/meter/Binarizer.hpp"
#include "apps/meter/RegionEvaluator.hpp"
#include "apps/meter/RoiGeometry.hpp"
#include "apps/meter/SegmentDecoder.hpp"
#include "apps/meter/ValueAssembler.hpp"

#include "msg/ImageFrame.hpp"
#include "msg/LcdState.hpp"
#include "msg/MeterReading.hpp"

namespace meter {

// ---------------------------------------------------------------------------
// Configuration for the LcdDecoder (tunable parameters, no state).
// ---------------------------------------------------------------------------
struct LcdDecoderConfig {
    uint8_t BIN_THRESH   = BIN_THRESH_DEFAULT;    // GRAY8 threshold, >= -> white
    uint8_t BIN_MAXVAL   = BIN_MAXVAL_DEFAULT;    // value written for white pixels
    int     ON_THRESHOLD = ON_THRESHOLD_DEFAULT;  // black pixels for a box to count as lit

    DisplayLayout LAYOUT{};
};

// ---------------------------------------------------------------------------
// LcdDecoder: one GRAY8 frame -> LcdState + DecodeResult.
// Call decode() once per captured frame.
// ---------------------------------------------------------------------------
class LcdDecoder {
public:
    explicit LcdDecoder(const LcdDecoderConfig& cfg = {});

    void setConfig(const LcdDecoderConfig& cfg);
    const LcdDecoderConfig& getConfig() const { return m_cfg; }

    // Binarize, evaluate 3 dots + 7 modes + 5x7 segments, decode the digits
    // and assemble the reading. 'state' and 'out' are overwritten entirely.
    // Returns false only if the frame cannot be used (empty / not GRAY8);
    // unrecognized digits still return true with out.valid == false.
    // If 'binary_out' is given, the binary image of this cycle is moved into it.
    bool decode(const msg::ImageFrame& frame,
                msg::LcdState& state,
                msg::DecodeResult& out,
                cv::Mat* binary_out = nullptr);

private:
    LcdDecoderConfig m_cfg{};

    RegionEvaluator m_eval;
    SegmentDecoder  m_seg;
    ValueAssembler  m_asm;

    void evaluateRegions(const cv::Mat& binary, msg::LcdState& state) const;
};

} // namespace meter
