#pragma once
#include <opencv2/opencv.hpp>

#include "msg/LcdState.hpp"

namespace meter {

static constexpr int ON_THRESHOLD_DEFAULT = 100;

// ---------------------------------------------------------------------------
// RegionEvaluator: decides whether a segment / dot / mode box is lit.
//
// black = area(box) - white_pixels(box); lit <=> black >= ON_THRESHOLD.
// The threshold is an absolute pixel count, so it has to be re-tuned
// whenever the layout box sizes change.
// ---------------------------------------------------------------------------
class RegionEvaluator {
public:
    explicit RegionEvaluator(int on_threshold = ON_THRESHOLD_DEFAULT);

    void setOnThreshold(int on_threshold);
    int  onThreshold() const { return m_on_threshold; }

    // Number of non-white pixels inside 'box' on a binary CV_8UC1 image.
    // The box is clipped to the image; the clipped area is used.
    int blackPixels(const cv::Mat& binary, const msg::Rect& box) const;

    bool isOn(const cv::Mat& binary, const msg::Rect& box) const {
        return blackPixels(binary, box) >= m_on_threshold;
    }

private:
    int m_on_threshold = ON_THRESHOLD_DEFAULT;
};

} // namespace meter
