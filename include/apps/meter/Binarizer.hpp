#pragma once
#include <cstdint>
#include <opencv2/opencv.hpp>

#include "msg/ImageFrame.hpp"

namespace meter {

static constexpr uint8_t BIN_THRESH_DEFAULT = 160;
static constexpr uint8_t BIN_MAXVAL_DEFAULT = 255;

// Non-owning CV_8UC1 header over a GRAY8 frame (honours stride).
// Returns an empty Mat if the frame is empty or not 1 byte per pixel.
cv::Mat wrapGray(const msg::ImageFrame& frame);

// Fixed global threshold: pixel >= thresh -> maxval (white), else 0 (black).
// LCD ink ends up black. 'out' is (re)allocated to the frame size.
// Returns false if the frame cannot be wrapped.
bool binarize(const msg::ImageFrame& frame, uint8_t thresh, uint8_t maxval, cv::Mat& out);

} // namespace meter
