#include "apps/meter/Binarizer.hpp"

namespace meter {

cv::Mat wrapGray(const msg::ImageFrame& frame) {
    if (frame.empty() || frame.bytes_per_px != 1) return cv::Mat();
    if (frame.stride < frame.width) return cv::Mat();

    // OpenCV wants a mutable pointer for the header; nothing here writes through it.
    return cv::Mat(static_cast<int>(frame.height),
                   static_cast<int>(frame.width),
                   CV_8UC1,
                   const_cast<uint8_t*>(frame.data),
                   static_cast<std::size_t>(frame.stride));
}

bool binarize(const msg::ImageFrame& frame, uint8_t thresh, uint8_t maxval, cv::Mat& out) {
    const cv::Mat gray = wrapGray(frame);
    if (gray.empty()) return false;

    if (thresh == 0) {
        // Every pixel is >= 0.
        out.create(gray.size(), CV_8UC1);
        out.setTo(cv::Scalar(maxval));
        return true;
    }

    // THRESH_BINARY is strict (src > t), so t = thresh - 1 gives src >= thresh on 8-bit data.
    cv::threshold(gray, out, static_cast<double>(thresh) - 1.0,
                  static_cast<double>(maxval), cv::THRESH_BINARY);
    return true;
}

} // namespace meter
