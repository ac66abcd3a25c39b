#include "apps/meter/RegionEvaluator.hpp"

namespace meter {

RegionEvaluator::RegionEvaluator(int on_threshold) {
    setOnThreshold(on_threshold);
}

void RegionEvaluator::setOnThreshold(int on_threshold) {
    // A threshold of 0 would report every box as lit.
    m_on_threshold = (on_threshold < 1) ? 1 : on_threshold;
}

int RegionEvaluator::blackPixels(const cv::Mat& binary, const msg::Rect& box) const {
    if (binary.empty() || !box.valid()) return 0;

    const cv::Rect roi = cv::Rect(box.x1, box.y1, box.width(), box.height())
                       & cv::Rect(0, 0, binary.cols, binary.rows);
    if (roi.area() <= 0) return 0;

    const int white = cv::countNonZero(binary(roi));
    return roi.area() - white;
}

} // namespace meter
