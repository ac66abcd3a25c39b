#pragma once
#include <string>
#include <opencv2/opencv.hpp>

#include "apps/meter/MeterTask.hpp"
#include "apps/meter/RoiGeometry.hpp"

namespace preview {

struct PreviewConfig {
    std::string window = "Power Meter";
    bool show_binary = false;   // show the thresholded image instead of the frame
};

// -------------------- Preview window --------------------
// Operator view hooked into the meter loop as a CycleTap:
// - draws every ROI (lit = red, unlit = green), the decoded value and time;
// - 'q' or ESC requests a graceful stop of the task.
// Needs a display; main only installs it when preview is enabled.
class PreviewWindow : public meter::CycleTap {
public:
    PreviewWindow(meter::MeterTask& task, const meter::DisplayLayout& layout,
                  const PreviewConfig& cfg = PreviewConfig{});
    ~PreviewWindow() override;

    void onCycle(const msg::ImageFrame& frame,
                 const cv::Mat& binary,
                 const msg::LcdState& state,
                 const msg::LogRecord& rec) override;

    // Draw the overlay onto a BGR image (exposed for snapshots).
    static void annotate(cv::Mat& bgr, const meter::DisplayLayout& layout,
                         const msg::LcdState& state, const msg::LogRecord& rec);

private:
    meter::MeterTask&    m_task;
    meter::DisplayLayout m_layout;
    PreviewConfig        m_cfg;
    bool                 m_open = false;
};

} // namespace preview
