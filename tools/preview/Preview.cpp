#include "preview/Preview.hpp"
#include "apps/meter/CsvLogger.hpp"

#include <cstdio>
#include <iostream>

namespace {

const cv::Scalar kOn (0, 0, 255);
const cv::Scalar kOff(0, 200, 0);

void box(cv::Mat& bgr, const msg::Rect& r, bool on) {
    // Rect is half-open, cv::rectangle corners are inclusive.
    cv::rectangle(bgr, cv::Point(r.x1, r.y1), cv::Point(r.x2 - 1, r.y2 - 1),
                  on ? kOn : kOff, on ? 2 : 1);
}

} // anonymous namespace

namespace preview {

PreviewWindow::PreviewWindow(meter::MeterTask& task, const meter::DisplayLayout& layout,
                             const PreviewConfig& cfg)
: m_task(task)
, m_layout(layout)
, m_cfg(cfg) {
}

PreviewWindow::~PreviewWindow() {
    if (m_open) cv::destroyWindow(m_cfg.window);
}

void PreviewWindow::onCycle(const msg::ImageFrame& frame,
                            const cv::Mat& binary,
                            const msg::LcdState& state,
                            const msg::LogRecord& rec) {
    cv::Mat gray;
    if (m_cfg.show_binary && !binary.empty()) {
        gray = binary;
    } else {
        gray = cv::Mat(static_cast<int>(frame.height), static_cast<int>(frame.width), CV_8UC1,
                       const_cast<uint8_t*>(frame.data), frame.stride);
    }

    cv::Mat bgr;
    cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
    annotate(bgr, m_layout, state, rec);

    if (!m_open) {
        cv::namedWindow(m_cfg.window, cv::WINDOW_AUTOSIZE);
        m_open = true;
        std::cout << "[PREVIEW] window open, press 'q' to quit\n";
    }
    cv::imshow(m_cfg.window, bgr);

    const int key = cv::waitKey(1) & 0xFF;
    if (key == 'q' || key == 27) {
        std::cout << "[PREVIEW] quit requested\n";
        m_task.RequestStop();
    }
}

void PreviewWindow::annotate(cv::Mat& bgr, const meter::DisplayLayout& layout,
                             const msg::LcdState& state, const msg::LogRecord& rec) {
    for (std::size_t d = 0; d < msg::DIGIT_COUNT; ++d) {
        const auto slot = static_cast<msg::DigitSlot>(d);
        const msg::Rect& digit = layout.DIGIT_BOXES[d];
        cv::rectangle(bgr, cv::Point(digit.x1, digit.y1), cv::Point(digit.x2 - 1, digit.y2 - 1),
                      cv::Scalar(255, 255, 0), 1);

        const meter::SegmentRois segs = layout.digitSegments(slot);
        const msg::SegmentMask mask = state.digit(slot);
        for (std::size_t s = 0; s < msg::SEGMENT_COUNT; ++s) {
            box(bgr, segs[s], (mask >> s) & 1u);
        }

        const int v = rec.result.digits[d];
        const std::string label = (v == msg::INVALID_DIGIT) ? "?" : std::to_string(v);
        cv::putText(bgr, label, cv::Point(digit.x1, digit.y1 - 8),
                    cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(255, 255, 0), 2);
    }

    for (std::size_t i = 0; i < msg::DOT_COUNT; ++i) {
        box(bgr, layout.DOT_BOXES[i], state.dots[i]);
    }

    for (std::size_t i = 0; i < msg::MODE_COUNT; ++i) {
        const msg::Rect& r = layout.MODE_BOXES[i];
        box(bgr, r, state.modes[i]);
        cv::putText(bgr, msg::modeName(static_cast<msg::ModeId>(i)), cv::Point(r.x1, r.y2 + 16),
                    cv::FONT_HERSHEY_SIMPLEX, 0.45, state.modes[i] ? kOn : kOff, 1);
    }

    int y = 28;
    auto put = [&](const std::string& s, const cv::Scalar& color) {
        cv::putText(bgr, s, cv::Point(10, y),
                    cv::FONT_HERSHEY_SIMPLEX, 0.7, color, 2);
        y += 28;
    };

    put(meter::CsvLogger::formatTimestamp(rec.wall_ms), cv::Scalar(255, 255, 255));

    char value[64];
    std::snprintf(value, sizeof(value), "%.4f %s", rec.result.value, rec.result.mode.c_str());
    put(value, rec.result.valid ? kOff : kOn);

    if (!rec.result.valid) put("INVALID", kOn);
}

} // namespace preview
