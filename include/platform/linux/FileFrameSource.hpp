#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

#include "platform/IFrameSource.hpp"
#include "msg/ImageFrame.hpp"

namespace platform {

struct FileFrameSourceConfig {
    // One image, or a directory of images replayed in name order (cycling).
    std::string path;

    // Expected frame size; 0 accepts any size.
    uint32_t width  = 0;
    uint32_t height = 0;
};

// Replays still images as frames, decoded to GRAY8 with cv::imread.
class FileFrameSource : public IFrameSource {
public:
    explicit FileFrameSource(const FileFrameSourceConfig& cfg);

    bool Start() override;
    void Stop() override;
    bool Acquire(msg::ImageFrame& out) override;

    const char* LastError() const override { return StatusStr(m_status); }

    size_t fileCount() const { return m_files.size(); }
    const std::string& currentFile() const { return m_current_file; }

    enum class Status : uint8_t {
        OK = 0,
        NOT_FOUND,
        NO_IMAGES,
        NOT_RUNNING,
        READ_FAIL,
        SIZE_MISMATCH,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    FileFrameSourceConfig m_cfg{};

    std::vector<std::string> m_files;
    size_t      m_next = 0;
    std::string m_current_file;

    cv::Mat  m_gray;
    uint32_t m_frame_id = 0;
    bool     m_running = false;

    Status m_status = Status::OK;

    bool fail(Status s) { m_status = s; return false; }
};

} // namespace platform
