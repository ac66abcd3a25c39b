#include "platform/linux/FileFrameSource.hpp"
#include "os/rtos.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

bool isImageFile(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp"
        || ext == ".pgm" || ext == ".tif" || ext == ".tiff";
}

} // anonymous namespace

namespace platform {

FileFrameSource::FileFrameSource(const FileFrameSourceConfig& cfg)
: m_cfg(cfg) {
}

bool FileFrameSource::Start() {
    m_files.clear();
    m_next = 0;
    m_frame_id = 0;
    m_status = Status::OK;

    std::error_code ec;
    if (fs::is_directory(m_cfg.path, ec)) {
        for (fs::directory_iterator it(m_cfg.path, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(ec) && isImageFile(it->path())) {
                m_files.push_back(it->path().string());
            }
        }
        std::sort(m_files.begin(), m_files.end());
        if (m_files.empty()) return fail(Status::NO_IMAGES);
    } else if (fs::is_regular_file(m_cfg.path, ec)) {
        m_files.push_back(m_cfg.path);
    } else {
        return fail(Status::NOT_FOUND);
    }

    std::cout << "[REPLAY] " << m_files.size() << " image(s) from " << m_cfg.path << "\n";
    m_running = true;
    return true;
}

void FileFrameSource::Stop() {
    m_running = false;
    m_gray.release();
}

bool FileFrameSource::Acquire(msg::ImageFrame& out) {
    if (!m_running) return fail(Status::NOT_RUNNING);

    m_current_file = m_files[m_next];
    m_next = (m_next + 1) % m_files.size();

    m_gray = cv::imread(m_current_file, cv::IMREAD_GRAYSCALE);
    if (m_gray.empty()) return fail(Status::READ_FAIL);

    if ((m_cfg.width  != 0 && static_cast<uint32_t>(m_gray.cols) != m_cfg.width) ||
        (m_cfg.height != 0 && static_cast<uint32_t>(m_gray.rows) != m_cfg.height)) {
        return fail(Status::SIZE_MISMATCH);
    }

    out.data         = m_gray.data;
    out.width        = static_cast<uint32_t>(m_gray.cols);
    out.height       = static_cast<uint32_t>(m_gray.rows);
    out.stride       = static_cast<uint32_t>(m_gray.step[0]);
    out.bytes_per_px = 1;
    out.t_mono_us    = Rtos::MonoUs();
    out.frame_id     = m_frame_id++;

    m_status = Status::OK;
    return true;
}

const char* FileFrameSource::StatusStr(FileFrameSource::Status s) {
    switch (s) {
        case FileFrameSource::Status::OK:            return "OK";
        case FileFrameSource::Status::NOT_FOUND:     return "NOT_FOUND";
        case FileFrameSource::Status::NO_IMAGES:     return "NO_IMAGES";
        case FileFrameSource::Status::NOT_RUNNING:   return "NOT_RUNNING";
        case FileFrameSource::Status::READ_FAIL:     return "READ_FAIL";
        case FileFrameSource::Status::SIZE_MISMATCH: return "SIZE_MISMATCH";
        default:                                     return "UNKNOWN";
    }
}

} // namespace platform
