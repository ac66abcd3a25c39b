// V4L2Camera.cpp
#include "platform/linux/V4L2Camera.hpp"
#include "os/rtos.hpp"

#include <iostream>

#include <linux/videodev2.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <errno.h>

namespace {

// ioctl that resumes when a signal lands mid-call.
int xioctl(int fd, unsigned long req, void* arg) {
    for (;;) {
        const int r = ::ioctl(fd, req, arg);
        if (r != -1 || errno != EINTR) return r;
    }
}

v4l2_buffer mmapBuffer(uint32_t idx = 0) {
    v4l2_buffer buf{};
    buf.type   = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buf.memory = V4L2_MEMORY_MMAP;
    buf.index  = idx;
    return buf;
}

} // anonymous namespace

namespace platform {

static inline V4L2CameraConfig sanitise(const V4L2CameraConfig& in) {
    V4L2CameraConfig cfg = in;

    if (cfg.dev.empty()) cfg.dev = "/dev/video0";

    if (cfg.width == 0)  cfg.width  = 800;
    if (cfg.height == 0) cfg.height = 600;

    if (cfg.v4l2_pixfmt == 0) cfg.v4l2_pixfmt = V4L2_PIX_FMT_GREY;

    if (cfg.buffer_count < 2) cfg.buffer_count = 2;
    if (cfg.buffer_count > V4L2_MAX_BUFS) cfg.buffer_count = V4L2_MAX_BUFS;

    if (cfg.timeout_ms < 10) cfg.timeout_ms = 10;

    return cfg;
}

V4L2Camera::V4L2Camera(const V4L2CameraConfig& cfg)
: m_cfg(sanitise(cfg)) {
}

V4L2Camera::~V4L2Camera() {
    Stop();
}

bool V4L2Camera::Start() {
    if (m_running) return true;

    m_status = Status::OK;
    m_errno  = 0;

    if (m_cfg.v4l2_pixfmt != V4L2_PIX_FMT_GREY && m_cfg.v4l2_pixfmt != V4L2_PIX_FMT_YUYV) {
        return fail(Status::UNSUPPORTED_FMT);
    }

    // Each step records its own failure status; Stop() unwinds whatever was set up.
    const bool ok = openDevice()
                 && queryCaps()
                 && setAndVerifyFormat()
                 && requestAndMapBuffers()
                 && queueAllBuffers()
                 && streamOn();
    if (!ok) {
        Stop();
        return false;
    }

    m_frame_id = 0;
    std::cout << "[V4L2] streaming " << m_cfg.dev << " " << m_width << "x" << m_height
              << " stride=" << m_stride << " bufs=" << m_buf_count << "\n";
    return true;
}

void V4L2Camera::Stop() {
    if (m_running) streamOff();
    m_running = false;

    unmapBuffers();
    closeDevice();
}

bool V4L2Camera::Acquire(msg::ImageFrame& out) {
    if (!m_running) return fail(Status::NOT_RUNNING);

    if (!waitReadable()) return false;

    uint32_t idx = 0;
    bool would_block = false;
    if (!dequeue(idx, would_block)) {
        if (would_block) return fail(Status::TIMEOUT);
        return false;
    }

    // Freshest wins: the driver keeps filling buffers between our cycles, so
    // drain whatever is already queued and keep only the newest.
    while (true) {
        uint32_t newer = 0;
        bool empty = false;
        if (!dequeue(newer, empty)) {
            if (empty) break;
            (void)requeue(idx);
            return false;
        }
        if (!requeue(idx)) {
            (void)requeue(newer);
            return false;
        }
        idx = newer;
    }

    convertToGray(idx);
    if (!requeue(idx)) return false;

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

// -------------------- private helpers --------------------

bool V4L2Camera::openDevice() {
    m_fd = ::open(m_cfg.dev.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (m_fd < 0) return fail(Status::OPEN_FAIL);
    return true;
}

bool V4L2Camera::queryCaps() {
    v4l2_capability cap{};
    if (xioctl(m_fd, VIDIOC_QUERYCAP, &cap) == -1) return fail(Status::QUERYCAP_FAIL);

    const uint32_t need = V4L2_CAP_VIDEO_CAPTURE | V4L2_CAP_STREAMING;
    const uint32_t have = (cap.capabilities & V4L2_CAP_DEVICE_CAPS) ? cap.device_caps
                                                                    : cap.capabilities;
    if ((have & need) != need) return fail(Status::UNSUPPORTED_CAPS);
    return true;
}

bool V4L2Camera::setAndVerifyFormat() {
    v4l2_format fmt{};
    fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;

    v4l2_pix_format& pix = fmt.fmt.pix;
    pix.width       = m_cfg.width;
    pix.height      = m_cfg.height;
    pix.pixelformat = m_cfg.v4l2_pixfmt;
    pix.field       = V4L2_FIELD_NONE;

    if (xioctl(m_fd, VIDIOC_S_FMT, &fmt) == -1 ||
        xioctl(m_fd, VIDIOC_G_FMT, &fmt) == -1) {
        return fail(Status::SETFMT_FAIL);
    }

    // The ROI layout is pixel-accurate for one resolution: no silent rescale.
    const uint32_t bpp = (m_cfg.v4l2_pixfmt == V4L2_PIX_FMT_YUYV) ? 2u : 1u;
    const bool exact = pix.width == m_cfg.width
                    && pix.height == m_cfg.height
                    && pix.pixelformat == m_cfg.v4l2_pixfmt
                    && pix.bytesperline >= pix.width * bpp;
    if (!exact) {
        errno = 0;
        std::cout << "[V4L2] driver offered " << pix.width << "x" << pix.height
                  << " bytesperline=" << pix.bytesperline << ", wanted "
                  << m_cfg.width << "x" << m_cfg.height << "\n";
        return fail(Status::SETFMT_FAIL);
    }

    m_width  = pix.width;
    m_height = pix.height;
    m_stride = pix.bytesperline;
    return true;
}

bool V4L2Camera::requestAndMapBuffers() {
    v4l2_requestbuffers req{};
    req.type   = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    req.memory = V4L2_MEMORY_MMAP;
    req.count  = m_cfg.buffer_count;

    if (xioctl(m_fd, VIDIOC_REQBUFS, &req) == -1) return fail(Status::REQBUFS_FAIL);
    // Freshest-frame draining needs at least one buffer in flight while we hold one.
    if (req.count < 2) return fail(Status::REQBUFS_FAIL);

    const uint32_t granted = (req.count > V4L2_MAX_BUFS) ? V4L2_MAX_BUFS : req.count;

    for (m_buf_count = 0; m_buf_count < granted; ++m_buf_count) {
        v4l2_buffer buf = mmapBuffer(m_buf_count);
        if (xioctl(m_fd, VIDIOC_QUERYBUF, &buf) == -1) return fail(Status::QUERYBUF_FAIL);

        void* p = ::mmap(nullptr, buf.length, PROT_READ | PROT_WRITE, MAP_SHARED, m_fd, buf.m.offset);
        if (p == MAP_FAILED) return fail(Status::MMAP_FAIL);

        m_bufs[m_buf_count] = MmapBuf{static_cast<uint8_t*>(p), buf.length};
    }
    return true;
}

bool V4L2Camera::queueAllBuffers() {
    for (uint32_t i = 0; i < m_buf_count; ++i) {
        if (!requeue(i)) return false;
    }
    return true;
}

bool V4L2Camera::streamOn() {
    int type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    if (xioctl(m_fd, VIDIOC_STREAMON, &type) == -1) return fail(Status::STREAMON_FAIL);
    m_running = true;
    return true;
}

void V4L2Camera::streamOff() {
    int type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    if (xioctl(m_fd, VIDIOC_STREAMOFF, &type) == -1) {
        std::cout << "[V4L2] WARN stream off failed errno=" << errno << "\n";
    }
}

void V4L2Camera::unmapBuffers() {
    // m_buf_count also covers a mapping loop that stopped half way.
    for (uint32_t i = 0; i < m_buf_count; ++i) {
        MmapBuf& b = m_bufs[i];
        if (b.ptr) ::munmap(b.ptr, b.len);
        b = MmapBuf{};
    }
    m_buf_count = 0;
}

void V4L2Camera::closeDevice() {
    if (m_fd < 0) return;
    ::close(m_fd);
    m_fd = -1;
}

bool V4L2Camera::waitReadable() {
    pollfd pfd{};
    pfd.fd     = m_fd;
    pfd.events = POLLIN;

    // A signal (stop request) interrupts the wait; the cycle is then skipped.
    const int r = ::poll(&pfd, 1, static_cast<int>(m_cfg.timeout_ms));
    if (r < 0)  return fail(Status::POLL_FAIL);
    if (r == 0) return fail(Status::TIMEOUT);
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return fail(Status::POLL_FAIL);
    return true;
}

bool V4L2Camera::dequeue(uint32_t& idx, bool& would_block) {
    v4l2_buffer buf = mmapBuffer();

    would_block = false;
    if (xioctl(m_fd, VIDIOC_DQBUF, &buf) == -1) {
        would_block = (errno == EAGAIN);
        return would_block ? false : fail(Status::DQBUF_FAIL);
    }

    if (buf.index >= m_buf_count) return fail(Status::BAD_BUFF_INDEX);

    idx = buf.index;
    return true;
}

bool V4L2Camera::requeue(uint32_t idx) {
    if (idx >= m_buf_count) return fail(Status::BAD_BUFF_INDEX);

    v4l2_buffer buf = mmapBuffer(idx);
    if (xioctl(m_fd, VIDIOC_QBUF, &buf) == -1) return fail(Status::QBUF_FAIL);
    return true;
}

void V4L2Camera::convertToGray(uint32_t idx) {
    const int w = static_cast<int>(m_width);
    const int h = static_cast<int>(m_height);

    if (m_cfg.v4l2_pixfmt == V4L2_PIX_FMT_YUYV) {
        const cv::Mat yuyv(h, w, CV_8UC2, m_bufs[idx].ptr, m_stride);
        cv::cvtColor(yuyv, m_gray, cv::COLOR_YUV2GRAY_YUYV);
        return;
    }

    // GREY: copy out so the buffer can go straight back to the driver.
    const cv::Mat grey(h, w, CV_8UC1, m_bufs[idx].ptr, m_stride);
    grey.copyTo(m_gray);
}

// -------------------- FDIR --------------------

bool V4L2Camera::fail(Status s) {
    m_status = s;

    // OPEN_FAIL..POLL_FAIL come from a syscall; the rest are logic checks.
    const bool syscall = s >= Status::OPEN_FAIL && s <= Status::POLL_FAIL;
    m_errno = syscall ? errno : 0;
    return false;
}

const char* V4L2Camera::StatusStr(V4L2Camera::Status s) {
    switch (s) {
        case V4L2Camera::Status::OK:               return "OK";
        case V4L2Camera::Status::OPEN_FAIL:        return "OPEN_FAIL";
        case V4L2Camera::Status::QUERYCAP_FAIL:    return "QUERYCAP_FAIL";
        case V4L2Camera::Status::SETFMT_FAIL:      return "SETFMT_FAIL";
        case V4L2Camera::Status::REQBUFS_FAIL:     return "REQBUFS_FAIL";
        case V4L2Camera::Status::QUERYBUF_FAIL:    return "QUERYBUF_FAIL";
        case V4L2Camera::Status::MMAP_FAIL:        return "MMAP_FAIL";
        case V4L2Camera::Status::QBUF_FAIL:        return "QBUF_FAIL";
        case V4L2Camera::Status::STREAMON_FAIL:    return "STREAMON_FAIL";
        case V4L2Camera::Status::DQBUF_FAIL:       return "DQBUF_FAIL";
        case V4L2Camera::Status::POLL_FAIL:        return "POLL_FAIL";
        case V4L2Camera::Status::NOT_RUNNING:      return "NOT_RUNNING";
        case V4L2Camera::Status::TIMEOUT:          return "TIMEOUT";
        case V4L2Camera::Status::BAD_BUFF_INDEX:   return "BAD_BUFF_INDEX";
        case V4L2Camera::Status::UNSUPPORTED_CAPS: return "UNSUPPORTED_CAPS";
        case V4L2Camera::Status::UNSUPPORTED_FMT:  return "UNSUPPORTED_FMT";
        default:                                   return "UNKNOWN";
    }
}

} // namespace platform
