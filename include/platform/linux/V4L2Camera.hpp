#pragma once
#include <cstdint>
#include <string>
#include <opencv2/opencv.hpp>

#include "platform/IFrameSource.hpp"
#include "msg/ImageFrame.hpp"

namespace platform {

static constexpr uint32_t V4L2_MAX_BUFS = 16;

struct V4L2CameraConfig {
    std::string dev = "/dev/video0";

    // Must equal the resolution the display layout was tuned for.
    uint32_t width  = 800;
    uint32_t height = 600;

    // V4L2_PIX_FMT_GREY or V4L2_PIX_FMT_YUYV; 0 means GREY.
    // Plain fourcc so this header does not pull in linux/videodev2.h.
    uint32_t v4l2_pixfmt = 0;

    uint32_t buffer_count = 4;     // VIDIOC_REQBUFS request, 2..V4L2_MAX_BUFS
    uint32_t timeout_ms   = 2000;  // longest wait for a frame in Acquire()
};

// ---------------------------------------------------------------------------
// V4L2Camera: MMAP streaming capture from the meter camera.
//
// Acquire() drains the driver queue and keeps only the newest frame, converts
// it to GRAY8 into a buffer owned by the camera (YUYV -> luma), and hands every
// driver buffer back before returning. The frame view stays valid until the
// next Acquire() or Stop().
// ---------------------------------------------------------------------------
class V4L2Camera : public IFrameSource {
public:
    explicit V4L2Camera(const V4L2CameraConfig& cfg);
    ~V4L2Camera() override;

    V4L2Camera(const V4L2Camera&) = delete;
    V4L2Camera& operator=(const V4L2Camera&) = delete;

    // Open, check caps, force the exact format, map + queue buffers, stream on.
    bool Start() override;

    // Idempotent; also cleans up after a Start() that failed half way.
    void Stop() override;

    bool Acquire(msg::ImageFrame& out) override;

    const char* LastError() const override { return StatusStr(m_status); }

    uint32_t negotiatedWidth()  const { return m_width; }
    uint32_t negotiatedHeight() const { return m_height; }
    uint32_t negotiatedStride() const { return m_stride; }

    // Keep OPEN_FAIL..POLL_FAIL contiguous: those carry an errno.
    enum class Status : uint8_t {
        OK = 0,

        OPEN_FAIL,
        QUERYCAP_FAIL,
        SETFMT_FAIL,
        REQBUFS_FAIL,
        QUERYBUF_FAIL,
        MMAP_FAIL,
        QBUF_FAIL,
        STREAMON_FAIL,
        DQBUF_FAIL,
        POLL_FAIL,

        NOT_RUNNING,
        TIMEOUT,
        BAD_BUFF_INDEX,
        UNSUPPORTED_CAPS,
        UNSUPPORTED_FMT,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }
    int    lastErrno()  const { return m_errno; }

private:
    struct MmapBuf {
        uint8_t* ptr = nullptr;
        uint32_t len = 0;
    };

    V4L2CameraConfig m_cfg{};
    int m_fd = -1;

    // As granted by VIDIOC_G_FMT
    uint32_t m_width  = 0;
    uint32_t m_height = 0;
    uint32_t m_stride = 0;

    MmapBuf  m_bufs[V4L2_MAX_BUFS]{};
    uint32_t m_buf_count = 0;   // buffers currently mapped

    cv::Mat  m_gray;            // last frame, GRAY8, owned

    uint32_t m_frame_id = 0;
    bool     m_running  = false;

    Status m_status = Status::OK;
    int    m_errno  = 0;

    bool openDevice();
    bool queryCaps();
    bool setAndVerifyFormat();
    bool requestAndMapBuffers();
    bool queueAllBuffers();
    bool streamOn();
    void streamOff();
    void unmapBuffers();
    void closeDevice();

    bool waitReadable();
    bool dequeue(uint32_t& idx, bool& would_block);
    bool requeue(uint32_t idx);
    void convertToGray(uint32_t idx);

    bool fail(Status s);
};

} // namespace platform
