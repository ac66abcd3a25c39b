#pragma once
#include <atomic>
#include <string>
#include <cstdint>
#include <opencv2/opencv.hpp>

#include "os/rtos.hpp"

#include "apps/meter/CaptureScheduler.hpp"
#include "apps/meter/CsvLogger.hpp"
#include "apps/meter/LcdDecoder.hpp"
#include "apps/meter/TelemetryEnricher.hpp"

#include "platform/IFrameSource.hpp"

#include "msg/ImageFrame.hpp"
#include "msg/LcdState.hpp"
#include "msg/MeterReading.hpp"

namespace meter {

struct MeterTaskConfig {
    LcdDecoderConfig       decoder{};
    CaptureSchedulerConfig scheduler{};

    // Consecutive frame failures before the operator is warned and retries back off.
    uint32_t frame_fail_warn_after = 3;
    // Extra wait per failed cycle once the warning threshold is reached.
    uint32_t frame_fail_backoff_ms = 1000;
};

// Optional observer called after every logged cycle (e.g. preview window).
// Runs on the loop thread; must not hold on to 'frame' or 'binary'.
class CycleTap {
public:
    virtual void onCycle(const msg::ImageFrame& frame,
                         const cv::Mat& binary,
                         const msg::LcdState& state,
                         const msg::LogRecord& rec) = 0;

    virtual ~CycleTap() = default;
};

// ---------------------------------------------------------------------------
//  MeterTask: the capture -> decode -> log session.
//
//  Owns the per-cycle state (LcdState, scheduler); borrows the frame source,
//  the log sink, the telemetry enricher and the clock, which must outlive it.
//  Single-threaded: only RequestStop() may be called from elsewhere
//  (signal handler, preview key).
// ---------------------------------------------------------------------------
class MeterTask {
public:
    MeterTask(const MeterTaskConfig& cfg,
              platform::IFrameSource& source,
              CsvLogger& log,
              TelemetryEnricher& telemetry,
              Rtos::Clock& clock);

    enum class TickResult : uint8_t {
        IDLE = 0,   // not due yet; slept briefly
        LOGGED,     // one row written
        SKIPPED,    // frame unavailable; no row, next scheduled cycle retries
        FATAL,      // log sink failed; the loop must end
    };

    static const char* TickResultStr(TickResult r);

    // One loop iteration: either idle briefly or run one full cycle.
    TickResult Tick();

    // Loop until RequestStop() or a fatal log error. An in-flight cycle always
    // finishes its row. Returns false on fatal exit.
    bool Run();

    // Request graceful stop (async-signal-safe: single atomic store).
    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }

    void setTap(CycleTap* tap) { m_tap = tap; }

    enum class Status : uint8_t {
        OK = 0,
        FRAME_FAIL,
        LOG_FAIL,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

    // Introspection for logging/tests
    uint64_t cyclesLogged()  const { return m_cycles_logged; }
    uint64_t cyclesSkipped() const { return m_cycles_skipped; }
    uint32_t consecutiveFrameFailures() const { return m_consecutive_frame_fail; }
    const msg::LcdState& lastState() const { return m_state; }
    const msg::LogRecord& lastRecord() const { return m_last_record; }

private:
    MeterTaskConfig m_cfg{};

    platform::IFrameSource& m_source;
    CsvLogger&              m_log;
    TelemetryEnricher&      m_telemetry;
    Rtos::Clock&            m_clock;

    LcdDecoder       m_decoder;
    CaptureScheduler m_scheduler;

    msg::LcdState  m_state{};
    msg::LogRecord m_last_record{};

    CycleTap* m_tap = nullptr;

    std::atomic<bool> m_stop_requested{false};

    uint64_t m_cycles_logged = 0;
    uint64_t m_cycles_skipped = 0;
    uint32_t m_consecutive_frame_fail = 0;
    std::string m_last_frame_error;   // reported on the first row after a failure streak

    // FDIR
    Status m_status = Status::OK;

    TickResult runCycle(uint64_t now_us);
    TickResult frameFailed(const char* why);

    // Sleep in scheduler-sized slices so a stop request cuts it short.
    void backoff(uint32_t total_ms);
};

} // namespace meter
