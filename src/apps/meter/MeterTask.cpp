// MeterTask.cpp
#include "apps/meter/MeterTask.hpp"
#include <cstring>
#include <iostream>
#include <string>

namespace meter {

MeterTask::MeterTask(const MeterTaskConfig& cfg,
                     platform::IFrameSource& source,
                     CsvLogger& log,
                     TelemetryEnricher& telemetry,
                     Rtos::Clock& clock)
: m_cfg(cfg)
, m_source(source)
, m_log(log)
, m_telemetry(telemetry)
, m_clock(clock)
, m_decoder(cfg.decoder)
, m_scheduler(cfg.scheduler) {
    if (m_cfg.frame_fail_warn_after < 1) m_cfg.frame_fail_warn_after = 1;
    m_state.clear();
}

MeterTask::TickResult MeterTask::Tick() {
    const uint64_t now_us = m_clock.monoUs();

    uint32_t idle_ms = 0;
    if (!m_scheduler.due(now_us, idle_ms)) {
        m_clock.sleepMs(idle_ms);
        return TickResult::IDLE;
    }

    return runCycle(now_us);
}

bool MeterTask::Run() {
    std::cout << "[METER] loop started, interval="
              << m_scheduler.getConfig().interval_s << "s\n";

    while (!StopRequested()) {
        if (Tick() == TickResult::FATAL) {
            std::cout << "[METER] stopping on fatal error: " << StatusStr(m_status) << "\n";
            return false;
        }
    }

    std::cout << "[METER] stop requested, " << m_cycles_logged << " rows logged, "
              << m_cycles_skipped << " cycles skipped\n";
    return true;
}

// -------------------- private helpers --------------------

MeterTask::TickResult MeterTask::runCycle(uint64_t now_us) {
    // Time is sampled once; the same instant schedules the next cycle and
    // stamps the row.
    m_scheduler.markCaptured(now_us);

    msg::LogRecord rec{};
    rec.wall_ms = m_clock.wallMs();

    // ---- Frame acquisition ----
    msg::ImageFrame frame{};
    if (!m_source.Acquire(frame)) {
        return frameFailed(m_source.LastError());
    }

    // ---- Decode ----
    cv::Mat binary;
    if (!m_decoder.decode(frame, m_state, rec.result, m_tap ? &binary : nullptr)) {
        return frameFailed("frame is not GRAY8");
    }

    if (m_consecutive_frame_fail > 0) {
        std::cout << "[METER] frames back after " << m_consecutive_frame_fail << " failed cycle(s)\n";
        rec.error = "recovered after " + std::to_string(m_consecutive_frame_fail) +
                    " failed frame(s): " + m_last_frame_error;
    }
    m_consecutive_frame_fail = 0;

    for (const auto& e : rec.result.errors) {
        std::cout << "[DECODE] WARN frame=" << frame.frame_id << " " << msg::describe(e) << "\n";
    }

    // ---- Telemetry (best effort) ----
    m_telemetry.enrich(rec.telemetry);

    // ---- Log ----
    if (!m_log.Write(rec)) {
        m_status = Status::LOG_FAIL;
        std::cerr << "[METER] ERROR: log write failed: "
                  << CsvLogger::StatusStr(m_log.lastStatus());
        if (m_log.lastErrno() != 0) {
            std::cerr << " errno=" << m_log.lastErrno() << " (" << std::strerror(m_log.lastErrno()) << ")";
        }
        std::cerr << "\n";
        return TickResult::FATAL;
    }

    m_status = Status::OK;
    ++m_cycles_logged;
    m_last_record = rec;

    if (m_tap) m_tap->onCycle(frame, binary, m_state, rec);

    return TickResult::LOGGED;
}

MeterTask::TickResult MeterTask::frameFailed(const char* why) {
    m_status = Status::FRAME_FAIL;
    ++m_cycles_skipped;
    ++m_consecutive_frame_fail;
    m_last_frame_error = why ? why : "unknown";

    if (m_consecutive_frame_fail >= m_cfg.frame_fail_warn_after) {
        std::cout << "[METER] WARN frame acquisition failed " << m_consecutive_frame_fail
                  << " times in a row (" << m_last_frame_error << "), backing off "
                  << m_cfg.frame_fail_backoff_ms << " ms\n";
        backoff(m_cfg.frame_fail_backoff_ms);
    } else {
        std::cout << "[METER] frame acquisition failed (" << m_last_frame_error
                  << "), cycle skipped\n";
    }

    return TickResult::SKIPPED;
}

void MeterTask::backoff(uint32_t total_ms) {
    const uint32_t slice = m_scheduler.getConfig().max_idle_ms;
    uint32_t left = total_ms;
    while (left > 0 && !StopRequested()) {
        const uint32_t step = (left < slice) ? left : slice;
        m_clock.sleepMs(step);
        left -= step;
    }
}

const char* MeterTask::TickResultStr(MeterTask::TickResult r) {
    switch (r) {
        case MeterTask::TickResult::IDLE:    return "IDLE";
        case MeterTask::TickResult::LOGGED:  return "LOGGED";
        case MeterTask::TickResult::SKIPPED: return "SKIPPED";
        case MeterTask::TickResult::FATAL:   return "FATAL";
        default:                             return "UNKNOWN";
    }
}

const char* MeterTask::StatusStr(MeterTask::Status s) {
    switch (s) {
        case MeterTask::Status::OK:         return "OK";
        case MeterTask::Status::FRAME_FAIL: return "FRAME_FAIL";
        case MeterTask::Status::LOG_FAIL:   return "LOG_FAIL";
        default:                            return "UNKNOWN";
    }
}

} // namespace meter
