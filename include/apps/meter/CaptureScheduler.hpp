#pragma once
#include <cstdint>

namespace meter {

struct CaptureSchedulerConfig {
    double   interval_s  = 0.35;  // minimum time between capture starts
    uint32_t max_idle_ms = 50;    // cap on one idle sleep, keeps stop requests responsive
};

// ---------------------------------------------------------------------------
// CaptureScheduler: rate-limited poll, not a fixed-rate timer.
// The caller samples 'now' once per loop iteration, asks due(), and on a
// capture stores that same 'now' with markCaptured(). Drift under load is
// not corrected.
// ---------------------------------------------------------------------------
class CaptureScheduler {
public:
    explicit CaptureScheduler(const CaptureSchedulerConfig& cfg = {});

    void setConfig(const CaptureSchedulerConfig& cfg);
    const CaptureSchedulerConfig& getConfig() const { return m_cfg; }

    // true  -> a capture should start now.
    // false -> not yet; idle_ms is a bounded sleep (1..max_idle_ms, never
    //          longer than the remaining interval rounded up to 1 ms).
    bool due(uint64_t now_us, uint32_t& idle_ms) const;

    void markCaptured(uint64_t now_us);

    // Forget the last capture; the next due() is true.
    void reset();

    uint64_t intervalUs() const { return m_interval_us; }
    bool     hasCaptured() const { return m_has_captured; }
    uint64_t lastCaptureUs() const { return m_last_capture_us; }

private:
    CaptureSchedulerConfig m_cfg{};
    uint64_t m_interval_us = 0;

    bool     m_has_captured = false;
    uint64_t m_last_capture_us = 0;
};

} // namespace meter
