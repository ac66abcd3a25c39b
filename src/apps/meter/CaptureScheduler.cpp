#include "apps/meter/CaptureScheduler.hpp"
#include <cmath>

namespace meter {

static inline CaptureSchedulerConfig sanitise(const CaptureSchedulerConfig& in) {
    CaptureSchedulerConfig cfg = in;

    if (!(cfg.interval_s >= 0.0)) cfg.interval_s = 0.35;   // also catches NaN
    if (cfg.interval_s > 3600.0)  cfg.interval_s = 3600.0;
    if (cfg.max_idle_ms < 1)      cfg.max_idle_ms = 1;

    return cfg;
}

CaptureScheduler::CaptureScheduler(const CaptureSchedulerConfig& cfg) {
    setConfig(cfg);
}

void CaptureScheduler::setConfig(const CaptureSchedulerConfig& cfg) {
    m_cfg = sanitise(cfg);
    m_interval_us = static_cast<uint64_t>(std::llround(m_cfg.interval_s * 1e6));
}

bool CaptureScheduler::due(uint64_t now_us, uint32_t& idle_ms) const {
    idle_ms = 0;
    if (!m_has_captured) return true;

    // Monotonic time should never go backwards; if it does, capture now.
    if (now_us < m_last_capture_us) return true;

    const uint64_t elapsed_us = now_us - m_last_capture_us;
    if (elapsed_us >= m_interval_us) return true;

    const uint64_t remaining_us = m_interval_us - elapsed_us;
    uint64_t sleep_ms = (remaining_us + 999ull) / 1000ull;
    if (sleep_ms > m_cfg.max_idle_ms) sleep_ms = m_cfg.max_idle_ms;
    if (sleep_ms < 1) sleep_ms = 1;

    idle_ms = static_cast<uint32_t>(sleep_ms);
    return false;
}

void CaptureScheduler::markCaptured(uint64_t now_us) {
    m_last_capture_us = now_us;
    m_has_captured = true;
}

void CaptureScheduler::reset() {
    m_has_captured = false;
    m_last_capture_us = 0;
}

} // namespace meter
