#include "platform/linux/Lp4wCliTelemetry.hpp"
#include "os/rtos.hpp"

#include <iostream>
#include <limits>

namespace platform {

Lp4wCliTelemetry::Lp4wCliTelemetry(const Lp4wCliConfig& cfg)
: m_cfg(cfg) {
    if (m_cfg.cli.empty()) m_cfg.cli = "lifepo4wered-cli";
    if (m_cfg.timeout_ms == 0) m_cfg.timeout_ms = 1;
}

bool Lp4wCliTelemetry::read(PowerField field, int32_t& out_milli) {
    const char* var = nullptr;
    switch (field) {
        case PowerField::VBAT: var = "vbat"; break;
        case PowerField::VIN:  var = "vin";  break;
        case PowerField::IOUT: var = "iout"; break;
        default: return false;
    }

    int64_t v = 0;
    if (!get(var, v)) return false;
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
        m_failed_var = var;
        return false;
    }

    out_milli = static_cast<int32_t>(v);
    return true;
}

bool Lp4wCliTelemetry::applyPolicy(const PowerPolicy& policy) {
    if (!set("AUTO_BOOT",      std::to_string(policy.auto_boot)))      return false;
    if (!set("AUTO_SHDN_TIME", std::to_string(policy.auto_shdn_time))) return false;
    if (!set("VIN_THRESHOLD",  std::to_string(policy.vin_threshold)))  return false;

    if (policy.persist) {
        if (!set("CFG_WRITE", "0x46")) return false;
    }

    std::cout << "[TELEM] policy applied: AUTO_BOOT=" << policy.auto_boot
              << " AUTO_SHDN_TIME=" << policy.auto_shdn_time
              << " VIN_THRESHOLD=" << policy.vin_threshold
              << (policy.persist ? " (persisted)" : "") << "\n";
    return true;
}

// -------------------- private helpers --------------------

bool Lp4wCliTelemetry::run(const char* var, const std::string& cmd, std::string& text) {
    text.clear();

    if (m_hold_until_us != 0 && Rtos::MonoUs() < m_hold_until_us) {
        m_failed_var = var;
        return false;
    }
    m_hold_until_us = 0;

    m_run_status = RunCommand(cmd, text, m_cfg.timeout_ms);
    if (m_run_status == RunStatus::TIMEOUT) {
        m_hold_until_us = Rtos::MonoUs() + static_cast<uint64_t>(m_cfg.holdoff_ms) * 1000u;
        std::cout << "[TELEM] WARN " << m_cfg.cli << " " << var << " timed out after "
                  << m_cfg.timeout_ms << " ms; not calling it again for "
                  << m_cfg.holdoff_ms << " ms\n";
    }
    if (m_run_status != RunStatus::OK) {
        m_failed_var = var;
        return false;
    }
    return true;
}

bool Lp4wCliTelemetry::get(const char* var, int64_t& out) {
    std::string text;
    const std::string cmd = ShellQuote(m_cfg.cli) + " get " + var + " 2>/dev/null";

    if (!run(var, cmd, text)) return false;
    if (!ParseLastInt(text, out)) {
        m_failed_var = var;
        return false;
    }
    return true;
}

bool Lp4wCliTelemetry::set(const char* var, const std::string& value) {
    std::string text;
    const std::string cmd = ShellQuote(m_cfg.cli) + " set " + var + " " + value + " 2>&1";

    if (!run(var, cmd, text)) {
        std::cout << "[TELEM] ERROR: could not set " << var << "=" << value;
        if (!text.empty()) std::cout << " (" << text << ")";
        std::cout << "\n";
        return false;
    }
    return true;
}

} // namespace platform
