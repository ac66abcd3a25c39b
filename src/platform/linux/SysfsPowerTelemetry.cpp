#include "platform/linux/SysfsPowerTelemetry.hpp"
#include "platform/linux/HostIo.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace platform {

SysfsPowerTelemetry::SysfsPowerTelemetry(const SysfsPowerConfig& cfg)
: m_cfg(cfg) {
    if (m_cfg.battery.empty()) m_cfg.battery = discover(true);
    if (m_cfg.input.empty())   m_cfg.input   = discover(false);

    std::cout << "[TELEM] sysfs: battery="
              << (m_cfg.battery.empty() ? "(none)" : m_cfg.battery)
              << " input=" << (m_cfg.input.empty() ? "(none)" : m_cfg.input) << "\n";
}

bool SysfsPowerTelemetry::read(PowerField field, int32_t& out_milli) {
    switch (field) {
        case PowerField::VBAT: return readMicro(m_cfg.battery, "voltage_now", out_milli);
        case PowerField::IOUT: return readMicro(m_cfg.battery, "current_now", out_milli);
        case PowerField::VIN:  return readMicro(m_cfg.input,   "voltage_now", out_milli);
        default:               return false;
    }
}

// -------------------- private helpers --------------------

std::string SysfsPowerTelemetry::discover(bool battery) const {
    std::error_code ec;
    std::vector<std::string> names;
    for (fs::directory_iterator it(m_cfg.root, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());

    for (const auto& n : names) {
        std::string type;
        if (!ReadTextFile((fs::path(m_cfg.root) / n / "type").string(), type)) continue;

        if (battery && type == "Battery") return n;
        if (!battery && (type == "Mains" || type == "USB")) return n;
    }
    return std::string();
}

bool SysfsPowerTelemetry::readMicro(const std::string& supply, const char* attr, int32_t& out_milli) const {
    if (supply.empty()) return false;

    int64_t micro = 0;
    if (!ReadIntFile((fs::path(m_cfg.root) / supply / attr).string(), micro)) return false;

    out_milli = static_cast<int32_t>(micro / 1000);
    return true;
}

} // namespace platform
