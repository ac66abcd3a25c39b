#include "platform/linux/LinuxThermalSource.hpp"
#include "platform/linux/HostIo.hpp"
#include "os/rtos.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace platform {

LinuxThermalSource::LinuxThermalSource(const LinuxThermalConfig& cfg)
: m_cfg(cfg) {
    m_soc_path = findByAttr(m_cfg.thermal_root, "thermal_zone", "type", m_cfg.soc_zone_type, "temp");
    m_rp1_path = findByAttr(m_cfg.hwmon_root, "hwmon", "name", m_cfg.rp1_hwmon, "temp1_input");
}

void LinuxThermalSource::read(std::vector<msg::ThermalReading>& out) {
    out.clear();

    int64_t milli = 0;
    if (!m_soc_path.empty() && ReadIntFile(m_soc_path, milli)) {
        out.push_back({"soc", static_cast<float>(milli) / 1000.0f});
    }
    if (!m_rp1_path.empty() && ReadIntFile(m_rp1_path, milli)) {
        out.push_back({"rp1", static_cast<float>(milli) / 1000.0f});
    }

    float c = 0.0f;
    if (readPmic(c)) out.push_back({"pmic", c});
}

bool LinuxThermalSource::readPmic(float& celsius) {
    if (m_cfg.pmic_cmd.empty()) return false;
    if (m_pmic_hold_until_us != 0 && Rtos::MonoUs() < m_pmic_hold_until_us) return false;
    m_pmic_hold_until_us = 0;

    std::string text;
    const RunStatus st = RunCommand(m_cfg.pmic_cmd + " 2>/dev/null", text, m_cfg.pmic_timeout_ms);
    if (st == RunStatus::TIMEOUT) {
        m_pmic_hold_until_us = Rtos::MonoUs() + static_cast<uint64_t>(m_cfg.pmic_holdoff_ms) * 1000u;
        std::cout << "[TELEM] WARN '" << m_cfg.pmic_cmd << "' timed out after "
                  << m_cfg.pmic_timeout_ms << " ms; not calling it again for "
                  << m_cfg.pmic_holdoff_ms << " ms\n";
        return false;
    }
    return st == RunStatus::OK && ParseFirstFloat(text, celsius);
}

std::string LinuxThermalSource::findByAttr(const std::string& root, const char* prefix,
                                           const char* attr, const std::string& want,
                                           const char* value_file) const {
    if (want.empty()) return std::string();

    std::error_code ec;
    std::vector<fs::path> dirs;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string().rfind(prefix, 0) == 0) dirs.push_back(it->path());
    }
    std::sort(dirs.begin(), dirs.end());

    for (const auto& d : dirs) {
        std::string v;
        if (ReadTextFile((d / attr).string(), v) && v == want) {
            return (d / value_file).string();
        }
    }
    return std::string();
}

} // namespace platform
