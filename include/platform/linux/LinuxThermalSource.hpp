#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "platform/IThermalSource.hpp"

namespace platform {

struct LinuxThermalConfig {
    std::string thermal_root = "/sys/class/thermal";
    std::string hwmon_root   = "/sys/class/hwmon";

    std::string soc_zone_type = "cpu-thermal"; // thermal_zone*/type
    std::string rp1_hwmon     = "rp1_adc";     // hwmon*/name

    // Empty disables the PMIC reading.
    std::string pmic_cmd = "vcgencmd measure_temp pmic";
    uint32_t pmic_timeout_ms = 1000;
    uint32_t pmic_holdoff_ms = 10000;  // skip pmic_cmd this long after a timeout
};

// Host temperatures: "soc" from the CPU thermal zone, "rp1" from the RP1 ADC
// hwmon, "pmic" from vcgencmd. Sysfs values are millidegrees.
class LinuxThermalSource : public IThermalSource {
public:
    explicit LinuxThermalSource(const LinuxThermalConfig& cfg = LinuxThermalConfig{});

    void read(std::vector<msg::ThermalReading>& out) override;

private:
    LinuxThermalConfig m_cfg{};

    // Resolved once; empty when the host has no such sensor.
    std::string m_soc_path;
    std::string m_rp1_path;

    uint64_t m_pmic_hold_until_us = 0;

    bool readPmic(float& celsius);

    std::string findByAttr(const std::string& root, const char* prefix,
                           const char* attr, const std::string& want,
                           const char* value_file) const;
};

} // namespace platform
