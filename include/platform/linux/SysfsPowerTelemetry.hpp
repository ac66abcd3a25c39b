#pragma once
#include <cstdint>
#include <string>

#include "platform/IPowerTelemetry.hpp"

namespace platform {

struct SysfsPowerConfig {
    std::string root = "/sys/class/power_supply";

    // Supply names under 'root'. Empty: first supply whose `type` is
    // Battery (battery) or Mains/USB (input).
    std::string battery;
    std::string input;
};

// ---------------------------------------------------------------------------
// In-process power readings from the kernel power_supply class.
//   VBAT <- <battery>/voltage_now   [uV]
//   IOUT <- <battery>/current_now   [uA]
//   VIN  <- <input>/voltage_now     [uV]
// ---------------------------------------------------------------------------
class SysfsPowerTelemetry : public IPowerTelemetry {
public:
    explicit SysfsPowerTelemetry(const SysfsPowerConfig& cfg = SysfsPowerConfig{});

    const char* name() const override { return "sysfs"; }

    bool read(PowerField field, int32_t& out_milli) override;

    const std::string& batteryName() const { return m_cfg.battery; }
    const std::string& inputName()   const { return m_cfg.input; }

private:
    SysfsPowerConfig m_cfg{};

    std::string discover(bool battery) const;
    bool readMicro(const std::string& supply, const char* attr, int32_t& out_milli) const;
};

} // namespace platform
