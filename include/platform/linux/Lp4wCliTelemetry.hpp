#pragma once
#include <cstdint>
#include <string>

#include "platform/IPowerTelemetry.hpp"
#include "platform/linux/HostIo.hpp"

namespace platform {

// Board policy pushed with `lifepo4wered-cli set`.
struct PowerPolicy {
    int32_t  auto_boot      = 3;     // boot when VIN is present
    int32_t  auto_shdn_time = 3;     // minutes on battery before shutdown
    int32_t  vin_threshold  = 4500;  // mV
    bool     persist        = false; // CFG_WRITE 0x46 after setting
};

struct Lp4wCliConfig {
    std::string cli = "lifepo4wered-cli";

    uint32_t timeout_ms = 1000;   // per tool invocation
    uint32_t holdoff_ms = 10000;  // after a timeout, reads fail without running the tool
};

// ---------------------------------------------------------------------------
// LiFePO4wered/Pi+ telemetry through its command-line tool.
// One subprocess per field: `<cli> get vbat|vin|iout`, integer on stdout.
// A hung tool costs at most one timeout; later reads are refused for
// holdoff_ms so a wedged I2C bus cannot stall every cycle.
// ---------------------------------------------------------------------------
class Lp4wCliTelemetry : public IPowerTelemetry {
public:
    explicit Lp4wCliTelemetry(const Lp4wCliConfig& cfg = Lp4wCliConfig{});

    const char* name() const override { return "lifepo4wered-cli"; }

    bool read(PowerField field, int32_t& out_milli) override;

    // Sets AUTO_BOOT, AUTO_SHDN_TIME, VIN_THRESHOLD and, if asked, persists
    // them to flash. Stops at the first variable the board refuses.
    bool applyPolicy(const PowerPolicy& policy);

    // Name of the variable the last failed call was working on.
    const std::string& lastFailedVar() const { return m_failed_var; }
    RunStatus lastRunStatus() const { return m_run_status; }

private:
    Lp4wCliConfig m_cfg{};
    std::string   m_failed_var;
    RunStatus     m_run_status = RunStatus::OK;
    uint64_t      m_hold_until_us = 0;

    bool run(const char* var, const std::string& cmd, std::string& text);

    bool get(const char* var, int64_t& out);
    bool set(const char* var, const std::string& value);
};

} // namespace platform
