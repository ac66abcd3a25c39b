#pragma once
#include <array>
#include <cstddef>

#include "platform/IPowerTelemetry.hpp"
#include "platform/IThermalSource.hpp"
#include "msg/MeterReading.hpp"

namespace meter {

// ---------------------------------------------------------------------------
// TelemetryEnricher: best-effort power + thermal fields for the log row.
// Either backend may be null (telemetry disabled). Never fails the cycle.
// Warnings go to the operator stream on the readable -> unreadable edge of
// each field, so a missing controller does not print a line every cycle.
// ---------------------------------------------------------------------------
class TelemetryEnricher {
public:
    TelemetryEnricher(platform::IPowerTelemetry* power, platform::IThermalSource* thermal);

    // Overwrites 'out' entirely.
    void enrich(msg::TelemetrySample& out);

private:
    platform::IPowerTelemetry* m_power   = nullptr;
    platform::IThermalSource*  m_thermal = nullptr;

    enum Field : std::size_t { F_VBAT = 0, F_VIN, F_IOUT, F_SOC, F_RP1, F_PMIC, F_COUNT };

    // Last known readability per field; starts "readable" so the first
    // failure is reported.
    std::array<bool, F_COUNT> m_last_ok{};

    void track(Field f, bool ok, const char* what);
};

} // namespace meter
