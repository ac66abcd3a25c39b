#include "apps/meter/TelemetryEnricher.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace meter {

TelemetryEnricher::TelemetryEnricher(platform::IPowerTelemetry* power,
                                     platform::IThermalSource* thermal)
: m_power(power)
, m_thermal(thermal) {
    m_last_ok.fill(true);
}

void TelemetryEnricher::track(Field f, bool ok, const char* what) {
    if (m_last_ok[f] && !ok) {
        std::cout << "[TELEM] WARN " << what << " unavailable";
        if (f <= F_IOUT && m_power) std::cout << " (backend=" << m_power->name() << ")";
        std::cout << "\n";
    } else if (!m_last_ok[f] && ok) {
        std::cout << "[TELEM] " << what << " readable again\n";
    }
    m_last_ok[f] = ok;
}

void TelemetryEnricher::enrich(msg::TelemetrySample& out) {
    out = msg::TelemetrySample{};

    // ---- Power controller ----
    if (m_power) {
        int32_t v = 0;

        out.vbat_valid = m_power->read(platform::PowerField::VBAT, v);
        if (out.vbat_valid) out.vbat_mV = v;
        track(F_VBAT, out.vbat_valid, platform::PowerFieldStr(platform::PowerField::VBAT));

        out.vin_valid = m_power->read(platform::PowerField::VIN, v);
        if (out.vin_valid) out.vin_mV = v;
        track(F_VIN, out.vin_valid, platform::PowerFieldStr(platform::PowerField::VIN));

        out.iout_valid = m_power->read(platform::PowerField::IOUT, v);
        if (out.iout_valid) out.iout_mA = v;
        track(F_IOUT, out.iout_valid, platform::PowerFieldStr(platform::PowerField::IOUT));
    }

    // ---- Thermal zones ----
    if (m_thermal) {
        std::vector<msg::ThermalReading> temps;
        m_thermal->read(temps);

        for (const auto& t : temps) {
            if (t.name == "soc") {
                out.soc_C = t.celsius;
                out.soc_valid = true;
            } else if (t.name == "rp1") {
                out.rp1_C = t.celsius;
                out.rp1_valid = true;
            } else if (t.name == "pmic") {
                out.pmic_C = t.celsius;
                out.pmic_valid = true;
            }
        }

        track(F_SOC,  out.soc_valid,  "soc temperature");
        track(F_RP1,  out.rp1_valid,  "rp1 temperature");
        track(F_PMIC, out.pmic_valid, "pmic temperature");
    }
}

} // namespace meter
