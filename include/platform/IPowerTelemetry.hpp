#pragma once
#include <cstdint>

namespace platform {

enum class PowerField : uint8_t {
    VBAT = 0,   // battery voltage [mV]
    VIN  = 1,   // input (supply) voltage [mV]
    IOUT = 2,   // output current [mA]
};

const char* PowerFieldStr(PowerField f);

// Battery / power-controller readings. Every field is read independently;
// a failed field must not affect the others.
class IPowerTelemetry {
public:
    virtual const char* name() const = 0;

    // Returns false if the field could not be read this time.
    virtual bool read(PowerField field, int32_t& out_milli) = 0;

    virtual ~IPowerTelemetry() = default;
};

} // namespace platform
