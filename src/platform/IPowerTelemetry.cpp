#include "platform/IPowerTelemetry.hpp"

namespace platform {

const char* PowerFieldStr(PowerField f) {
    switch (f) {
        case PowerField::VBAT: return "vbat";
        case PowerField::VIN:  return "vin";
        case PowerField::IOUT: return "iout";
        default:               return "unknown";
    }
}

} // namespace platform
