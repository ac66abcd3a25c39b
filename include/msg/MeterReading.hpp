#pragma once
#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <vector>

#include "msg/LcdState.hpp"

namespace msg {

// Decoded value of one digit slot when its segment pattern is not in the table.
constexpr int8_t INVALID_DIGIT = -1;

constexpr const char* MODE_UNKNOWN = "unknown";

// Structured per-cycle error record. Rendered to text only at the logging boundary.
struct DecodeError {
    enum class Kind : uint8_t {
        UNRECOGNIZED_DIGIT = 0, // slot + segments are set
        INVALID_READING    = 1, // count = number of unrecognized digits
    };

    Kind        kind     = Kind::UNRECOGNIZED_DIGIT;
    uint8_t     slot     = 0;
    SegmentMask segments = 0;
    uint8_t     count    = 0;
};

// e.g. "d2: unrecognized segments [a b c e]"
std::string describe(const DecodeError& e);

// Joined with "; " in record order. Empty list -> empty string.
std::string joinErrors(const std::vector<DecodeError>& errors);

struct DecodeResult {
    double      value = 0.0;
    std::string mode  = MODE_UNKNOWN;

    // Decoded digit per slot (index = DigitSlot), INVALID_DIGIT if unrecognized.
    std::array<int8_t, DIGIT_COUNT> digits{};

    std::vector<DecodeError> errors;

    // false when any digit was unrecognized (value forced to 0.0)
    bool valid = false;
};

// Host power / thermal readings. Each field is individually optional:
// *_valid == false means "could not be read this cycle".
struct TelemetrySample {
    int32_t vbat_mV = 0;
    int32_t vin_mV  = 0;
    int32_t iout_mA = 0;

    float soc_C  = 0.0f;
    float rp1_C  = 0.0f;
    float pmic_C = 0.0f;

    bool vbat_valid = false;
    bool vin_valid  = false;
    bool iout_valid = false;
    bool soc_valid  = false;
    bool rp1_valid  = false;
    bool pmic_valid = false;
};

struct ThermalReading {
    std::string name;   // "soc", "rp1", "pmic", ...
    float celsius = 0.0f;
};

// Atomic unit appended to the log. Written once, never amended.
struct LogRecord {
    int64_t         wall_ms = 0;  // ms since epoch, sampled at the start of the cycle
    DecodeResult    result;
    TelemetrySample telemetry;
    std::string     error;        // cycle note (frame recovery) appended after decode errors
};

} // namespace msg
