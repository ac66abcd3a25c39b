#pragma once
#include <cstdint>
#include <string>

#include "apps/meter/MeterTask.hpp"
#include "platform/linux/Lp4wCliTelemetry.hpp"

namespace meter {

enum class FramePixFmt : uint8_t { GREY = 0, YUYV };
enum class TelemetryBackend : uint8_t { CLI = 0, SYSFS, NONE };

const char* TelemetryBackendStr(TelemetryBackend b);

// Command-line numbers. Same exceptions as std::stoi / std::stod, plus
// std::invalid_argument when anything follows the number ("800abc").
int    ParseIntArg(const std::string& s);
double ParseDoubleArg(const std::string& s);

// "WxH", both positive. False on any other shape.
bool ParseResolution(const std::string& s, uint32_t& w, uint32_t& h);

// Everything the process needs to build one session, filled by main from
// the command line.
struct MeterConfig {
    MeterTaskConfig task{};

    // Frames
    uint32_t    width  = 800;
    uint32_t    height = 600;
    std::string device = "/dev/video0";
    FramePixFmt pixfmt = FramePixFmt::GREY;
    std::string replay;          // non-empty: read frames from image file/dir

    // Output
    std::string log_dir = "logs";
    bool        preview = true;

    // Telemetry
    TelemetryBackend      telemetry = TelemetryBackend::CLI;
    bool                  apply_policy = false;
    platform::PowerPolicy policy{};
};

} // namespace meter
