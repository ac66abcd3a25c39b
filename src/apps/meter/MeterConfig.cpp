#include "apps/meter/MeterConfig.hpp"
#include <stdexcept>

namespace meter {

const char* TelemetryBackendStr(TelemetryBackend b) {
    switch (b) {
        case TelemetryBackend::CLI:   return "cli";
        case TelemetryBackend::SYSFS: return "sysfs";
        case TelemetryBackend::NONE:  return "none";
        default:                      return "unknown";
    }
}

int ParseIntArg(const std::string& s) {
    size_t pos = 0;
    const int v = std::stoi(s, &pos);
    if (pos != s.size()) throw std::invalid_argument("trailing characters in '" + s + "'");
    return v;
}

double ParseDoubleArg(const std::string& s) {
    size_t pos = 0;
    const double v = std::stod(s, &pos);
    if (pos != s.size()) throw std::invalid_argument("trailing characters in '" + s + "'");
    return v;
}

bool ParseResolution(const std::string& s, uint32_t& w, uint32_t& h) {
    const auto x = s.find('x');
    if (x == std::string::npos) return false;

    int iw = 0;
    int ih = 0;
    try {
        iw = ParseIntArg(s.substr(0, x));
        ih = ParseIntArg(s.substr(x + 1));
    } catch (const std::logic_error&) {
        return false;
    }
    if (iw <= 0 || ih <= 0) return false;

    w = static_cast<uint32_t>(iw);
    h = static_cast<uint32_t>(ih);
    return true;
}

} // namespace meter
