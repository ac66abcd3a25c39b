#pragma once
#include <vector>

#include "msg/MeterReading.hpp"

namespace platform {

// Host temperatures. Returns zero or more named readings; a zone that does
// not exist on this host is simply absent.
class IThermalSource {
public:
    virtual void read(std::vector<msg::ThermalReading>& out) = 0;

    virtual ~IThermalSource() = default;
};

} // namespace platform
