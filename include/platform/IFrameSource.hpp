#pragma once

#include "msg/ImageFrame.hpp"

namespace platform {

// Produces GRAY8 frames on demand.
class IFrameSource {
public:
    virtual bool Start() = 0;
    virtual void Stop() = 0;

    // Blocking. On success 'out' views a buffer owned by the source that stays
    // valid until the next Acquire() or Stop(). On failure the cycle is skipped.
    virtual bool Acquire(msg::ImageFrame& out) = 0;

    // Short description of the last failure, for the operator log.
    virtual const char* LastError() const = 0;

    virtual ~IFrameSource() = default;
};

} // namespace platform
