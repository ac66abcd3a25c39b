#pragma once
#include <cstdint>

namespace msg {

struct ImageFrame {
    // Non-owning pointer to the first byte of a contiguous GRAY8 buffer.
    // Valid until the next Acquire() on the source that produced it.
    const uint8_t* data = nullptr;

    // Image dimensions in pixels
    uint32_t width  = 0;    // pixels
    uint32_t height = 0;    // pixels

    // Stride = number of BYTES between the start of row y and the start of row y+1.
    // For tightly packed images: stride == width * bytes_per_px.
    uint32_t stride = 0;    // bytes per row

    // Container width per pixel. The decoder only accepts 1 (GRAY8).
    uint8_t bytes_per_px = 1;

    uint64_t t_mono_us = 0; // acquisition timestamp (monotonic, us)
    uint32_t frame_id  = 0; // increasing counter

    constexpr uint32_t byteSize() const { return stride * height; }
    constexpr bool empty() const { return data == nullptr || width == 0 || height == 0; }
};

} // namespace msg
