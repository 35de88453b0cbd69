#pragma once

#include <cstdint>

namespace lectern
{

// Bounding box of a host element in the host window's logical coordinate space.
struct HostRect
{
    float x      = 0.0f;
    float y      = 0.0f;
    float width  = 0.0f;
    float height = 0.0f;

    bool operator==(const HostRect&) const = default;
};

// Window inner position and device scale factor sampled at measurement time.
struct WindowMetrics
{
    double x     = 0.0;
    double y     = 0.0;
    double scale = 1.0;

    bool operator==(const WindowMetrics&) const = default;
};

// Placement of a rendering surface in physical (device) pixels.
struct PhysicalRect
{
    int32_t  x      = 0;
    int32_t  y      = 0;
    uint32_t width  = 1;
    uint32_t height = 1;

    bool operator==(const PhysicalRect&) const = default;
};

// A host rectangle this small is not laid out yet.
inline constexpr float MIN_MEASURABLE_EXTENT = 1.0f;

bool is_measurable(const HostRect& rect);

// physical = round(window + rect * scale), size = max(1, round(rect * scale)).
PhysicalRect to_physical(const HostRect& rect, const WindowMetrics& window);

}   // namespace lectern
