#include <algorithm>
#include <cmath>
#include <lectern/geometry.hpp>

namespace lectern
{

bool is_measurable(const HostRect& rect)
{
    return rect.width > MIN_MEASURABLE_EXTENT && rect.height > MIN_MEASURABLE_EXTENT;
}

static uint32_t physical_extent(float logical, double scale)
{
    double scaled = std::round(static_cast<double>(logical) * scale);
    return static_cast<uint32_t>(std::max(1.0, scaled));
}

PhysicalRect to_physical(const HostRect& rect, const WindowMetrics& window)
{
    PhysicalRect out;
    out.x      = static_cast<int32_t>(std::lround(window.x + rect.x * window.scale));
    out.y      = static_cast<int32_t>(std::lround(window.y + rect.y * window.scale));
    out.width  = physical_extent(rect.width, window.scale);
    out.height = physical_extent(rect.height, window.scale);
    return out;
}

}   // namespace lectern
