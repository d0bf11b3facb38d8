#include "region.hpp"

#include <limits>

Result<Region> Region::Create(int x, int y, int width, int height)
{
    if (width <= 0)
        return Err(ErrorKind::InvalidRegion,
                   "region",
                   "Region dimensions must be positive (got width={}, height={}): width={} is invalid",
                   width,
                   height,
                   width);
    if (height <= 0)
        return Err(ErrorKind::InvalidRegion,
                   "region",
                   "Region dimensions must be positive (got width={}, height={}): height={} is invalid",
                   width,
                   height,
                   height);

    if (x < 0)
        return Err(ErrorKind::InvalidRegion,
                   "region",
                   "Region coordinates must be non-negative (got x={}, y={}): x={} is invalid",
                   x,
                   y,
                   x);
    if (y < 0)
        return Err(ErrorKind::InvalidRegion,
                   "region",
                   "Region coordinates must be non-negative (got x={}, y={}): y={} is invalid",
                   x,
                   y,
                   y);

    // the far edges must stay representable
    constexpr int max = std::numeric_limits<int>::max();
    if (width > max - x)
        return Err(ErrorKind::InvalidRegion,
                   "region",
                   "Region exceeds the coordinate range (x={} + width={} is larger than {})",
                   x,
                   width,
                   max);
    if (height > max - y)
        return Err(ErrorKind::InvalidRegion,
                   "region",
                   "Region exceeds the coordinate range (y={} + height={} is larger than {})",
                   y,
                   height,
                   max);

    return Region(x, y, width, height);
}
