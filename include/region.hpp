#ifndef _REGION_HPP_
#define _REGION_HPP_

#include "util.hpp"

// Capture boundary, half-open on the high edge: [x1, x2) x [y1, y2)
struct bbox_t
{
    int x1{};
    int y1{};
    int x2{};
    int y2{};

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }

    bool operator==(const bbox_t&) const = default;
};

class Region
{
public:
    /**
     * Validate and build a capture rectangle.
     * Dimensions are checked before coordinates,
     * so a region that is wrong in both ways reports the dimension.
     * @return the region, or an InvalidRegion error naming the offending value
     */
    static Result<Region> Create(int x, int y, int width, int height);

    int x() const { return m_x; }
    int y() const { return m_y; }
    int width() const { return m_width; }
    int height() const { return m_height; }

    bbox_t bbox() const { return { m_x, m_y, m_x + m_width, m_y + m_height }; }

    bool operator==(const Region&) const = default;

private:
    Region(int x, int y, int width, int height) : m_x(x), m_y(y), m_width(width), m_height(height) {}

    int m_x;
    int m_y;
    int m_width;
    int m_height;
};

template <>
struct fmt::formatter<Region> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const Region& r, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "Region(x={}, y={}, width={}, height={})", r.x(), r.y(), r.width(), r.height());
    }
};

#endif  // !_REGION_HPP_
