#include "region.hpp"

#include <gtest/gtest.h>

#include <limits>

TEST(region, valid_region_keeps_its_values) {
    const Result<Region>& res = Region::Create(100, 200, 800, 600);
    ASSERT_TRUE(res.ok());

    const Region& r = res.get();
    EXPECT_EQ(r.x(), 100);
    EXPECT_EQ(r.y(), 200);
    EXPECT_EQ(r.width(), 800);
    EXPECT_EQ(r.height(), 600);
}

TEST(region, bbox_is_half_open) {
    const Region r = Region::Create(10, 20, 30, 40).get();
    EXPECT_EQ(r.bbox(), (bbox_t{ 10, 20, 40, 60 }));
    EXPECT_EQ(r.bbox().width(), 30);
    EXPECT_EQ(r.bbox().height(), 40);
}

TEST(region, origin_and_single_pixel_are_valid) {
    EXPECT_TRUE(Region::Create(0, 0, 1, 1).ok());
}

TEST(region, non_positive_dimensions_are_rejected) {
    for (const auto& [w, h] : { std::pair{ 0, 10 }, std::pair{ -5, 10 }, std::pair{ 10, 0 }, std::pair{ 10, -1 } })
    {
        const Result<Region>& res = Region::Create(0, 0, w, h);
        ASSERT_FALSE(res.ok()) << w << "x" << h;
        EXPECT_EQ(res.error().kind, ErrorKind::InvalidRegion);
        EXPECT_NE(res.error().msg.find("Region dimensions must be positive"), std::string::npos);
    }
}

TEST(region, negative_coordinates_are_rejected) {
    const Result<Region>& res = Region::Create(-1, 5, 10, 10);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ErrorKind::InvalidRegion);
    EXPECT_NE(res.error().msg.find("Region coordinates must be non-negative"), std::string::npos);
    EXPECT_NE(res.error().msg.find("x=-1"), std::string::npos);

    const Result<Region>& res_y = Region::Create(5, -3, 10, 10);
    ASSERT_FALSE(res_y.ok());
    EXPECT_NE(res_y.error().msg.find("y=-3"), std::string::npos);
}

TEST(region, dimensions_are_checked_before_coordinates) {
    const Result<Region>& res = Region::Create(-1, -1, 0, 0);
    ASSERT_FALSE(res.ok());
    EXPECT_NE(res.error().msg.find("dimensions"), std::string::npos);
}

TEST(region, equality_and_format) {
    const Region a = Region::Create(1, 2, 3, 4).get();
    const Region b = Region::Create(1, 2, 3, 4).get();
    const Region c = Region::Create(1, 2, 3, 5).get();
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(fmt::format("{}", a), "Region(x=1, y=2, width=3, height=4)");
}

TEST(region, far_edge_must_fit_in_an_int) {
    constexpr int max = std::numeric_limits<int>::max();

    const Result<Region>& wide = Region::Create(2147483000, 0, 1000, 1000);
    ASSERT_FALSE(wide.ok());
    EXPECT_EQ(wide.error().kind, ErrorKind::InvalidRegion);

    const Result<Region>& tall = Region::Create(0, max - 10, 10, 11);
    ASSERT_FALSE(tall.ok());
    EXPECT_EQ(tall.error().kind, ErrorKind::InvalidRegion);

    const Result<Region>& edge = Region::Create(max - 10, 0, 10, 1);
    ASSERT_TRUE(edge.ok());
    EXPECT_EQ(edge.get().bbox().x2, max);
}
