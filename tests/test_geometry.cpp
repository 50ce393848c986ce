#include "geometry_func.hpp"
#include <gtest/gtest.h>
#include <limits>

TEST(Geometry, WrapKeepsValuesInsideRange) {
    EXPECT_FLOAT_EQ(wrapCoordinate(50.f, 100.f), 50.f);
    EXPECT_FLOAT_EQ(wrapCoordinate(0.f, 100.f), 0.f);
    EXPECT_FLOAT_EQ(wrapCoordinate(-1.f, 100.f), 99.f);
    EXPECT_FLOAT_EQ(wrapCoordinate(100.f, 100.f), 0.f);
    EXPECT_FLOAT_EQ(wrapCoordinate(250.f, 100.f), 50.f);
    EXPECT_FLOAT_EQ(wrapCoordinate(-230.f, 100.f), 70.f);
}

TEST(Geometry, WrapOfTinyNegativeStaysBelowExtent) {
    auto v = wrapCoordinate(-1e-9f, 100.f);
    EXPECT_GE(v, 0.f);
    EXPECT_LT(v, 100.f);
}

TEST(Geometry, WrapDegenerateInputsMapToZero) {
    EXPECT_FLOAT_EQ(wrapCoordinate(5.f, 0.f), 0.f);
    EXPECT_FLOAT_EQ(wrapCoordinate(5.f, -10.f), 0.f);
    EXPECT_FLOAT_EQ(wrapCoordinate(std::numeric_limits<float>::quiet_NaN(), 10.f), 0.f);
    EXPECT_FLOAT_EQ(wrapCoordinate(std::numeric_limits<float>::infinity(), 10.f), 0.f);
}

TEST(Geometry, WrapPointUsesAreaOrigin) {
    auto area = AABB::CreateMinSize({10.f, 20.f}, {100.f, 50.f});
    auto p = wrapPoint({5.f, 75.f}, area);
    EXPECT_FLOAT_EQ(p.x, 105.f);
    EXPECT_FLOAT_EQ(p.y, 25.f);
}

TEST(Geometry, NormalOrZero) {
    auto n = normalOrZero({3.f, 4.f});
    EXPECT_FLOAT_EQ(n.x, 0.6f);
    EXPECT_FLOAT_EQ(n.y, 0.8f);
    auto z = normalOrZero({0.f, 0.f});
    EXPECT_EQ(z.x, 0.f);
    EXPECT_EQ(z.y, 0.f);
}

TEST(Geometry, LinearFalloff) {
    EXPECT_FLOAT_EQ(linearFalloff(0.f, 300.f), 1.f);
    EXPECT_FLOAT_EQ(linearFalloff(150.f, 300.f), 0.5f);
    EXPECT_FLOAT_EQ(linearFalloff(300.f, 300.f), 0.f);
    EXPECT_FLOAT_EQ(linearFalloff(450.f, 300.f), 0.f);
    EXPECT_FLOAT_EQ(linearFalloff(10.f, 0.f), 0.f);
}
