#include "geometry.h"

#include <gtest/gtest.h>

using namespace kicadfile;

static void expect_point(const Point& p, double x, double y) {
    EXPECT_NEAR(p.x, x, 1e-6);
    EXPECT_NEAR(p.y, y, 1e-6);
}

TEST(Geometry, RotatePoint) {
    expect_point(rotate_point({1, 0}, {0, 0}, 90), 0, 1);
    expect_point(rotate_point({11, 5}, {10, 5}, 180), 9, 5);
    expect_point(rotate_point({3, 4}, {3, 4}, 37), 3, 4);
}

TEST(Geometry, SnapPoint) {
    expect_point(snap_point({1.00004, 2.99996}), 1.0, 3.0);
    Point z = snap_point({-0.00001, 0});
    EXPECT_FALSE(std::signbit(z.x));
}

TEST(Geometry, QuantizeRotation) {
    EXPECT_EQ(quantize_rotation(0), 0);
    EXPECT_EQ(quantize_rotation(-90), 270);
    EXPECT_EQ(quantize_rotation(450), 90);
    EXPECT_EQ(quantize_rotation(44), 0);
    EXPECT_EQ(quantize_rotation(46), 90);
    EXPECT_EQ(quantize_rotation(180.0001), 180);
}

TEST(Geometry, QuantizeRotationReportsSnaps) {
    testing::internal::CaptureStderr();
    EXPECT_EQ(quantize_rotation(100, true), 90);
    std::string snapped = testing::internal::GetCapturedStderr();
    EXPECT_NE(snapped.find("[geometry] rotation 100 snapped to 90"), std::string::npos);

    testing::internal::CaptureStderr();
    EXPECT_EQ(quantize_rotation(-90, true), 270);
    EXPECT_EQ(quantize_rotation(45, false), 90);
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST(Geometry, PointOnSegment) {
    EXPECT_TRUE(point_on_segment({5, 0}, {0, 0}, {10, 0}));
    EXPECT_TRUE(point_on_segment({10, 0}, {0, 0}, {10, 0}));
    EXPECT_FALSE(point_on_segment({10.01, 0}, {0, 0}, {10, 0}));
    EXPECT_FALSE(point_on_segment({5, 0.01}, {0, 0}, {10, 0}));
    EXPECT_TRUE(point_on_segment({2, 2}, {0, 0}, {4, 4}));
}

// Library pin 1 of a resistor sits 3.81 mm above the anchor (Y up)
TEST(Geometry, TransformPinRotations) {
    Point pin{0, 3.81};
    expect_point(transform_pin(pin, {{100, 100}, 0, Mirror::None}), 100, 96.19);
    expect_point(transform_pin(pin, {{100, 100}, 90, Mirror::None}), 96.19, 100);
    expect_point(transform_pin(pin, {{100, 100}, 180, Mirror::None}), 100, 103.81);
    expect_point(transform_pin(pin, {{100, 100}, 270, Mirror::None}), 103.81, 100);
    expect_point(transform_pin(pin, {{100, 100}, -90, Mirror::None}), 103.81, 100);
}

TEST(Geometry, TransformPinMirrors) {
    expect_point(transform_pin({0, 3.81}, {{100, 100}, 0, Mirror::X}), 100, 103.81);
    expect_point(transform_pin({5.08, 0}, {{100, 100}, 0, Mirror::Y}), 94.92, 100);
    expect_point(transform_pin({5.08, 0}, {{100, 100}, 0, Mirror::X}), 105.08, 100);
}

TEST(Geometry, MirrorAppliesBeforeRotation) {
    // Mirror about Y gives (-5.08, 0); rotating that 90 degrees CCW puts it below
    expect_point(transform_pin({5.08, 0}, {{100, 100}, 90, Mirror::Y}), 100, 105.08);
}

TEST(Geometry, TransformPinAngle) {
    EXPECT_EQ(transform_pin_angle(270, {{0, 0}, 90, Mirror::None}), 0);
    EXPECT_EQ(transform_pin_angle(0, {{0, 0}, 0, Mirror::Y}), 180);
    EXPECT_EQ(transform_pin_angle(90, {{0, 0}, 0, Mirror::X}), 270);
    EXPECT_EQ(transform_pin_angle(180, {{0, 0}, 270, Mirror::None}), 90);
}

TEST(Geometry, MirrorNames) {
    EXPECT_EQ(parse_mirror("x"), Mirror::X);
    EXPECT_EQ(parse_mirror("y"), Mirror::Y);
    EXPECT_EQ(parse_mirror(""), Mirror::None);
    EXPECT_STREQ(mirror_name(Mirror::Y), "y");
    EXPECT_STREQ(mirror_name(Mirror::None), "");
}
