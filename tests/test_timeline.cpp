#include <cmath>
#include <limits>
#include <string>

#include <gtest/gtest.h>

#include "keycrop/timeline.hpp"

using namespace keycrop;

namespace {

Keyframe rect_at(double t, double x, double y, double w, double h) {
  Keyframe kf;
  kf.timestamp = t;
  kf.geometry = RectangleCrop{{x, y, w, h}};
  return kf;
}

double x_of(const Keyframe &kf) {
  return std::get<RectangleCrop>(kf.geometry).rect.x;
}

} // namespace

TEST(CropTimeline, KeepsKeyframesSorted) {
  CropTimeline tl;
  ASSERT_EQ(tl.add_keyframe(rect_at(2.0, 0.2, 0, 0.5, 0.5)), ErrorCode::Ok);
  ASSERT_EQ(tl.add_keyframe(rect_at(0.0, 0.0, 0, 0.5, 0.5)), ErrorCode::Ok);
  ASSERT_EQ(tl.add_keyframe(rect_at(1.0, 0.1, 0, 0.5, 0.5)), ErrorCode::Ok);

  ASSERT_EQ(tl.size(), 3u);
  EXPECT_DOUBLE_EQ(tl.keyframes()[0].timestamp, 0.0);
  EXPECT_DOUBLE_EQ(tl.keyframes()[1].timestamp, 1.0);
  EXPECT_DOUBLE_EQ(tl.keyframes()[2].timestamp, 2.0);
}

TEST(CropTimeline, RejectsDuplicatesWithinOneMillisecond) {
  CropTimeline tl;
  ASSERT_EQ(tl.add_keyframe(rect_at(1.0, 0, 0, 1, 1)), ErrorCode::Ok);
  EXPECT_EQ(tl.add_keyframe(rect_at(1.0, 0.1, 0, 0.5, 0.5)),
            ErrorCode::DuplicateKeyframe);
  EXPECT_EQ(tl.add_keyframe(rect_at(1.0005, 0.1, 0, 0.5, 0.5)),
            ErrorCode::DuplicateKeyframe);
  EXPECT_EQ(tl.add_keyframe(rect_at(1.002, 0.1, 0, 0.5, 0.5)), ErrorCode::Ok);
  EXPECT_EQ(tl.size(), 2u);
  EXPECT_DOUBLE_EQ(x_of(tl.keyframes()[0]), 0.0);
}

TEST(CropTimeline, RejectsBadTimestamps) {
  CropTimeline tl(CropMode::Rectangle, 10.0);
  EXPECT_EQ(tl.add_keyframe(rect_at(-0.5, 0, 0, 1, 1)), ErrorCode::InvalidInput);
  EXPECT_EQ(tl.add_keyframe(rect_at(std::nan(""), 0, 0, 1, 1)),
            ErrorCode::InvalidInput);
  EXPECT_EQ(tl.add_keyframe(rect_at(
                std::numeric_limits<double>::infinity(), 0, 0, 1, 1)),
            ErrorCode::InvalidInput);
  EXPECT_EQ(tl.add_keyframe(rect_at(10.5, 0, 0, 1, 1)), ErrorCode::InvalidInput);
  EXPECT_EQ(tl.add_keyframe(rect_at(10.0, 0, 0, 1, 1)), ErrorCode::Ok);
  EXPECT_EQ(tl.size(), 1u);
}

TEST(CropTimeline, RejectsOutOfRangeGeometry) {
  CropTimeline tl;
  EXPECT_EQ(tl.add_keyframe(rect_at(0, 0.6, 0, 0.5, 1)),
            ErrorCode::InvalidGeometry);
  EXPECT_EQ(tl.add_keyframe(rect_at(0, 0, 0, 0, 1)), ErrorCode::InvalidGeometry);
  EXPECT_EQ(tl.add_keyframe(rect_at(0, -0.1, 0, 0.5, 0.5)),
            ErrorCode::InvalidGeometry);

  CropTimeline circles(CropMode::Circle);
  Keyframe kf;
  kf.geometry = CircleCrop{{0.5, 1.5}, 0.2};
  EXPECT_EQ(circles.add_keyframe(kf), ErrorCode::InvalidGeometry);
  kf.geometry = CircleCrop{{0.5, 0.5}, std::nan("")};
  EXPECT_EQ(circles.add_keyframe(kf), ErrorCode::InvalidGeometry);
  EXPECT_TRUE(tl.empty());
  EXPECT_TRUE(circles.empty());
}

TEST(CropTimeline, RejectsGeometryOfAnotherMode) {
  CropTimeline tl(CropMode::Circle);
  EXPECT_EQ(tl.add_keyframe(rect_at(0, 0, 0, 1, 1)), ErrorCode::InvalidGeometry);
}

TEST(CropTimeline, DegeneratePolygonIsValid) {
  CropTimeline tl(CropMode::Freehand);
  Keyframe kf;
  kf.geometry = FreehandCrop{{{0.1, 0.1}, {0.9, 0.9}}};
  EXPECT_EQ(tl.add_keyframe(kf), ErrorCode::Ok);

  kf.timestamp = 1.0;
  kf.geometry = FreehandCrop{{{0.1, 0.1}, {1.2, 0.9}, {0.5, 0.5}}};
  EXPECT_EQ(tl.add_keyframe(kf), ErrorCode::InvalidGeometry);
}

TEST(CropTimeline, RemoveAndLookup) {
  CropTimeline tl;
  ASSERT_EQ(tl.add_keyframe(rect_at(0.5, 0.25, 0, 0.5, 0.5)), ErrorCode::Ok);

  const Keyframe *kf = tl.keyframe_at(0.5004);
  ASSERT_NE(kf, nullptr);
  EXPECT_DOUBLE_EQ(x_of(*kf), 0.25);
  EXPECT_EQ(tl.keyframe_at(0.6), nullptr);

  EXPECT_EQ(tl.remove_keyframe(0.7), ErrorCode::KeyframeNotFound);
  EXPECT_EQ(tl.remove_keyframe(0.5), ErrorCode::Ok);
  EXPECT_TRUE(tl.empty());
}

TEST(CropTimeline, UpdateMayRetime) {
  CropTimeline tl;
  ASSERT_EQ(tl.add_keyframe(rect_at(0.0, 0.0, 0, 0.5, 0.5)), ErrorCode::Ok);
  ASSERT_EQ(tl.add_keyframe(rect_at(1.0, 0.1, 0, 0.5, 0.5)), ErrorCode::Ok);
  ASSERT_EQ(tl.add_keyframe(rect_at(2.0, 0.2, 0, 0.5, 0.5)), ErrorCode::Ok);

  EXPECT_EQ(tl.update_keyframe(0.0, rect_at(3.0, 0.3, 0, 0.5, 0.5)),
            ErrorCode::Ok);
  ASSERT_EQ(tl.size(), 3u);
  EXPECT_DOUBLE_EQ(tl.keyframes()[0].timestamp, 1.0);
  EXPECT_DOUBLE_EQ(tl.keyframes()[2].timestamp, 3.0);
  EXPECT_DOUBLE_EQ(x_of(tl.keyframes()[2]), 0.3);

  /// Same timestamp, new geometry
  EXPECT_EQ(tl.update_keyframe(1.0, rect_at(1.0, 0.4, 0, 0.5, 0.5)),
            ErrorCode::Ok);
  EXPECT_DOUBLE_EQ(x_of(tl.keyframes()[0]), 0.4);
}

TEST(CropTimeline, FailedUpdateLeavesTimelineUnchanged) {
  CropTimeline tl;
  ASSERT_EQ(tl.add_keyframe(rect_at(0.0, 0.0, 0, 0.5, 0.5)), ErrorCode::Ok);
  ASSERT_EQ(tl.add_keyframe(rect_at(1.0, 0.1, 0, 0.5, 0.5)), ErrorCode::Ok);
  CropTimeline before = tl;

  EXPECT_EQ(tl.update_keyframe(0.0, rect_at(1.0, 0.2, 0, 0.5, 0.5)),
            ErrorCode::DuplicateKeyframe);
  EXPECT_EQ(tl.update_keyframe(0.0, rect_at(0.5, 0.9, 0, 0.5, 0.5)),
            ErrorCode::InvalidGeometry);
  EXPECT_EQ(tl.update_keyframe(4.0, rect_at(4.0, 0, 0, 1, 1)),
            ErrorCode::KeyframeNotFound);
  EXPECT_EQ(tl, before);
}

TEST(CropTimeline, SetEasing) {
  CropTimeline tl;
  ASSERT_EQ(tl.add_keyframe(rect_at(0.0, 0, 0, 1, 1)), ErrorCode::Ok);
  EXPECT_EQ(tl.set_easing(0.0, EasingKind::EaseOut), ErrorCode::Ok);
  EXPECT_EQ(tl.keyframes()[0].easing, EasingKind::EaseOut);
  EXPECT_EQ(tl.set_easing(2.0, EasingKind::Hold), ErrorCode::KeyframeNotFound);
}

TEST(CropTimeline, ModeChangeClearsKeyframes) {
  CropTimeline tl;
  ASSERT_EQ(tl.add_keyframe(rect_at(0.0, 0, 0, 1, 1)), ErrorCode::Ok);

  tl.set_mode(CropMode::Rectangle);
  EXPECT_EQ(tl.size(), 1u);

  tl.set_mode(CropMode::Circle);
  EXPECT_EQ(tl.mode(), CropMode::Circle);
  EXPECT_TRUE(tl.empty());
}

TEST(Geometry, MakeRectClamps) {
  NormalizedRect r = make_rect(0.8, -0.5, 0.5, 2.0);
  EXPECT_DOUBLE_EQ(r.x, 0.8);
  EXPECT_DOUBLE_EQ(r.y, 0.0);
  EXPECT_NEAR(r.width, 0.2, 1e-12);
  EXPECT_DOUBLE_EQ(r.height, 1.0);

  NormalizedRect edge = make_rect(1.0, 1.0, 0.0, 0.0);
  EXPECT_GT(edge.width, 0.0);
  EXPECT_GT(edge.height, 0.0);
  EXPECT_LE(edge.x + edge.width, 1.0 + 1e-9);
  EXPECT_EQ(validate_geometry(RectangleCrop{edge}), ErrorCode::Ok);
}

TEST(Geometry, NamesRoundTrip) {
  for (CropMode m : {CropMode::Rectangle, CropMode::Circle, CropMode::Freehand,
                     CropMode::AI}) {
    CropMode back;
    ASSERT_TRUE(parse_mode(mode_name(m), back));
    EXPECT_EQ(back, m);
  }
  for (EasingKind e : {EasingKind::Linear, EasingKind::EaseIn,
                       EasingKind::EaseOut, EasingKind::EaseInOut,
                       EasingKind::Hold}) {
    EasingKind back;
    ASSERT_TRUE(parse_easing(easing_name(e), back));
    EXPECT_EQ(back, e);
  }
  CropMode unused;
  EXPECT_FALSE(parse_mode("ellipse", unused));
  EXPECT_EQ(std::string(easing_name(EasingKind::EaseInOut)), "easeInOut");
  EXPECT_EQ(even_floor(1365), 1364);
  EXPECT_EQ(even_floor(1), 0);
}
