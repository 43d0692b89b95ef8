#include <algorithm>
#include <memory>
#include <utility>

#include <gtest/gtest.h>

#include "keycrop/mask_rasterizer.hpp"

using namespace keycrop;

namespace {

constexpr double PI = 3.14159265358979323846;

uint8_t at(const RenderedMask &m, int x, int y) {
  return m.bytes[static_cast<size_t>(y) * m.pixel_width + x];
}

} // namespace

class CircleAreaTest
    : public ::testing::TestWithParam<std::pair<int, int>> {};

TEST_P(CircleAreaTest, AreaApproximatesPiRSquared) {
  int w = GetParam().first;
  int h = GetParam().second;
  CircleCrop c{{0.5, 0.5}, 0.3};

  RenderedMask mask;
  ASSERT_EQ(rasterize(c, w, h, mask), ErrorCode::Ok);
  ASSERT_EQ(mask.pixel_width, w);
  ASSERT_EQ(mask.pixel_height, h);

  double r = 0.3 * std::min(w, h);
  double expected = PI * r * r;
  EXPECT_NEAR(static_cast<double>(mask.opaque_count()), expected,
              expected * 0.05);
}

INSTANTIATE_TEST_SUITE_P(Resolutions, CircleAreaTest,
                         ::testing::Values(std::make_pair(64, 64),
                                           std::make_pair(640, 360),
                                           std::make_pair(1920, 1080)));

TEST(Rasterize, RejectsEmptyTarget) {
  RenderedMask mask;
  EXPECT_EQ(rasterize(CircleCrop{}, 0, 10, mask), ErrorCode::InvalidInput);
  EXPECT_EQ(rasterize(CircleCrop{}, 10, -1, mask), ErrorCode::InvalidInput);
}

TEST(Rasterize, CircleIsSymmetric) {
  RenderedMask mask;
  ASSERT_EQ(rasterize(CircleCrop{{0.5, 0.5}, 0.25}, 100, 100, mask),
            ErrorCode::Ok);
  EXPECT_EQ(at(mask, 50, 50), MASK_OPAQUE);
  EXPECT_EQ(at(mask, 0, 0), MASK_TRANSPARENT);
  for (int y = 0; y < 100; ++y)
    for (int x = 0; x < 100; ++x)
      ASSERT_EQ(at(mask, x, y), at(mask, 99 - x, y)) << x << "," << y;
}

TEST(Rasterize, ShortPolygonIsFullFrame) {
  for (size_t n : {0u, 1u, 2u}) {
    FreehandCrop poly;
    for (size_t i = 0; i < n; ++i)
      poly.vertices.push_back({0.1 * (i + 1), 0.2});

    RenderedMask mask;
    ASSERT_EQ(rasterize(poly, 33, 17, mask), ErrorCode::Ok);
    EXPECT_EQ(mask.pixel_width, 33);
    EXPECT_EQ(mask.pixel_height, 17);
    EXPECT_EQ(mask.opaque_count(), 33u * 17u);
  }
}

TEST(Rasterize, SquarePolygonCoversPixelCenters) {
  FreehandCrop square{{{0.25, 0.25}, {0.75, 0.25}, {0.75, 0.75}, {0.25, 0.75}}};
  RenderedMask mask;
  ASSERT_EQ(rasterize(square, 8, 8, mask), ErrorCode::Ok);

  /// Pixels 2..5 have centers inside [2, 6)
  EXPECT_EQ(mask.opaque_count(), 16u);
  EXPECT_EQ(at(mask, 2, 2), MASK_OPAQUE);
  EXPECT_EQ(at(mask, 5, 5), MASK_OPAQUE);
  EXPECT_EQ(at(mask, 1, 2), MASK_TRANSPARENT);
  EXPECT_EQ(at(mask, 6, 5), MASK_TRANSPARENT);
}

TEST(Rasterize, SelfOverlapUsesEvenOdd) {
  /// Outer square then inner square wound into one contour through a seam:
  /// the inner region is crossed twice and stays hidden
  FreehandCrop ring{{{0.0, 0.0},
                     {1.0, 0.0},
                     {1.0, 1.0},
                     {0.0, 1.0},
                     {0.0, 0.0},
                     {0.25, 0.25},
                     {0.25, 0.75},
                     {0.75, 0.75},
                     {0.75, 0.25},
                     {0.25, 0.25}}};
  RenderedMask mask;
  ASSERT_EQ(rasterize(ring, 40, 40, mask), ErrorCode::Ok);
  EXPECT_EQ(at(mask, 20, 20), MASK_TRANSPARENT);
  EXPECT_EQ(at(mask, 3, 20), MASK_OPAQUE);
  EXPECT_EQ(at(mask, 36, 20), MASK_OPAQUE);
}

TEST(Rasterize, RectangleMask) {
  RectangleCrop r{{0.1, 0.1, 0.5, 0.5}};
  RenderedMask mask;
  ASSERT_EQ(rasterize(r, 100, 50, mask), ErrorCode::Ok);
  EXPECT_EQ(mask.opaque_count(), 50u * 25u);
}

TEST(Rasterize, AIMaskMustMatchTarget) {
  auto m = std::make_shared<RenderedMask>();
  m->pixel_width = 4;
  m->pixel_height = 2;
  m->bytes.assign(8, MASK_TRANSPARENT);
  m->bytes[3] = MASK_OPAQUE;

  AICrop ai{{0.0, 0.0, 1.0, 1.0}, m};
  RenderedMask out;
  EXPECT_EQ(rasterize(ai, 8, 4, out), ErrorCode::MaskResolutionMismatch);
  ASSERT_EQ(rasterize(ai, 4, 2, out), ErrorCode::Ok);
  EXPECT_EQ(out, *m);
}

TEST(Rasterize, AIWithoutMaskIsFullFrame) {
  AICrop ai{{0.2, 0.2, 0.3, 0.3}, nullptr};
  RenderedMask out;
  ASSERT_EQ(rasterize(ai, 10, 10, out), ErrorCode::Ok);
  EXPECT_EQ(out.opaque_count(), 100u);
}

TEST(Rasterize, AntialiasSoftensEdgesOnly) {
  CircleCrop c{{0.5, 0.5}, 0.4};
  RenderedMask hard, soft;
  ASSERT_EQ(rasterize(c, 64, 64, hard), ErrorCode::Ok);
  ASSERT_EQ(rasterize(c, 64, 64, soft, RasterOptions{true}), ErrorCode::Ok);

  EXPECT_EQ(at(soft, 32, 32), MASK_OPAQUE);
  EXPECT_EQ(at(soft, 0, 0), MASK_TRANSPARENT);

  int partial = 0;
  for (uint8_t v : soft.bytes)
    if (v != MASK_OPAQUE && v != MASK_TRANSPARENT)
      ++partial;
  EXPECT_GT(partial, 0);
  for (uint8_t v : hard.bytes)
    EXPECT_TRUE(v == MASK_OPAQUE || v == MASK_TRANSPARENT);
}

TEST(PixelBounds, ClipsToFrame) {
  PixelRect b = pixel_bounds(CircleCrop{{0.1, 0.5}, 0.3}, 200, 100);
  EXPECT_EQ(b.x, 0);
  EXPECT_EQ(b.y, 20);
  EXPECT_EQ(b.width, 50);
  EXPECT_EQ(b.height, 60);
}

TEST(PixelBounds, DegeneratePolygonIsWholeFrame) {
  PixelRect b = pixel_bounds(FreehandCrop{{{0.5, 0.5}}}, 30, 20);
  EXPECT_EQ(b, (PixelRect{0, 0, 30, 20}));
}

TEST(ToPixel, ToleratesFloatNoise) {
  EXPECT_EQ(to_pixel(0.57, 100), 57);
  EXPECT_EQ(to_pixel(0.1, 1920), 192);
  EXPECT_EQ(to_pixel(0.0, 1920), 0);
}
