/**
 * @file interpolator.cpp
 * @brief Easing curves and per-mode geometry interpolation
 */

#include "keycrop/interpolator.hpp"

#include <algorithm>
#include <cmath>

namespace keycrop {

double apply_easing(double s, EasingKind kind) {
  s = std::min(1.0, std::max(0.0, s));
  switch (kind) {
  case EasingKind::Linear:
    return s;
  case EasingKind::EaseIn:
    return s * s;
  case EasingKind::EaseOut:
    return 1.0 - (1.0 - s) * (1.0 - s);
  case EasingKind::EaseInOut:
    if (s < 0.5)
      return 2.0 * s * s;
    return 1.0 - (-2.0 * s + 2.0) * (-2.0 * s + 2.0) / 2.0;
  case EasingKind::Hold:
    return s < 1.0 ? 0.0 : 1.0;
  }
  return s;
}

namespace {

NormalizedPoint lerp_point(const NormalizedPoint &a, const NormalizedPoint &b,
                           double s) {
  return {lerp(a.x, b.x, s), lerp(a.y, b.y, s)};
}

NormalizedRect lerp_rect(const NormalizedRect &a, const NormalizedRect &b,
                         double s) {
  return {lerp(a.x, b.x, s), lerp(a.y, b.y, s), lerp(a.width, b.width, s),
          lerp(a.height, b.height, s)};
}

} // anonymous namespace

CropGeometry lerp_geometry(const CropGeometry &a, const CropGeometry &b,
                           double s) {
  if (a.index() != b.index())
    return a;

  switch (mode_of(a)) {
  case CropMode::Rectangle:
    return RectangleCrop{lerp_rect(std::get<RectangleCrop>(a).rect,
                                   std::get<RectangleCrop>(b).rect, s)};

  case CropMode::Circle: {
    const auto &ca = std::get<CircleCrop>(a);
    const auto &cb = std::get<CircleCrop>(b);
    return CircleCrop{lerp_point(ca.center, cb.center, s),
                      lerp(ca.radius, cb.radius, s)};
  }

  case CropMode::Freehand: {
    const auto &fa = std::get<FreehandCrop>(a);
    const auto &fb = std::get<FreehandCrop>(b);
    /// Vertex correspondence is by index; without it there is nothing to
    /// blend, so the earlier polygon holds
    if (fa.vertices.size() != fb.vertices.size())
      return fa;
    FreehandCrop out;
    out.vertices.reserve(fa.vertices.size());
    for (size_t i = 0; i < fa.vertices.size(); ++i)
      out.vertices.push_back(lerp_point(fa.vertices[i], fb.vertices[i], s));
    return out;
  }

  case CropMode::AI:
    return a;
  }
  return a;
}

ErrorCode sample(const CropTimeline &timeline, double t, CropGeometry &out) {
  const auto &kfs = timeline.keyframes();
  if (kfs.empty())
    return ErrorCode::NoKeyframes;
  if (!std::isfinite(t))
    return ErrorCode::InvalidInput;

  if (kfs.size() == 1 || t < kfs.front().timestamp) {
    out = kfs.front().geometry;
    return ErrorCode::Ok;
  }
  if (t >= kfs.back().timestamp) {
    out = kfs.back().geometry;
    return ErrorCode::Ok;
  }

  /// First keyframe strictly after t; its predecessor starts the segment
  auto next = std::upper_bound(
      kfs.begin(), kfs.end(), t,
      [](double ts, const Keyframe &k) { return ts < k.timestamp; });
  const Keyframe &k1 = *next;
  const Keyframe &k0 = *(next - 1);

  if (timeline.mode() == CropMode::AI) {
    out = k0.geometry;
    return ErrorCode::Ok;
  }

  double span = k1.timestamp - k0.timestamp;
  double s = span > 0.0 ? (t - k0.timestamp) / span : 0.0;
  out = lerp_geometry(k0.geometry, k1.geometry, apply_easing(s, k0.easing));
  return ErrorCode::Ok;
}

} // namespace keycrop
