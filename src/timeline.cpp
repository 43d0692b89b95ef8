/**
 * @file timeline.cpp
 * @brief Keyframe list mutation and validation
 */

#include "keycrop/timeline.hpp"

#include <algorithm>
#include <cmath>

namespace keycrop {

namespace {

bool in_unit(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

bool valid_rect(const NormalizedRect &r) {
  /// Small slack for values produced by float arithmetic (e.g. 0.3 + 0.7)
  constexpr double SLACK = 1e-9;
  return in_unit(r.x) && in_unit(r.y) && in_unit(r.width) &&
         in_unit(r.height) && r.width > 0.0 && r.height > 0.0 &&
         r.x + r.width <= 1.0 + SLACK && r.y + r.height <= 1.0 + SLACK;
}

bool valid_point(const NormalizedPoint &p) { return in_unit(p.x) && in_unit(p.y); }

} // anonymous namespace

ErrorCode validate_geometry(const CropGeometry &geometry) {
  bool valid = true;
  switch (mode_of(geometry)) {
  case CropMode::Rectangle:
    valid = valid_rect(std::get<RectangleCrop>(geometry).rect);
    break;
  case CropMode::Circle: {
    const auto &c = std::get<CircleCrop>(geometry);
    valid = valid_point(c.center) && in_unit(c.radius);
    break;
  }
  case CropMode::Freehand:
    for (const auto &v : std::get<FreehandCrop>(geometry).vertices) {
      if (!valid_point(v)) {
        valid = false;
        break;
      }
    }
    break;
  case CropMode::AI:
    valid = valid_rect(std::get<AICrop>(geometry).bounding_box);
    break;
  }
  return valid ? ErrorCode::Ok : ErrorCode::InvalidGeometry;
}

// **---- Lookup ----**

int CropTimeline::find_index(double t) const {
  for (size_t i = 0; i < keyframes_.size(); ++i) {
    if (std::abs(keyframes_[i].timestamp - t) < TIMESTAMP_TOLERANCE)
      return static_cast<int>(i);
  }
  return -1;
}

const Keyframe *CropTimeline::keyframe_at(double t) const {
  int idx = find_index(t);
  return idx < 0 ? nullptr : &keyframes_[idx];
}

// **---- Mutation ----**

ErrorCode CropTimeline::validate(const Keyframe &kf) const {
  if (!std::isfinite(kf.timestamp) || kf.timestamp < 0.0)
    return ErrorCode::InvalidInput;
  if (duration_ > 0.0 && kf.timestamp > duration_ + TIMESTAMP_TOLERANCE)
    return ErrorCode::InvalidInput;
  if (mode_of(kf.geometry) != mode_)
    return ErrorCode::InvalidGeometry;
  return validate_geometry(kf.geometry);
}

void CropTimeline::set_mode(CropMode mode) {
  if (mode == mode_)
    return;
  mode_ = mode;
  keyframes_.clear();
}

ErrorCode CropTimeline::add_keyframe(const Keyframe &kf) {
  ErrorCode err = validate(kf);
  if (!ok(err))
    return err;
  if (find_index(kf.timestamp) >= 0)
    return ErrorCode::DuplicateKeyframe;

  auto pos = std::upper_bound(
      keyframes_.begin(), keyframes_.end(), kf.timestamp,
      [](double t, const Keyframe &k) { return t < k.timestamp; });
  keyframes_.insert(pos, kf);
  return ErrorCode::Ok;
}

ErrorCode CropTimeline::remove_keyframe(double t) {
  int idx = find_index(t);
  if (idx < 0)
    return ErrorCode::KeyframeNotFound;
  keyframes_.erase(keyframes_.begin() + idx);
  return ErrorCode::Ok;
}

ErrorCode CropTimeline::update_keyframe(double t, const Keyframe &replacement) {
  int idx = find_index(t);
  if (idx < 0)
    return ErrorCode::KeyframeNotFound;

  ErrorCode err = validate(replacement);
  if (!ok(err))
    return err;

  int clash = find_index(replacement.timestamp);
  if (clash >= 0 && clash != idx)
    return ErrorCode::DuplicateKeyframe;

  keyframes_.erase(keyframes_.begin() + idx);
  auto pos = std::upper_bound(
      keyframes_.begin(), keyframes_.end(), replacement.timestamp,
      [](double ts, const Keyframe &k) { return ts < k.timestamp; });
  keyframes_.insert(pos, replacement);
  return ErrorCode::Ok;
}

ErrorCode CropTimeline::set_easing(double t, EasingKind easing) {
  int idx = find_index(t);
  if (idx < 0)
    return ErrorCode::KeyframeNotFound;
  keyframes_[idx].easing = easing;
  return ErrorCode::Ok;
}

bool operator==(const CropTimeline &a, const CropTimeline &b) {
  return a.mode() == b.mode() && a.duration() == b.duration() &&
         a.keyframes() == b.keyframes();
}

bool operator!=(const CropTimeline &a, const CropTimeline &b) {
  return !(a == b);
}

} // namespace keycrop
