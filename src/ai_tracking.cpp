/**
 * @file ai_tracking.cpp
 * @brief Tracking results -> AI keyframes
 */

#include "keycrop/ai_tracking.hpp"

#include "keycrop/logging.hpp"

namespace keycrop {

ErrorCode timeline_from_tracking(const std::vector<TrackedFrame> &frames,
                                 int width, int height,
                                 CropTimeline &timeline) {
  for (const auto &f : frames) {
    if (f.mask &&
        (f.mask->pixel_width != width || f.mask->pixel_height != height)) {
      LOG_ERROR("Tracked mask at {:.3f}s is {}x{}, expected {}x{}",
                f.timestamp, f.mask->pixel_width, f.mask->pixel_height, width,
                height);
      return ErrorCode::MaskResolutionMismatch;
    }
  }

  CropTimeline rebuilt(CropMode::AI, timeline.duration());
  for (const auto &f : frames) {
    Keyframe kf;
    kf.timestamp = f.timestamp;
    kf.geometry = AICrop{f.bounding_box, f.mask};
    kf.easing = EasingKind::Hold;
    ErrorCode err = rebuilt.add_keyframe(kf);
    if (!ok(err)) {
      LOG_ERROR("Rejected tracked frame at {:.3f}s: {}", f.timestamp,
                error_name(err));
      return err;
    }
  }

  timeline = std::move(rebuilt);
  return ErrorCode::Ok;
}

} // namespace keycrop
