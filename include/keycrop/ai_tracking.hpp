/**
 * @file ai_tracking.hpp
 * @brief AI object-tracking supplier and conversion into an AI timeline
 *
 * @details The tracker itself (a segmentation service) lives outside the
 *          engine. Its per-frame results become one Hold keyframe per
 *          tracked frame, so sampling never blends two segmentations.
 */

#ifndef KEYCROP_AI_TRACKING_HPP
#define KEYCROP_AI_TRACKING_HPP

#include <memory>
#include <string>
#include <vector>

#include "error.hpp"
#include "timeline.hpp"
#include "types.hpp"

namespace keycrop {

/**
 * @struct TrackingPrompt
 * @brief What to track: a text prompt, a box prompt, or both.
 */
struct TrackingPrompt {
  std::string text;
  NormalizedRect box;
  bool has_box = false;
};

/**
 * @struct TrackedFrame
 * @brief One tracking result.
 */
struct TrackedFrame {
  double timestamp = 0.0;
  NormalizedRect bounding_box;
  std::shared_ptr<const RenderedMask> mask; //< May be null (box only)
};

/**
 * @class ObjectTracker
 * @brief Abstract tracking supplier.
 */
class ObjectTracker {
public:
  virtual ~ObjectTracker() = default;

  /**
   * @brief Track the prompted object through a source video.
   * @param prompt Text and/or box prompt
   * @param source_path Video to track in
   * @param frames Results in timestamp order
   */
  virtual ErrorCode track(const TrackingPrompt &prompt,
                          const std::string &source_path,
                          std::vector<TrackedFrame> &frames) = 0;
};

/**
 * @brief Replace a timeline's contents with tracking results.
 *
 * @param frames Tracking results (any order)
 * @param width Target mask width (the export frame)
 * @param height Target mask height
 * @param timeline Switched to AI mode and refilled
 * @return Ok, MaskResolutionMismatch, or the first insertion error.
 *         On error the timeline is left unchanged.
 */
ErrorCode timeline_from_tracking(const std::vector<TrackedFrame> &frames,
                                 int width, int height,
                                 CropTimeline &timeline);

} // namespace keycrop

#endif // KEYCROP_AI_TRACKING_HPP
