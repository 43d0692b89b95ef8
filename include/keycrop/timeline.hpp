/**
 * @file timeline.hpp
 * @brief Time-ordered keyframe list for one video
 *
 * @details CropTimeline owns the crop mode and the sorted keyframe list of a
 *          single video. All mutations go through validated operations:
 *
 *          - Keyframes are unique by timestamp (1 ms tolerance)
 *
 *          - Every keyframe's geometry matches the timeline's mode
 *
 *          - Switching mode clears the incompatible keyframes
 *
 * @note A timeline is owned by its video entry. The interpolator, rasterizer
 *       and filter-graph builder only borrow it.
 */

#ifndef KEYCROP_TIMELINE_HPP
#define KEYCROP_TIMELINE_HPP

#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace keycrop {

/**
 * @brief Check that a geometry's raw components are finite and in range.
 * @return Ok, or InvalidGeometry
 * @note Degenerate freehand polygons (< 3 vertices) are valid.
 */
ErrorCode validate_geometry(const CropGeometry &geometry);

/**
 * @class CropTimeline
 * @brief Crop mode plus the sorted, timestamp-unique keyframe list.
 */
class CropTimeline {
  CropMode mode_ = CropMode::Rectangle;
  std::vector<Keyframe> keyframes_; //< Sorted by timestamp
  double duration_ = 0.0;           //< Source duration, 0 = unknown

  /// Index of the keyframe within tolerance of t, or -1
  int find_index(double t) const;

  ErrorCode validate(const Keyframe &kf) const;

public:
  CropTimeline() = default;
  explicit CropTimeline(CropMode mode, double duration = 0.0)
      : mode_(mode), duration_(duration) {}

  CropMode mode() const { return mode_; }
  double duration() const { return duration_; }
  const std::vector<Keyframe> &keyframes() const { return keyframes_; }
  bool empty() const { return keyframes_.empty(); }
  size_t size() const { return keyframes_.size(); }

  /**
   * @brief Set the source duration used to reject out-of-range keyframes.
   * @note Existing keyframes past the new duration are kept; only later
   *       insertions are checked.
   */
  void set_duration(double duration) { duration_ = duration; }

  /**
   * @brief Switch the crop mode.
   * @note A real mode change clears all keyframes (their geometry belongs to
   *       the old mode). Setting the current mode is a no-op.
   */
  void set_mode(CropMode mode);

  /**
   * @brief Insert a keyframe, keeping the list sorted.
   * @return Ok, InvalidInput (timestamp), InvalidGeometry,
   *         DuplicateKeyframe
   */
  ErrorCode add_keyframe(const Keyframe &kf);

  /**
   * @brief Remove the keyframe at timestamp t.
   * @return Ok or KeyframeNotFound
   */
  ErrorCode remove_keyframe(double t);

  /**
   * @brief Replace the keyframe at timestamp t.
   * @note The replacement may carry a new timestamp; it must not collide
   *       with another keyframe. On error the timeline is unchanged.
   */
  ErrorCode update_keyframe(double t, const Keyframe &replacement);

  /// Change only the easing of the keyframe at t
  ErrorCode set_easing(double t, EasingKind easing);

  /**
   * @brief Look up the keyframe at timestamp t.
   * @return nullptr when there is none
   */
  const Keyframe *keyframe_at(double t) const;

  void clear() { keyframes_.clear(); }
};

bool operator==(const CropTimeline &a, const CropTimeline &b);
bool operator!=(const CropTimeline &a, const CropTimeline &b);

} // namespace keycrop

#endif // KEYCROP_TIMELINE_HPP
