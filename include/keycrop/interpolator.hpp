/**
 * @file interpolator.hpp
 * @brief Keyframe interpolation: timeline + time -> crop geometry
 *
 * @details Pure functions only. Nothing here holds state, so any number of
 *          worker threads may sample the same timeline concurrently.
 *
 * @attention SEGMENT RULES:
 *
 *   - Before the first keyframe: the first keyframe's geometry
 *
 *   - At/after the last keyframe: the last keyframe's geometry
 *
 *   - Between k_i and k_{i+1}: field-wise lerp with k_i's easing applied
 *
 *   - Freehand with differing vertex counts: k_i's polygon for the whole
 *     segment
 *
 *   - AI: no blending, k_i's tracking result holds until k_{i+1}
 */

#ifndef KEYCROP_INTERPOLATOR_HPP
#define KEYCROP_INTERPOLATOR_HPP

#include "error.hpp"
#include "timeline.hpp"
#include "types.hpp"

namespace keycrop {

/**
 * @brief Reparameterize linear progress s in [0,1].
 * @note Hold maps every s < 1 to 0.
 */
double apply_easing(double s, EasingKind kind);

/// a + (b - a) * s
inline double lerp(double a, double b, double s) { return a + (b - a) * s; }

/**
 * @brief Blend two geometries of the same mode with eased progress s.
 * @note Mismatched modes return a unchanged.
 */
CropGeometry lerp_geometry(const CropGeometry &a, const CropGeometry &b,
                           double s);

/**
 * @brief Crop geometry at time t.
 *
 * @param timeline Borrowed, sorted keyframe list
 * @param t Query time in seconds (any finite value)
 * @param out Interpolated geometry
 * @return Ok, NoKeyframes (empty timeline), InvalidInput (non-finite t)
 */
ErrorCode sample(const CropTimeline &timeline, double t, CropGeometry &out);

} // namespace keycrop

#endif // KEYCROP_INTERPOLATOR_HPP
