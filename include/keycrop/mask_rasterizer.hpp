/**
 * @file mask_rasterizer.hpp
 * @brief Crop geometry -> single-channel mask bitmap
 *
 * @details Pixel classification rule (all modes): a pixel is inside iff its
 *          center (px + 0.5, py + 0.5) lies inside the denormalized shape.
 *          Polygons are filled with the EVEN-ODD rule: self-overlapping
 *          regions of a freehand path cancel out.
 *
 *          - Circle: radius * min(width, height) pixels around the center
 *
 *          - Freehand: polygon through the denormalized vertices; fewer than
 *            3 vertices yields a fully opaque mask
 *
 *          - AI: the supplied bitmap is passed through after a resolution
 *            check; no bitmap yields a fully opaque mask
 *
 *          - Rectangle: filled rect (the export path crops instead and never
 *            asks for a rectangle mask)
 *
 * @note With antialiasing each pixel is evaluated at 4x4 sub-pixel centers
 *       and stores the covered fraction.
 */

#ifndef KEYCROP_MASK_RASTERIZER_HPP
#define KEYCROP_MASK_RASTERIZER_HPP

#include "error.hpp"
#include "types.hpp"

namespace keycrop {

struct RasterOptions {
  bool antialias = false;
};

/**
 * @brief Render the mask of a geometry at the target resolution.
 *
 * @param geometry Normalized geometry (its variant selects the mode)
 * @param width Target width in pixels
 * @param height Target height in pixels
 * @param out Rendered mask
 * @param options Quality options
 * @return Ok, InvalidInput (non-positive size), MaskResolutionMismatch (AI)
 */
ErrorCode rasterize(const CropGeometry &geometry, int width, int height,
                    RenderedMask &out, const RasterOptions &options = {});

/**
 * @brief Pixel bounding box of the visible region, clipped to the frame.
 * @note Not rounded to even sizes; degenerate freehand polygons and AI crops
 *       without a bounding box cover the whole frame.
 */
PixelRect pixel_bounds(const CropGeometry &geometry, int width, int height);

/// Normalized -> pixel coordinate, tolerant of float noise (0.57*100 = 57)
int to_pixel(double normalized, int extent);

} // namespace keycrop

#endif // KEYCROP_MASK_RASTERIZER_HPP
