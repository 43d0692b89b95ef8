/**
 * @file mask_rasterizer.cpp
 * @brief Scanline rasterization of circle, polygon and rectangle masks
 *
 * @details Every shape is reduced to horizontal spans per (sub-)scanline.
 *          A span [xa, xb) covers the sample positions whose x lies inside
 *          it; per-pixel hit counts become the mask value.
 */

#include "keycrop/mask_rasterizer.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace keycrop {

namespace {

/// Sub-samples per axis when antialiasing
constexpr int AA_GRID = 4;

/**
 * @brief Add span [xa, xb) to the per-pixel hit counters of one row.
 * @param grid Samples per axis; sample i of pixel px sits at
 *             px + (i + 0.5) / grid
 */
void accumulate_span(double xa, double xb, int width, int grid,
                     std::vector<int> &hits) {
  for (int i = 0; i < grid; ++i) {
    double offset = (i + 0.5) / grid;
    int first = static_cast<int>(std::ceil(xa - offset));
    int last = static_cast<int>(std::ceil(xb - offset)) - 1;
    first = std::max(first, 0);
    last = std::min(last, width - 1);
    for (int px = first; px <= last; ++px)
      ++hits[px];
  }
}

/// Turn hit counters into mask values for one row
void resolve_row(const std::vector<int> &hits, int samples, uint8_t *row,
                 int width) {
  for (int px = 0; px < width; ++px) {
    if (hits[px] >= samples) {
      row[px] = MASK_OPAQUE;
    } else if (hits[px] > 0) {
      row[px] = static_cast<uint8_t>(
          std::lround(static_cast<double>(MASK_OPAQUE) * hits[px] / samples));
    }
  }
}

/**
 * @brief Generic scan driver.
 * @param spans_at Fills the spans crossing scanline y (pixel units)
 */
template <typename SpanFn>
void scan(int width, int height, int grid, RenderedMask &out,
          SpanFn spans_at) {
  std::vector<int> hits(width);
  std::vector<double> xs;
  int samples = grid * grid;

  for (int py = 0; py < height; ++py) {
    std::fill(hits.begin(), hits.end(), 0);
    bool any = false;
    for (int j = 0; j < grid; ++j) {
      double yc = py + (j + 0.5) / grid;
      xs.clear();
      spans_at(yc, xs);
      for (size_t k = 0; k + 1 < xs.size(); k += 2) {
        accumulate_span(xs[k], xs[k + 1], width, grid, hits);
        any = true;
      }
    }
    if (any)
      resolve_row(hits, samples,
                  out.bytes.data() + static_cast<size_t>(py) * width, width);
  }
}

void fill_all(RenderedMask &out) {
  std::fill(out.bytes.begin(), out.bytes.end(), MASK_OPAQUE);
}

void raster_rect(const NormalizedRect &r, int width, int height, int grid,
                 RenderedMask &out) {
  double x0 = r.x * width, x1 = (r.x + r.width) * width;
  double y0 = r.y * height, y1 = (r.y + r.height) * height;
  scan(width, height, grid, out, [&](double yc, std::vector<double> &xs) {
    if (yc >= y0 && yc < y1) {
      xs.push_back(x0);
      xs.push_back(x1);
    }
  });
}

void raster_circle(const CircleCrop &c, int width, int height, int grid,
                   RenderedMask &out) {
  double cx = c.center.x * width;
  double cy = c.center.y * height;
  double r = c.radius * std::min(width, height);
  if (r <= 0.0)
    return;
  double r2 = r * r;
  scan(width, height, grid, out, [&](double yc, std::vector<double> &xs) {
    double dy = yc - cy;
    if (dy * dy > r2)
      return;
    double half = std::sqrt(r2 - dy * dy);
    /// Closed interval: a center exactly on the circle counts as inside
    xs.push_back(cx - half);
    xs.push_back(std::nextafter(cx + half, cx + half + 1.0));
  });
}

void raster_polygon(const std::vector<NormalizedPoint> &vertices, int width,
                    int height, int grid, RenderedMask &out) {
  std::vector<double> vx(vertices.size()), vy(vertices.size());
  for (size_t i = 0; i < vertices.size(); ++i) {
    vx[i] = vertices[i].x * width;
    vy[i] = vertices[i].y * height;
  }

  scan(width, height, grid, out, [&](double yc, std::vector<double> &xs) {
    size_t n = vx.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
      /// Half-open crossing test: each vertex is counted on one side only
      if ((vy[i] <= yc) != (vy[j] <= yc)) {
        double t = (yc - vy[j]) / (vy[i] - vy[j]);
        xs.push_back(vx[j] + t * (vx[i] - vx[j]));
      }
    }
    /// Even-odd: consecutive crossings bound the inside spans
    std::sort(xs.begin(), xs.end());
  });
}

} // anonymous namespace

int to_pixel(double normalized, int extent) {
  return static_cast<int>(std::floor(normalized * extent + 1e-6));
}

ErrorCode rasterize(const CropGeometry &geometry, int width, int height,
                    RenderedMask &out, const RasterOptions &options) {
  if (width <= 0 || height <= 0)
    return ErrorCode::InvalidInput;

  int grid = options.antialias ? AA_GRID : 1;

  if (mode_of(geometry) == CropMode::AI) {
    const auto &ai = std::get<AICrop>(geometry);
    if (ai.mask) {
      if (ai.mask->pixel_width != width || ai.mask->pixel_height != height)
        return ErrorCode::MaskResolutionMismatch;
      out = *ai.mask;
      return ErrorCode::Ok;
    }
  }

  out.pixel_width = width;
  out.pixel_height = height;
  out.bytes.assign(static_cast<size_t>(width) * height, MASK_TRANSPARENT);

  switch (mode_of(geometry)) {
  case CropMode::Rectangle:
    raster_rect(std::get<RectangleCrop>(geometry).rect, width, height, grid,
                out);
    break;
  case CropMode::Circle:
    raster_circle(std::get<CircleCrop>(geometry), width, height, grid, out);
    break;
  case CropMode::Freehand: {
    const auto &fh = std::get<FreehandCrop>(geometry);
    if (fh.degenerate())
      fill_all(out);
    else
      raster_polygon(fh.vertices, width, height, grid, out);
    break;
  }
  case CropMode::AI:
    fill_all(out);
    break;
  }
  return ErrorCode::Ok;
}

PixelRect pixel_bounds(const CropGeometry &geometry, int width, int height) {
  double x0 = 0.0, y0 = 0.0, x1 = width, y1 = height;

  switch (mode_of(geometry)) {
  case CropMode::Rectangle: {
    const auto &r = std::get<RectangleCrop>(geometry).rect;
    x0 = r.x * width;
    y0 = r.y * height;
    x1 = (r.x + r.width) * width;
    y1 = (r.y + r.height) * height;
    break;
  }
  case CropMode::Circle: {
    const auto &c = std::get<CircleCrop>(geometry);
    double r = c.radius * std::min(width, height);
    x0 = c.center.x * width - r;
    x1 = c.center.x * width + r;
    y0 = c.center.y * height - r;
    y1 = c.center.y * height + r;
    break;
  }
  case CropMode::Freehand: {
    const auto &fh = std::get<FreehandCrop>(geometry);
    if (fh.degenerate())
      break;
    x0 = y0 = 1e300;
    x1 = y1 = -1e300;
    for (const auto &v : fh.vertices) {
      x0 = std::min(x0, v.x * width);
      x1 = std::max(x1, v.x * width);
      y0 = std::min(y0, v.y * height);
      y1 = std::max(y1, v.y * height);
    }
    break;
  }
  case CropMode::AI: {
    const auto &bb = std::get<AICrop>(geometry).bounding_box;
    if (bb.width <= 0.0 || bb.height <= 0.0)
      break;
    x0 = bb.x * width;
    y0 = bb.y * height;
    x1 = (bb.x + bb.width) * width;
    y1 = (bb.y + bb.height) * height;
    break;
  }
  }

  int left = std::max(0, static_cast<int>(std::floor(x0 + 1e-6)));
  int top = std::max(0, static_cast<int>(std::floor(y0 + 1e-6)));
  int right = std::min(width, static_cast<int>(std::ceil(x1 - 1e-6)));
  int bottom = std::min(height, static_cast<int>(std::ceil(y1 - 1e-6)));

  PixelRect out;
  out.x = left;
  out.y = top;
  out.width = std::max(0, right - left);
  out.height = std::max(0, bottom - top);
  return out;
}

} // namespace keycrop
