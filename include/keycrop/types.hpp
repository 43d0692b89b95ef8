/**
 * @file types.hpp
 * @brief Core data types for keyframed crops
 *
 * @details Contains the value types shared by every stage of the engine:
 *          - Normalized points and rectangles (all components in [0,1])
 *
 *          - Per-mode crop geometry as a tagged union
 *
 *          - Easing kinds and keyframes
 *
 *          - Export settings and probed source properties
 *
 *          - Rendered single-channel masks
 *
 * @note Geometry is normalized against the source frame; it is resolved to
 *       pixels only by the rasterizer and the filter-graph builder.
 */

#ifndef KEYCROP_TYPES_HPP
#define KEYCROP_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace keycrop {

// **----- CONSTANTS -----**

/// Two keyframe timestamps closer than this are the same keyframe (seconds)
constexpr double TIMESTAMP_TOLERANCE = 0.001;

/// Opaque / transparent mask values
constexpr uint8_t MASK_OPAQUE = 255;
constexpr uint8_t MASK_TRANSPARENT = 0;

// **----- NORMALIZED GEOMETRY -----**

/**
 * @struct NormalizedPoint
 * @brief A position relative to the frame, both components in [0,1].
 */
struct NormalizedPoint {
  double x = 0.0;
  double y = 0.0;
};

/**
 * @struct NormalizedRect
 * @brief A frame-relative rectangle.
 * @note Invariants: width,height > 0, x+width <= 1, y+height <= 1.
 *       Use make_rect() to obtain a clamped instance.
 */
struct NormalizedRect {
  double x = 0.0;
  double y = 0.0;
  double width = 1.0;
  double height = 1.0;
};

bool operator==(const NormalizedPoint &a, const NormalizedPoint &b);
bool operator!=(const NormalizedPoint &a, const NormalizedPoint &b);
bool operator==(const NormalizedRect &a, const NormalizedRect &b);
bool operator!=(const NormalizedRect &a, const NormalizedRect &b);

/// Clamp both components into [0,1]
NormalizedPoint make_point(double x, double y);

/// Clamp into the unit square keeping a non-zero extent
NormalizedRect make_rect(double x, double y, double width, double height);

/// Whole frame
constexpr NormalizedRect FULL_FRAME{0.0, 0.0, 1.0, 1.0};

// **----- MASKS -----**

/**
 * @struct RenderedMask
 * @brief Single-channel 8-bit bitmap, row-major, 0 = hidden, 255 = visible.
 */
struct RenderedMask {
  int pixel_width = 0;
  int pixel_height = 0;
  std::vector<uint8_t> bytes; //< pixel_width * pixel_height values

  bool empty() const { return bytes.empty(); }
  size_t opaque_count() const;
};

bool operator==(const RenderedMask &a, const RenderedMask &b);
bool operator!=(const RenderedMask &a, const RenderedMask &b);

// **----- CROP MODES -----**

enum class CropMode { Rectangle, Circle, Freehand, AI };

/// Rectangle crop: the visible region is the rect itself
struct RectangleCrop {
  NormalizedRect rect;
};

/**
 * @struct CircleCrop
 * @brief Circle crop.
 * @note radius is relative to min(frame width, frame height).
 */
struct CircleCrop {
  NormalizedPoint center{0.5, 0.5};
  double radius = 0.4;
};

/**
 * @struct FreehandCrop
 * @brief Closed polygon, vertices in drawing order.
 * @note Fewer than 3 vertices is a degenerate polygon (full-frame).
 */
struct FreehandCrop {
  std::vector<NormalizedPoint> vertices;

  bool degenerate() const { return vertices.size() < 3; }
};

/**
 * @struct AICrop
 * @brief Externally supplied tracking result for one instant.
 * @note The mask is shared, never copied, between samples and keyframes.
 *       A null mask means "no segmentation": everything stays visible.
 */
struct AICrop {
  NormalizedRect bounding_box;
  std::shared_ptr<const RenderedMask> mask;
};

bool operator==(const RectangleCrop &a, const RectangleCrop &b);
bool operator==(const CircleCrop &a, const CircleCrop &b);
bool operator==(const FreehandCrop &a, const FreehandCrop &b);
bool operator==(const AICrop &a, const AICrop &b);

/// Geometry of one crop mode
using CropGeometry =
    std::variant<RectangleCrop, CircleCrop, FreehandCrop, AICrop>;

/// Mode carried by a geometry payload
CropMode mode_of(const CropGeometry &geometry);

/// Stable lower-case name ("rectangle", "circle", "freehand", "ai")
const char *mode_name(CropMode mode);

/// Inverse of mode_name(); returns false on unknown names
bool parse_mode(const std::string &name, CropMode &mode);

/// Default geometry for a mode (full frame rect, centered circle, ...)
CropGeometry default_geometry(CropMode mode);

// **----- KEYFRAMES -----**

enum class EasingKind { Linear, EaseIn, EaseOut, EaseInOut, Hold };

/// Schema names ("linear", "easeIn", "easeOut", "easeInOut", "hold")
const char *easing_name(EasingKind kind);
bool parse_easing(const std::string &name, EasingKind &kind);

/**
 * @struct Keyframe
 * @brief Timestamped geometry. The easing shapes the segment that starts
 *        at this keyframe.
 */
struct Keyframe {
  double timestamp = 0.0; //< Seconds from the start of the source
  CropGeometry geometry;
  EasingKind easing = EasingKind::Linear;
};

bool operator==(const Keyframe &a, const Keyframe &b);
bool operator!=(const Keyframe &a, const Keyframe &b);

// **----- EXPORT INPUTS -----**

enum class CodecHint { MatchSource, H264, HEVC, ProRes, VP9 };

const char *codec_hint_name(CodecHint hint);
bool parse_codec_hint(const std::string &name, CodecHint &hint);

/**
 * @struct ExportSettings
 * @brief User-facing export options for one video.
 */
struct ExportSettings {
  bool preserve_full_frame = false; //< Rectangle: keep source framing
  bool enable_alpha = false;        //< Transparent outside the mask
  CodecHint codec_hint = CodecHint::MatchSource;
  bool use_hardware_encoder = false;
};

bool operator==(const ExportSettings &a, const ExportSettings &b);
bool operator!=(const ExportSettings &a, const ExportSettings &b);

/**
 * @struct SourceVideoProperties
 * @brief What the media probe knows about a source file.
 */
struct SourceVideoProperties {
  int width = 0;
  int height = 0;
  double frame_rate = 0.0;
  std::string codec;     //< Decoder name, e.g. "h264", "hevc", "prores"
  std::string codec_tag; //< Container fourcc, e.g. "avc1", "apch"
  double duration = 0.0; //< Seconds (0 = unknown)
  int64_t bit_rate = 0;  //< Bits per second (0 = unknown)
  int bit_depth = 8;
  std::string color_primaries; //< FFmpeg names, empty = unspecified
  std::string color_transfer;
  std::string color_space;
};

/**
 * @struct PixelRect
 * @brief Integer pixel rectangle inside a frame.
 */
struct PixelRect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
};

bool operator==(const PixelRect &a, const PixelRect &b);

/// Truncate to the nearest even integer not above value (never below 0)
inline int even_floor(int value) {
  return value <= 0 ? 0 : value - (value % 2);
}

} // namespace keycrop

#endif // KEYCROP_TYPES_HPP
