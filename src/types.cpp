/**
 * @file types.cpp
 * @brief Value-type helpers: clamping constructors, equality, name tables
 */

#include "keycrop/types.hpp"

#include <algorithm>
#include <cmath>

#include "keycrop/error.hpp"

namespace keycrop {

namespace {

/// Smallest extent a clamped rect may have
constexpr double MIN_EXTENT = 1e-4;

double clamp01(double v) {
  if (!std::isfinite(v))
    return 0.0;
  return std::min(1.0, std::max(0.0, v));
}

} // anonymous namespace

// **---- Normalized geometry ----**

bool operator==(const NormalizedPoint &a, const NormalizedPoint &b) {
  return a.x == b.x && a.y == b.y;
}

bool operator!=(const NormalizedPoint &a, const NormalizedPoint &b) {
  return !(a == b);
}

bool operator==(const NormalizedRect &a, const NormalizedRect &b) {
  return a.x == b.x && a.y == b.y && a.width == b.width &&
         a.height == b.height;
}

bool operator!=(const NormalizedRect &a, const NormalizedRect &b) {
  return !(a == b);
}

NormalizedPoint make_point(double x, double y) {
  return {clamp01(x), clamp01(y)};
}

NormalizedRect make_rect(double x, double y, double width, double height) {
  NormalizedRect r;
  r.x = std::min(clamp01(x), 1.0 - MIN_EXTENT);
  r.y = std::min(clamp01(y), 1.0 - MIN_EXTENT);
  r.width = std::max(MIN_EXTENT, std::min(clamp01(width), 1.0 - r.x));
  r.height = std::max(MIN_EXTENT, std::min(clamp01(height), 1.0 - r.y));
  return r;
}

// **---- Masks ----**

size_t RenderedMask::opaque_count() const {
  return static_cast<size_t>(
      std::count(bytes.begin(), bytes.end(), MASK_OPAQUE));
}

bool operator==(const RenderedMask &a, const RenderedMask &b) {
  return a.pixel_width == b.pixel_width && a.pixel_height == b.pixel_height &&
         a.bytes == b.bytes;
}

bool operator!=(const RenderedMask &a, const RenderedMask &b) {
  return !(a == b);
}

// **---- Crop geometry ----**

bool operator==(const RectangleCrop &a, const RectangleCrop &b) {
  return a.rect == b.rect;
}

bool operator==(const CircleCrop &a, const CircleCrop &b) {
  return a.center == b.center && a.radius == b.radius;
}

bool operator==(const FreehandCrop &a, const FreehandCrop &b) {
  return a.vertices == b.vertices;
}

bool operator==(const AICrop &a, const AICrop &b) {
  if (a.bounding_box != b.bounding_box)
    return false;
  if (a.mask == b.mask)
    return true;
  if (!a.mask || !b.mask)
    return false;
  return *a.mask == *b.mask;
}

CropMode mode_of(const CropGeometry &geometry) {
  switch (geometry.index()) {
  case 0:
    return CropMode::Rectangle;
  case 1:
    return CropMode::Circle;
  case 2:
    return CropMode::Freehand;
  default:
    return CropMode::AI;
  }
}

const char *mode_name(CropMode mode) {
  switch (mode) {
  case CropMode::Rectangle:
    return "rectangle";
  case CropMode::Circle:
    return "circle";
  case CropMode::Freehand:
    return "freehand";
  case CropMode::AI:
    return "ai";
  }
  return "rectangle";
}

bool parse_mode(const std::string &name, CropMode &mode) {
  for (CropMode m : {CropMode::Rectangle, CropMode::Circle,
                     CropMode::Freehand, CropMode::AI}) {
    if (name == mode_name(m)) {
      mode = m;
      return true;
    }
  }
  return false;
}

CropGeometry default_geometry(CropMode mode) {
  switch (mode) {
  case CropMode::Rectangle:
    return RectangleCrop{FULL_FRAME};
  case CropMode::Circle:
    return CircleCrop{};
  case CropMode::Freehand:
    return FreehandCrop{};
  case CropMode::AI:
    return AICrop{FULL_FRAME, nullptr};
  }
  return RectangleCrop{FULL_FRAME};
}

// **---- Keyframes ----**

const char *easing_name(EasingKind kind) {
  switch (kind) {
  case EasingKind::Linear:
    return "linear";
  case EasingKind::EaseIn:
    return "easeIn";
  case EasingKind::EaseOut:
    return "easeOut";
  case EasingKind::EaseInOut:
    return "easeInOut";
  case EasingKind::Hold:
    return "hold";
  }
  return "linear";
}

bool parse_easing(const std::string &name, EasingKind &kind) {
  for (EasingKind k : {EasingKind::Linear, EasingKind::EaseIn,
                       EasingKind::EaseOut, EasingKind::EaseInOut,
                       EasingKind::Hold}) {
    if (name == easing_name(k)) {
      kind = k;
      return true;
    }
  }
  return false;
}

bool operator==(const Keyframe &a, const Keyframe &b) {
  return a.timestamp == b.timestamp && a.easing == b.easing &&
         a.geometry == b.geometry;
}

bool operator!=(const Keyframe &a, const Keyframe &b) { return !(a == b); }

// **---- Export inputs ----**

const char *codec_hint_name(CodecHint hint) {
  switch (hint) {
  case CodecHint::MatchSource:
    return "source";
  case CodecHint::H264:
    return "h264";
  case CodecHint::HEVC:
    return "hevc";
  case CodecHint::ProRes:
    return "prores";
  case CodecHint::VP9:
    return "vp9";
  }
  return "source";
}

bool parse_codec_hint(const std::string &name, CodecHint &hint) {
  for (CodecHint h : {CodecHint::MatchSource, CodecHint::H264,
                      CodecHint::HEVC, CodecHint::ProRes, CodecHint::VP9}) {
    if (name == codec_hint_name(h)) {
      hint = h;
      return true;
    }
  }
  return false;
}

bool operator==(const ExportSettings &a, const ExportSettings &b) {
  return a.preserve_full_frame == b.preserve_full_frame &&
         a.enable_alpha == b.enable_alpha && a.codec_hint == b.codec_hint &&
         a.use_hardware_encoder == b.use_hardware_encoder;
}

bool operator!=(const ExportSettings &a, const ExportSettings &b) {
  return !(a == b);
}

bool operator==(const PixelRect &a, const PixelRect &b) {
  return a.x == b.x && a.y == b.y && a.width == b.width &&
         a.height == b.height;
}

// **---- Errors ----**

const char *error_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::NoKeyframes:
    return "NoKeyframes";
  case ErrorCode::InvalidGeometry:
    return "InvalidGeometry";
  case ErrorCode::InvalidInput:
    return "InvalidInput";
  case ErrorCode::DuplicateKeyframe:
    return "DuplicateKeyframe";
  case ErrorCode::KeyframeNotFound:
    return "KeyframeNotFound";
  case ErrorCode::MaskResolutionMismatch:
    return "MaskResolutionMismatch";
  case ErrorCode::OddDimension:
    return "OddDimension";
  case ErrorCode::UnsupportedCodec:
    return "UnsupportedCodec";
  case ErrorCode::EncoderProcessFailure:
    return "EncoderProcessFailure";
  case ErrorCode::Cancelled:
    return "Cancelled";
  case ErrorCode::IoError:
    return "IoError";
  }
  return "Unknown";
}

} // namespace keycrop
