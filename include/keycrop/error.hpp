/**
 * @file error.hpp
 * @brief Error codes returned by every fallible keycrop operation
 *
 * @details Operations return ErrorCode::Ok (0) on success and fill their
 *          output parameters; any other value describes the failure.
 */

#ifndef KEYCROP_ERROR_HPP
#define KEYCROP_ERROR_HPP

namespace keycrop {

enum class ErrorCode {
  Ok = 0,
  NoKeyframes,            //< Sampling an empty timeline
  InvalidGeometry,        //< Out-of-range / non-finite / wrong-mode geometry
  InvalidInput,           //< Bad timestamp, unreadable source, bad document
  DuplicateKeyframe,      //< A keyframe already exists at that timestamp
  KeyframeNotFound,       //< No keyframe at the requested timestamp
  MaskResolutionMismatch, //< External mask size differs from the target
  OddDimension,           //< Even-dimension correction impossible
  UnsupportedCodec,       //< No encoder row for the requested combination
  EncoderProcessFailure,  //< External encoder exited non-zero
  Cancelled,              //< Cooperative cancellation observed
  IoError,                //< Temporary asset could not be written
};

/// Stable identifier, e.g. "NoKeyframes"
const char *error_name(ErrorCode code);

inline bool ok(ErrorCode code) { return code == ErrorCode::Ok; }

} // namespace keycrop

#endif // KEYCROP_ERROR_HPP
