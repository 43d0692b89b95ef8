/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Each getter reads its variable once, on first use, and keeps
 *          the value for the life of the process. config/keycrop.env
 *          documents every variable.
 */

#ifndef KEYCROP_CONFIG_HPP
#define KEYCROP_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

#include "logging.hpp"

namespace keycrop {
namespace Config {

/**
 * @brief Integer environment value.
 * @return default_val when unset, empty or not a whole number (a
 *         malformed value is reported once per variable)
 */
inline int64_t env_integer(const char *name, int64_t default_val) {
  const char *raw = std::getenv(name);
  if (!raw || !*raw)
    return default_val;
  char *end = nullptr;
  long long v = std::strtoll(raw, &end, 10);
  if (*end != '\0') {
    LOG_WARN("Ignoring {}='{}': not an integer, using {}", name, raw,
             default_val);
    return default_val;
  }
  return static_cast<int64_t>(v);
}

inline int env_int(const char *name, int default_val) {
  return static_cast<int>(env_integer(name, default_val));
}

inline bool env_flag(const char *name) { return env_integer(name, 0) != 0; }

/// String environment value; default_val when unset or empty
inline std::string env_string(const char *name,
                              const std::string &default_val) {
  const char *raw = std::getenv(name);
  return (raw && *raw) ? std::string(raw) : default_val;
}

// **---- ENCODER ----**

/// Encoder binary (resolved through PATH when not absolute)
inline const std::string &ffmpeg_path() {
  static std::string val = env_string("FFMPEG_PATH", "ffmpeg");
  return val;
}

/**
 * @brief Hardware encoder family used when hardware encoding is requested
 * @note One of: nvenc, qsv, vaapi, amf, videotoolbox
 */
inline const std::string &hw_encoder_backend() {
  static std::string val = env_string("HW_ENCODER_BACKEND", "nvenc");
  return val;
}

/// Render node handed to FFmpeg for the VAAPI backend
inline const std::string &vaapi_device() {
  static std::string val =
      env_string("VAAPI_DEVICE", "/dev/dri/renderD128");
  return val;
}

/// Hardware target bitrate when the probe reports none (bits per second)
inline int64_t default_bit_rate() {
  static int64_t val = env_integer("DEFAULT_BIT_RATE", 10000000);
  return val;
}

/// Fill color behind the mask when alpha export is disabled
inline const std::string &background_color() {
  static std::string val = env_string("BACKGROUND_COLOR", "black");
  return val;
}

/// Bytes of encoder stderr kept for failure reports
inline int stderr_excerpt_bytes() {
  static int val = env_int("STDERR_EXCERPT_BYTES", 500);
  return val;
}

/// Milliseconds between SIGTERM and SIGKILL on cancellation
inline int cancel_grace_ms() {
  static int val = env_int("CANCEL_GRACE_MS", 2000);
  return val;
}

// **---- MASKS ----**

/// Directory for per-job mask assets (empty = system temp directory)
inline const std::string &mask_temp_dir() {
  static std::string val = env_string("MASK_TEMP_DIR", "");
  return val;
}

/**
 * @brief Keep mask assets after the job finishes
 * @note Debugging aid only; assets are otherwise deleted on every exit path
 */
inline bool keep_mask_files() {
  static bool val = env_flag("KEEP_MASK_FILES");
  return val;
}

/// 4x4 supersampled mask edges instead of hard pixel-center classification
inline bool mask_antialias() {
  static bool val = env_flag("MASK_ANTIALIAS");
  return val;
}

// **---- PARALLEL PROCESSING ----**

/**
 * @brief Number of export jobs running at once
 * @note 0 = auto-detect based on available CPUs
 * @see MASK_WORKERS for parallelism inside one job
 */
inline int max_parallel_jobs() {
  static int val = env_int("MAX_PARALLEL_JOBS", 0);
  return val;
}

/**
 * @brief Rasterization threads per job for per-frame mask sequences
 * @note 0 = one per available CPU
 */
inline int mask_workers() {
  static int val = env_int("MASK_WORKERS", 0);
  return val;
}

} // namespace Config
} // namespace keycrop

#endif // KEYCROP_CONFIG_HPP
