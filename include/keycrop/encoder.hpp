/**
 * @file encoder.hpp
 * @brief External encoder interface and the FFmpeg subprocess implementation
 *
 * @details The encoder is the one blocking, long-running step of an export.
 *          Implementations report progress through a ProgressSink (from the
 *          encoding thread) and observe a cancel flag.
 *
 * @attention FfmpegEncoder PROCESS HANDLING:
 *
 *   - fork/exec of Config::ffmpeg_path() with stdout/stderr on pipes
 *
 *   - stdout carries "-progress" key=value lines, stderr is kept as a
 *     bounded tail for failure reports
 *
 *   - on cancel: SIGTERM, then SIGKILL after Config::cancel_grace_ms()
 *
 *   - the child is always reaped before encode() returns
 */

#ifndef KEYCROP_ENCODER_HPP
#define KEYCROP_ENCODER_HPP

#include <atomic>
#include <functional>
#include <string>

#include "error.hpp"
#include "filter_graph.hpp"
#include "types.hpp"

namespace keycrop {

/// Receives progress fractions in [0,1]; may be called on any thread
using ProgressSink = std::function<void(double)>;

/**
 * @struct EncodeRequest
 * @brief Everything the encoder needs for one output file.
 */
struct EncodeRequest {
  int job_id = -1; //< For log prefixing
  FilterGraphSpec graph;
  SourceVideoProperties source;
  std::string input_path;
  std::string output_path;
};

/**
 * @struct EncodeResult
 * @brief Terminal status of an encoder run.
 */
struct EncodeResult {
  ErrorCode error = ErrorCode::Ok;
  int exit_code = 0;          //< Process exit status (-signal if killed)
  std::string stderr_excerpt; //< Bounded tail of diagnostic output
};

/**
 * @class Encoder
 * @brief Abstract external encoder.
 */
class Encoder {
public:
  virtual ~Encoder() = default;

  /**
   * @brief Run one encode to completion, failure or cancellation.
   * @param request Graph and file paths
   * @param progress Progress sink (may be empty)
   * @param cancel Set by another thread to request termination
   */
  virtual EncodeResult encode(const EncodeRequest &request,
                              const ProgressSink &progress,
                              const std::atomic<bool> &cancel) = 0;
};

/**
 * @class FfmpegEncoder
 * @brief Runs the FFmpeg binary as a child process.
 */
class FfmpegEncoder : public Encoder {
  std::string program_;
  int excerpt_bytes_;
  int grace_ms_;

public:
  /// Binary, excerpt size and grace period from the Config namespace
  FfmpegEncoder();
  FfmpegEncoder(std::string program, int excerpt_bytes, int grace_ms);

  EncodeResult encode(const EncodeRequest &request,
                      const ProgressSink &progress,
                      const std::atomic<bool> &cancel) override;
};

/**
 * @class ProgressTracker
 * @brief Turns encoder positions into a monotonic fraction.
 * @note Fractions are capped at 0.99 until finish() reports completion.
 */
class ProgressTracker {
  double duration_;
  double last_ = 0.0;

public:
  explicit ProgressTracker(double duration) : duration_(duration) {}

  /// Fraction for a position, never below the previous one
  double update(double seconds);

  double finish() { return last_ = 1.0; }
  double last() const { return last_; }
};

/// Keep the last max_bytes of text
std::string tail_excerpt(const std::string &text, size_t max_bytes);

} // namespace keycrop

#endif // KEYCROP_ENCODER_HPP
