/**
 * @file export_job.hpp
 * @brief One video's export: the job state machine
 *
 * @details ExportJob drives a single export through:
 *
 *          1. Validating: probe the source, check the timeline, summarize
 *             the animated crop, dry-run the filter-graph builder
 *
 *          2. MaskPreparation (circle/freehand/AI only): rasterize one mask
 *             or a per-frame mask sequence into a scoped temp directory
 *
 *          3. GraphBuilding: build the filter graph (plus the crop command
 *             script for keyframed rectangles)
 *
 *          4. Encoding: hand the graph to the Encoder
 *
 *          and ends in Completed, Failed or Cancelled.
 *
 * @note Cancellation is cooperative: the flag is checked at every state
 *       transition and between mask frames, and handed to the encoder.
 *       Temporary assets are removed on every exit path; a partial output
 *       file is removed when the job does not complete.
 */

#ifndef KEYCROP_EXPORT_JOB_HPP
#define KEYCROP_EXPORT_JOB_HPP

#include <atomic>
#include <functional>
#include <string>
#include <utility>

#include "encoder.hpp"
#include "error.hpp"
#include "filter_graph.hpp"
#include "media_probe.hpp"
#include "temp_assets.hpp"
#include "timeline.hpp"
#include "types.hpp"

namespace keycrop {

enum class JobState {
  Idle,
  Validating,
  MaskPreparation,
  GraphBuilding,
  Encoding,
  Completed,
  Failed,
  Cancelled
};

const char *job_state_name(JobState state);

inline bool is_terminal(JobState state) {
  return state == JobState::Completed || state == JobState::Failed ||
         state == JobState::Cancelled;
}

/**
 * @struct ExportRequest
 * @brief What to export. The timeline is a snapshot owned by the job.
 */
struct ExportRequest {
  std::string input_path;
  std::string output_path;
  CropTimeline timeline;
  ExportSettings settings;
};

/**
 * @struct JobResult
 * @brief Terminal report of one job.
 */
struct JobResult {
  int job_id = -1;
  JobState state = JobState::Idle;
  ErrorCode error = ErrorCode::Ok;
  int exit_code = 0;          //< Encoder exit status, when it ran
  std::string stderr_excerpt; //< Bounded encoder diagnostics on failure
  std::string input_path;
  std::string output_path;
  long processing_time_us = 0;
};

/**
 * @struct JobOptions
 * @brief Per-job resources and environment.
 */
struct JobOptions {
  GraphOptions graph;
  std::string temp_root;   //< Empty = system temp directory
  bool keep_assets = false; //< Leave mask files behind for debugging
  bool antialias = false;
  int mask_workers = 1;

  /// Values from the Config namespace
  static JobOptions from_config();
};

/// Receives (job id, fraction); called from the job's worker thread
using JobProgressSink = std::function<void(int, double)>;

/**
 * @class ExportJob
 * @brief State machine for one export.
 */
class ExportJob {
  int id_;
  ExportRequest request_;
  Encoder &encoder_;
  JobOptions options_;

  SourceVideoProperties source_;
  TimelineSummary summary_;
  MaskAssets assets_;

  std::atomic<JobState> state_{JobState::Idle};
  std::atomic<bool> cancel_{false};
  std::atomic<double> progress_{0.0};
  JobProgressSink progress_sink_;

  void set_state(JobState state);

  /// Report a fraction, clamped to never go backwards
  void report_progress(double fraction);

  ErrorCode prepare_masks(TempAssetDir &dir);
  ErrorCode write_mask_sequence(TempAssetDir &dir, int width, int height);
  ErrorCode prepare_crop_commands(TempAssetDir &dir, int width, int height);

  /// Fill the terminal fields of result and publish the state
  void finish(JobResult &result, JobState state, ErrorCode error);

  ErrorCode validation_error_ = ErrorCode::Ok;
  bool output_started_ = false; //< Encoder may have written the output

public:
  ExportJob(int id, ExportRequest request, Encoder &encoder,
            JobOptions options);

  ExportJob(const ExportJob &) = delete;
  ExportJob &operator=(const ExportJob &) = delete;

  /**
   * @brief Idle -> Validating. Synchronous checks before queueing.
   * @return Ok, or the error that failed the job (state becomes Failed)
   */
  ErrorCode validate(MediaProber &prober);

  /**
   * @brief Run the remaining states to a terminal one.
   * @note Blocks for the whole encode. A job cancelled before run() ends
   *       as Cancelled without doing any work.
   */
  JobResult run();

  /// Request cancellation (any thread)
  void cancel() { cancel_.store(true); }
  bool cancel_requested() const { return cancel_.load(); }

  void set_progress_sink(JobProgressSink sink) {
    progress_sink_ = std::move(sink);
  }

  int id() const { return id_; }
  JobState state() const { return state_.load(); }
  double progress() const { return progress_.load(); }
  const ExportRequest &request() const { return request_; }
  const SourceVideoProperties &source() const { return source_; }
  const TimelineSummary &summary() const { return summary_; }
};

} // namespace keycrop

#endif // KEYCROP_EXPORT_JOB_HPP
