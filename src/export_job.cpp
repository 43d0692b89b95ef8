/**
 * @file export_job.cpp
 * @brief Export job state machine implementation
 *
 * @details Runs one export through the states documented in
 *          export_job.hpp:
 *
 *          1. Validate (synchronous, before queueing)
 *
 *          2. Rasterize masks with a worker pool
 *
 *          3. Build the filter graph
 *
 *          4. Encode
 *
 * @note All log messages are prefixed with [Job N].
 */

#include "keycrop/export_job.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include <fmt/core.h>

#include "keycrop/config.hpp"
#include "keycrop/logging.hpp"
#include "keycrop/mask_codec.hpp"
#include "keycrop/mask_rasterizer.hpp"
#include "keycrop/system.hpp"
#include "keycrop/task_queue.hpp"

namespace keycrop {

namespace fs = std::filesystem;

const char *job_state_name(JobState state) {
  switch (state) {
  case JobState::Idle:
    return "Idle";
  case JobState::Validating:
    return "Validating";
  case JobState::MaskPreparation:
    return "MaskPreparation";
  case JobState::GraphBuilding:
    return "GraphBuilding";
  case JobState::Encoding:
    return "Encoding";
  case JobState::Completed:
    return "Completed";
  case JobState::Failed:
    return "Failed";
  case JobState::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

JobOptions JobOptions::from_config() {
  JobOptions o;
  o.graph = GraphOptions::from_config();
  o.temp_root = Config::mask_temp_dir();
  o.keep_assets = Config::keep_mask_files();
  o.antialias = Config::mask_antialias();
  o.mask_workers = calculate_mask_workers();
  return o;
}

// **---- Constructor ----**

ExportJob::ExportJob(int id, ExportRequest request, Encoder &encoder,
                     JobOptions options)
    : id_(id), request_(std::move(request)), encoder_(encoder),
      options_(std::move(options)) {}

void ExportJob::set_state(JobState state) {
  state_.store(state);
  JOB_LOG_PHASE(id_, "-> {}", job_state_name(state));
}

void ExportJob::report_progress(double fraction) {
  fraction = std::min(1.0, std::max(0.0, fraction));
  double previous = progress_.load();
  if (fraction <= previous)
    return;
  progress_.store(fraction);
  if (progress_sink_)
    progress_sink_(id_, fraction);
}

// **---- Validation ----**

ErrorCode ExportJob::validate(MediaProber &prober) {
  set_state(JobState::Validating);

  auto fail = [this](ErrorCode err) {
    validation_error_ = err;
    state_.store(JobState::Failed);
    JOB_LOG_ERROR(id_, "Validation failed: {}", error_name(err));
    return err;
  };

  if (request_.input_path.empty() || request_.output_path.empty()) {
    JOB_LOG_ERROR(id_, "Input and output paths are required");
    return fail(ErrorCode::InvalidInput);
  }
  std::error_code ec;
  if (request_.input_path == request_.output_path ||
      fs::equivalent(request_.input_path, request_.output_path, ec)) {
    JOB_LOG_ERROR(id_, "Output would overwrite the source: {}",
                  request_.output_path);
    return fail(ErrorCode::InvalidInput);
  }

  TIMER_START(probe);
  ErrorCode err = prober.probe(request_.input_path, source_);
  TIMER_END(probe);
  if (!ok(err))
    return fail(ErrorCode::InvalidInput);

  int width = even_floor(source_.width);
  int height = even_floor(source_.height);
  if (width == 0 || height == 0)
    return fail(ErrorCode::OddDimension);

  const CropTimeline &tl = request_.timeline;
  if (tl.empty())
    JOB_LOG_WARN(id_, "No keyframes: exporting the full frame");

  if (tl.mode() == CropMode::AI) {
    for (const auto &kf : tl.keyframes()) {
      const auto &ai = std::get<AICrop>(kf.geometry);
      if (ai.mask &&
          (ai.mask->pixel_width != width || ai.mask->pixel_height != height)) {
        JOB_LOG_ERROR(id_, "AI mask at {:.3f}s is {}x{}, export frame is {}x{}",
                      kf.timestamp, ai.mask->pixel_width,
                      ai.mask->pixel_height, width, height);
        return fail(ErrorCode::MaskResolutionMismatch);
      }
    }
  }

  err = summarize_timeline(tl, source_, summary_);
  if (!ok(err))
    return fail(err);

  /// Dry run of the builder so size and codec errors surface before queueing;
  /// the real asset paths only exist once the job runs
  MaskAssets placeholder;
  placeholder.static_mask_path = "mask.pgm";
  placeholder.sequence_pattern = "mask_%06d.pgm";
  placeholder.crop_commands_path = "crop.cmd";
  FilterGraphSpec dry_run;
  err = build_filter_graph(source_, request_.settings, summary_, &placeholder,
                           options_.graph, dry_run);
  if (!ok(err))
    return fail(err);

  JOB_LOG_INFO(id_, "{}: {}x{} @ {:.3f}fps, {} crop ({}), encoder {}",
               fs::path(request_.input_path).filename().string(),
               source_.width, source_.height, source_.frame_rate,
               mode_name(tl.mode()),
               summary_.passthrough ? "none"
                                    : (summary_.is_static ? "static"
                                                          : "keyframed"),
               dry_run.stream_copy ? "copy" : dry_run.encoder.encoder);
  return ErrorCode::Ok;
}

// **---- Mask Preparation ----**

ErrorCode ExportJob::prepare_masks(TempAssetDir &dir) {
  int width = even_floor(source_.width);
  int height = even_floor(source_.height);

  if (!dir.created()) {
    ErrorCode err =
        dir.create(options_.temp_root, fmt::format("keycrop-job{}", id_));
    if (!ok(err))
      return err;
  }

  if (!summary_.is_static)
    return write_mask_sequence(dir, width, height);

  RenderedMask mask;
  RasterOptions raster;
  raster.antialias = options_.antialias;
  ErrorCode err = rasterize(summary_.representative, width, height, mask,
                            raster);
  if (!ok(err))
    return err;

  std::string path = dir.file("mask.pgm");
  err = write_pgm(mask, path);
  if (!ok(err))
    return err;
  assets_.static_mask_path = path;
  JOB_LOG_INFO(id_, "Static mask {}x{} ({} opaque px)", width, height,
               mask.opaque_count());
  return ErrorCode::Ok;
}

ErrorCode ExportJob::write_mask_sequence(TempAssetDir &dir, int width,
                                         int height) {
  int frames = static_cast<int>(summary_.samples.size());
  int num_workers = std::max(1, std::min(options_.mask_workers, frames));

  JOB_LOG_INFO(id_, "Rasterizing {} masks ({} workers)", frames, num_workers);

  WorkQueue<MaskTask> task_queue;
  ErrorCollector errors;
  for (int i = 0; i < frames; ++i)
    task_queue.push({i});
  task_queue.finish();

  RasterOptions raster;
  raster.antialias = options_.antialias;

  std::vector<std::thread> workers;
  for (int w = 0; w < num_workers; ++w) {
    workers.emplace_back([this, &task_queue, &errors, &dir, raster, width,
                          height]() {
      RenderedMask mask;
      MaskTask task;
      while (task_queue.pop(task)) {
        if (cancel_.load()) {
          errors.report(ErrorCode::Cancelled, task.frame_index);
          task_queue.cancel();
          break;
        }
        ErrorCode err = rasterize(summary_.samples[task.frame_index], width,
                                  height, mask, raster);
        if (ok(err))
          err = write_pgm(mask, dir.file(fmt::format("mask_{:06d}.pgm",
                                                     task.frame_index)));
        if (!ok(err)) {
          errors.report(err, task.frame_index);
          task_queue.cancel();
          break;
        }
      }
    });
  }

  for (auto &w : workers)
    w.join();

  if (errors.failed()) {
    if (errors.first() != ErrorCode::Cancelled)
      JOB_LOG_ERROR(id_, "Mask for frame {} failed: {}", errors.frame(),
                    error_name(errors.first()));
    return errors.first();
  }

  assets_.sequence_pattern = dir.file("mask_%06d.pgm");
  return ErrorCode::Ok;
}

ErrorCode ExportJob::prepare_crop_commands(TempAssetDir &dir, int width,
                                           int height) {
  if (!dir.created()) {
    ErrorCode err =
        dir.create(options_.temp_root, fmt::format("keycrop-job{}", id_));
    if (!ok(err))
      return err;
  }

  std::string path = dir.file("crop.cmd");
  std::ofstream out(path, std::ios::trunc);
  out << crop_command_script(summary_, width, height);
  out.flush();
  if (!out) {
    JOB_LOG_ERROR(id_, "Cannot write crop commands: {}", path);
    return ErrorCode::IoError;
  }
  assets_.crop_commands_path = path;
  return ErrorCode::Ok;
}

// **---- Main Processing ----**

void ExportJob::finish(JobResult &result, JobState state, ErrorCode error) {
  result.state = state;
  result.error = error;

  if (state != JobState::Completed && output_started_) {
    std::error_code ec;
    if (fs::remove(request_.output_path, ec))
      JOB_LOG_INFO(id_, "Removed partial output {}", request_.output_path);
    else if (ec)
      JOB_LOG_WARN(id_, "Could not remove partial output {}: {}",
                   request_.output_path, ec.message());
  }

  state_.store(state);
  if (state == JobState::Completed)
    LOG_SUCCESS("[Job {}] Completed: {}", id_, request_.output_path);
  else if (state == JobState::Cancelled)
    JOB_LOG_WARN(id_, "Cancelled");
  else
    JOB_LOG_ERROR(id_, "Failed: {}", error_name(error));
}

JobResult ExportJob::run() {
  auto start_time = std::chrono::steady_clock::now();

  JobResult result;
  result.job_id = id_;
  result.input_path = request_.input_path;
  result.output_path = request_.output_path;

  auto elapsed_us = [&start_time]() {
    return static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time)
            .count());
  };

  /// Declared before any asset is written: removed on every return below
  TempAssetDir dir(options_.keep_assets);

  if (state_.load() != JobState::Validating) {
    ErrorCode err = validation_error_ != ErrorCode::Ok ? validation_error_
                                                       : ErrorCode::InvalidInput;
    finish(result, JobState::Failed, err);
    return result;
  }

  if (cancel_.load()) {
    finish(result, JobState::Cancelled, ErrorCode::Cancelled);
    return result;
  }

  int width = even_floor(source_.width);
  int height = even_floor(source_.height);

  // **----- MASK PREPARATION -----**

  if (needs_masks(summary_)) {
    set_state(JobState::MaskPreparation);
    TIMER_START(mask_preparation);
    ErrorCode err = prepare_masks(dir);
    TIMER_END(mask_preparation);
    if (err == ErrorCode::Cancelled || cancel_.load()) {
      finish(result, JobState::Cancelled, ErrorCode::Cancelled);
      result.processing_time_us = elapsed_us();
      return result;
    }
    if (!ok(err)) {
      finish(result, JobState::Failed, err);
      result.processing_time_us = elapsed_us();
      return result;
    }
  }

  if (cancel_.load()) {
    finish(result, JobState::Cancelled, ErrorCode::Cancelled);
    result.processing_time_us = elapsed_us();
    return result;
  }

  // **----- GRAPH BUILDING -----**

  set_state(JobState::GraphBuilding);
  FilterGraphSpec graph;
  {
    TIMER_START(graph_building);
    ErrorCode err = ErrorCode::Ok;
    bool keyframed_rect = summary_.mode == CropMode::Rectangle &&
                          !summary_.passthrough && !summary_.is_static &&
                          !request_.settings.preserve_full_frame;
    if (keyframed_rect)
      err = prepare_crop_commands(dir, width, height);
    if (ok(err))
      err = build_filter_graph(source_, request_.settings, summary_, &assets_,
                               options_.graph, graph);
    TIMER_END(graph_building);
    if (!ok(err)) {
      finish(result, JobState::Failed, err);
      result.processing_time_us = elapsed_us();
      return result;
    }
  }

  if (cancel_.load()) {
    finish(result, JobState::Cancelled, ErrorCode::Cancelled);
    result.processing_time_us = elapsed_us();
    return result;
  }

  // **----- ENCODING -----**

  set_state(JobState::Encoding);
  EncodeRequest encode;
  encode.job_id = id_;
  encode.graph = std::move(graph);
  encode.source = source_;
  encode.input_path = request_.input_path;
  encode.output_path = request_.output_path;

  output_started_ = true;
  TIMER_START(encoding);
  EncodeResult encoded = encoder_.encode(
      encode, [this](double fraction) { report_progress(fraction); },
      cancel_);
  TIMER_END(encoding);

  result.exit_code = encoded.exit_code;
  result.stderr_excerpt = encoded.stderr_excerpt;

  if (encoded.error == ErrorCode::Cancelled || cancel_.load()) {
    finish(result, JobState::Cancelled, ErrorCode::Cancelled);
  } else if (!ok(encoded.error)) {
    finish(result, JobState::Failed, encoded.error);
  } else {
    report_progress(1.0);
    finish(result, JobState::Completed, ErrorCode::Ok);
  }

  result.processing_time_us = elapsed_us();
  return result;
}

} // namespace keycrop
