/**
 * @file main.cpp
 * @brief Entry point for the keycrop export tool
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Single file mode: one crop document, one input, one output
 *
 *          - Batch directory mode: every video with a `<name>.crop.json`
 *            sidecar is exported through the ExportOrchestrator
 *
 * @note Set MAX_PARALLEL_JOBS to control how many exports run at once.
 *       In single file mode an optional tracking file replaces the document's
 *       AI keyframes with the tracker's per-frame results.
 */

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include "keycrop/ai_tracking.hpp"
#include "keycrop/encoder.hpp"
#include "keycrop/export_orchestrator.hpp"
#include "keycrop/logging.hpp"
#include "keycrop/media_probe.hpp"
#include "keycrop/persistence.hpp"

using namespace keycrop;
namespace fs = std::filesystem;

namespace {

bool is_video_file(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".mp4" || ext == ".mkv" || ext == ".mov" || ext == ".m4v" ||
         ext == ".webm" || ext == ".avi" || ext == ".ts";
}

/// Swap the document's timeline for tracking results at the source size
ErrorCode apply_tracking(const std::string &tracking_path,
                         const std::string &input, MediaProber &prober,
                         CropDocument &doc) {
  std::vector<TrackedFrame> frames;
  ErrorCode err = load_tracking_file(tracking_path, frames);
  if (!ok(err))
    return err;

  SourceVideoProperties props;
  err = prober.probe(input, props);
  if (!ok(err))
    return err;

  err = timeline_from_tracking(frames, even_floor(props.width),
                               even_floor(props.height), doc.timeline);
  if (ok(err))
    LOG_INFO("Loaded {} tracked frames from {}", frames.size(),
             tracking_path);
  return err;
}

void log_progress(int job_id, double fraction) {
  /// One line per 10% step per job
  static std::mutex progress_mutex;
  static std::map<int, int> last_step;
  int step = static_cast<int>(fraction * 10.0);
  {
    std::lock_guard<std::mutex> lock(progress_mutex);
    int &last = last_step[job_id];
    if (step <= last && fraction < 1.0)
      return;
    last = step;
  }
  JOB_LOG_INFO(job_id, "Progress {:>3.0f}%", fraction * 100.0);
}

void log_completion(const JobResult &result) {
  double sec = result.processing_time_us / 1000000.0;
  switch (result.state) {
  case JobState::Completed:
    LOG_SUCCESS("[Job {}] Completed in {:.2f}s -> {}", result.job_id, sec,
                result.output_path);
    break;
  case JobState::Cancelled:
    JOB_LOG_WARN(result.job_id, "Cancelled after {:.2f}s", sec);
    break;
  default:
    JOB_LOG_ERROR(result.job_id, "Failed: {} (exit code {})",
                  error_name(result.error), result.exit_code);
    break;
  }
}

/// Number of jobs that did not complete
int count_unsuccessful(const std::vector<JobResult> &results) {
  return static_cast<int>(
      std::count_if(results.begin(), results.end(), [](const JobResult &r) {
        return r.state != JobState::Completed;
      }));
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 3) {
    LOG_WARN("Usage: ./keycrop_export <crop.json> <input> <output> "
             "[tracking.json]");
    LOG_WARN("       ./keycrop_export <input_dir> <output_dir>");
    return 1;
  }

  FfmpegProbe prober;
  FfmpegEncoder encoder;

  std::string first_arg = argv[1];
  std::error_code ec;

  if (fs::is_directory(first_arg, ec)) {
    // **---- BATCH MODE - one job per video with a sidecar ----**

    std::string output_dir = argv[2];
    fs::create_directories(output_dir, ec);
    if (ec) {
      LOG_ERROR("Cannot create output directory {}: {}", output_dir,
                ec.message());
      return 1;
    }

    LOG_INFO("keycrop - Batch Mode");
    LOG_INFO("Input directory: {}", first_arg);
    LOG_INFO("Output directory: {}", output_dir);

    /// Collect videos that have a crop document next to them
    std::vector<fs::path> videos;
    for (const auto &entry : fs::directory_iterator(first_arg, ec)) {
      if (!entry.is_regular_file() || !is_video_file(entry.path()))
        continue;
      fs::path sidecar = entry.path();
      sidecar.replace_extension(".crop.json");
      if (fs::exists(sidecar))
        videos.push_back(entry.path());
      else
        LOG_WARN("Skipping {} (no {})", entry.path().filename().string(),
                 sidecar.filename().string());
    }
    if (ec) {
      LOG_ERROR("Cannot list {}: {}", first_arg, ec.message());
      return 1;
    }
    std::sort(videos.begin(), videos.end());

    if (videos.empty()) {
      LOG_WARN("No video files with crop documents found in directory");
      return 0;
    }
    LOG_INFO("Found {} videos to export", videos.size());

    auto wall_start = std::chrono::high_resolution_clock::now();
    int rejected = 0;
    {
      ExportOrchestrator orchestrator(prober, encoder);
      orchestrator.set_progress_callback(log_progress);
      orchestrator.set_completion_callback(log_completion);

      for (const auto &video : videos) {
        fs::path sidecar = video;
        sidecar.replace_extension(".crop.json");

        CropDocument doc;
        ErrorCode err = load_document(sidecar.string(), doc);
        if (!ok(err)) {
          LOG_ERROR("{}: {}", sidecar.filename().string(), error_name(err));
          rejected++;
          continue;
        }

        ExportRequest request;
        request.input_path = video.string();
        request.output_path = (fs::path(output_dir) / video.filename()).string();
        request.timeline = std::move(doc.timeline);
        request.settings = doc.settings;

        int job_id = 0;
        err = orchestrator.submit(std::move(request), job_id);
        if (!ok(err)) {
          JOB_LOG_ERROR(job_id, "Rejected {}: {}", video.filename().string(),
                        error_name(err));
          rejected++;
        }
      }

      orchestrator.wait_all();

      auto wall_end = std::chrono::high_resolution_clock::now();
      double wall_sec =
          std::chrono::duration<double>(wall_end - wall_start).count();
      TimingCollector::print_summary();
      orchestrator.print_batch_summary(wall_sec);

      int unsuccessful = count_unsuccessful(orchestrator.results());
      if (rejected > 0)
        LOG_WARN("{} videos rejected before queueing", rejected);
      return unsuccessful + rejected;
    }

  } else {

    // **---- SINGLE FILE MODE ----**

    if (argc < 4) {
      LOG_ERROR("Single file mode needs <crop.json> <input> <output>");
      return 1;
    }
    std::string input = argv[2];
    std::string output = argv[3];

    LOG_INFO("keycrop - Single File Mode");
    LOG_INFO("Crop document: {}", first_arg);
    LOG_INFO("Input: {}", input);
    LOG_INFO("Output: {}", output);

    CropDocument doc;
    ErrorCode err = load_document(first_arg, doc);
    if (!ok(err)) {
      LOG_ERROR("Cannot load crop document: {}", error_name(err));
      return 1;
    }

    if (argc > 4) {
      err = apply_tracking(argv[4], input, prober, doc);
      if (!ok(err)) {
        LOG_ERROR("Cannot apply tracking results: {}", error_name(err));
        return 1;
      }
    }

    ExportOrchestrator orchestrator(prober, encoder, 1,
                                    JobOptions::from_config());
    orchestrator.set_progress_callback(log_progress);
    orchestrator.set_completion_callback(log_completion);

    ExportRequest request;
    request.input_path = input;
    request.output_path = output;
    request.timeline = std::move(doc.timeline);
    request.settings = doc.settings;

    int job_id = 0;
    err = orchestrator.submit(std::move(request), job_id);
    if (!ok(err)) {
      JOB_LOG_ERROR(job_id, "Rejected: {}", error_name(err));
      return 1;
    }

    orchestrator.wait_all();
    TimingCollector::print_summary();
    return count_unsuccessful(orchestrator.results());
  }
}
