/**
 * @file export_orchestrator.cpp
 * @brief Export queue implementation
 *
 * @details Implements the ExportOrchestrator:
 *
 *          - Synchronous validation in submit()
 *
 *          - FIFO queue drained by a fixed pool of job workers
 *
 *          - Job-prefixed logging
 *
 *          - Sequential summary output
 */

#include "keycrop/export_orchestrator.hpp"

#include <algorithm>
#include <filesystem>

#include <fmt/color.h>
#include <fmt/core.h>

#include "keycrop/logging.hpp"
#include "keycrop/system.hpp"

namespace keycrop {

namespace fs = std::filesystem;

ExportOrchestrator::ExportOrchestrator(MediaProber &prober, Encoder &encoder,
                                       int max_jobs, JobOptions options)
    : prober_(prober), encoder_(encoder), options_(std::move(options)),
      max_jobs_(max_jobs > 0 ? max_jobs : calculate_parallel_jobs()) {
  start_workers();
}

ExportOrchestrator::ExportOrchestrator(MediaProber &prober, Encoder &encoder)
    : ExportOrchestrator(prober, encoder, 0, JobOptions::from_config()) {}

ExportOrchestrator::~ExportOrchestrator() {
  cancel_all();
  queue_.finish();
  for (auto &w : workers_)
    w.join();
}

void ExportOrchestrator::start_workers() {
  LOG_INFO("Export workers: {}", max_jobs_);
  for (int i = 0; i < max_jobs_; ++i)
    workers_.emplace_back(&ExportOrchestrator::job_worker, this, i);
}

ErrorCode ExportOrchestrator::submit(ExportRequest request, int &job_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    job_id = next_id_++;
  }

  auto job = std::make_shared<ExportJob>(job_id, std::move(request), encoder_,
                                         options_);
  if (on_progress_)
    job->set_progress_sink(on_progress_);

  ErrorCode err = job->validate(prober_);
  if (!ok(err))
    return err;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    outstanding_[job_id] = job;
  }
  JOB_LOG_INFO(job_id, "Queued: {}",
               fs::path(job->request().input_path).filename().string());
  queue_.push(std::move(job));
  return ErrorCode::Ok;
}

bool ExportOrchestrator::cancel(int job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = outstanding_.find(job_id);
  if (it == outstanding_.end())
    return false;
  JOB_LOG_WARN(job_id, "Cancel requested ({})",
               job_state_name(it->second->state()));
  it->second->cancel();
  return true;
}

void ExportOrchestrator::cancel_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &entry : outstanding_)
    entry.second->cancel();
}

void ExportOrchestrator::wait_all() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return outstanding_.empty(); });
}

std::vector<JobResult> ExportOrchestrator::results() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return results_;
}

JobState ExportOrchestrator::state(int job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = outstanding_.find(job_id);
  return it == outstanding_.end() ? JobState::Idle : it->second->state();
}

void ExportOrchestrator::job_worker(int worker_id) {
  std::shared_ptr<ExportJob> job;
  int jobs_run = 0;
  while (queue_.pop(job)) {
    JOB_LOG_INFO(job->id(), "Started on worker {}", worker_id);

    JobResult result = job->run();
    ++jobs_run;

    /// Callback first: wait_all() returning implies every callback ran
    if (on_complete_)
      on_complete_(result);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      results_.push_back(result);
      outstanding_.erase(job->id());
    }
    idle_cv_.notify_all();
    job.reset();
  }
  LOG_INFO("[Worker {}] Finished ({} jobs)", worker_id, jobs_run);
}

void ExportOrchestrator::print_batch_summary(double wall_clock_sec) const {
  std::vector<JobResult> results = this->results();

  int total = static_cast<int>(results.size());
  int completed = 0;
  int failed = 0;
  int cancelled = 0;
  long total_time_us = 0;

  for (const auto &result : results) {
    if (result.state == JobState::Completed)
      completed++;
    else if (result.state == JobState::Cancelled)
      cancelled++;
    else
      failed++;
    total_time_us += result.processing_time_us;
  }

  double sum_time_sec = total_time_us / 1000000.0;
  double speedup = (wall_clock_sec > 0) ? sum_time_sec / wall_clock_sec : 1.0;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================ EXPORT BATCH SUMMARY ================\n");
  fmt::print("{:<25} {:>25}\n", "Total jobs:", total);
  fmt::print("{:<25} {:>25}\n", "Completed:", completed);
  fmt::print("{:<25} {:>25}\n", "Failed:", failed);
  fmt::print("{:<25} {:>25}\n", "Cancelled:", cancelled);
  fmt::print("{:<25} {:>25}\n", "Parallel jobs:", max_jobs_);
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  fmt::print("{:<25} {:>22.1f}s\n", "Sum of job times:", sum_time_sec);
  fmt::print("{:<25} {:>22.2f}x\n", "Speedup:", speedup);
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");

  if (failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed jobs:\n");
    for (const auto &result : results) {
      if (result.state != JobState::Failed)
        continue;
      fmt::print(fg(fmt::color::red), "  - [Job {}] {}: {}\n", result.job_id,
                 fs::path(result.input_path).filename().string(),
                 error_name(result.error));
      if (!result.stderr_excerpt.empty())
        fmt::print("      {}\n", result.stderr_excerpt);
    }
  }
  std::fflush(stdout);
}

} // namespace keycrop
