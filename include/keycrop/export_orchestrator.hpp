/**
 * @file export_orchestrator.hpp
 * @brief FIFO export queue with bounded job parallelism
 *
 * @details The ExportOrchestrator accepts export requests and runs them:
 *
 *          - submit() validates synchronously (probe, timeline summary,
 *            a dry run of the filter-graph builder) and rejects bad jobs
 *            before they are queued
 *
 *          - Accepted jobs run FIFO on MAX_PARALLEL_JOBS worker threads,
 *            each job with its own mask workers and encoder process
 *
 *          - Terminal results arrive through the completion callback (on a
 *            worker thread) and are kept for results()
 *
 * @note One job's failure never affects its siblings: jobs share no mutable
 *       state beyond the queue and the result list.
 */

#ifndef KEYCROP_EXPORT_ORCHESTRATOR_HPP
#define KEYCROP_EXPORT_ORCHESTRATOR_HPP

#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "encoder.hpp"
#include "error.hpp"
#include "export_job.hpp"
#include "task_queue.hpp"
#include "media_probe.hpp"

namespace keycrop {

using CompletionCallback = std::function<void(const JobResult &)>;

/**
 * @class ExportOrchestrator
 * @brief Queues and runs export jobs.
 *
 * @attention LIFECYCLE:
 *
 *   - Callbacks must be set before the first submit()
 *
 *   - wait_all() blocks until every accepted job is terminal
 *
 *   - The destructor cancels outstanding jobs and joins the workers
 */
class ExportOrchestrator {
public:
  /**
   * @param prober Source inspector (borrowed, must outlive this object)
   * @param encoder Encoder (borrowed, shared by all jobs, must be
   *        thread-safe)
   * @param max_jobs Concurrent jobs (0 = calculate_parallel_jobs())
   * @param options Per-job options
   */
  ExportOrchestrator(MediaProber &prober, Encoder &encoder, int max_jobs,
                     JobOptions options);
  ExportOrchestrator(MediaProber &prober, Encoder &encoder);
  ~ExportOrchestrator();

  ExportOrchestrator(const ExportOrchestrator &) = delete;
  ExportOrchestrator &operator=(const ExportOrchestrator &) = delete;

  void set_completion_callback(CompletionCallback cb) {
    on_complete_ = std::move(cb);
  }
  void set_progress_callback(JobProgressSink cb) {
    on_progress_ = std::move(cb);
  }

  /**
   * @brief Validate and enqueue one export.
   * @param request What to export
   * @param job_id Output: id of the job (assigned even when rejected)
   * @return Ok when queued, otherwise the validation error
   */
  ErrorCode submit(ExportRequest request, int &job_id);

  /**
   * @brief Cancel a queued or running job.
   * @return false when the job is unknown or already terminal
   */
  bool cancel(int job_id);

  /// Cancel every outstanding job
  void cancel_all();

  /// Block until every accepted job has reached a terminal state
  void wait_all();

  /// Terminal results in completion order
  std::vector<JobResult> results() const;

  /// State of an outstanding job; Idle when unknown or finished
  JobState state(int job_id) const;

  int max_jobs() const { return max_jobs_; }

  /**
   * @brief Print final batch summary.
   * @param wall_clock_sec Actual elapsed wall-clock time in seconds
   */
  void print_batch_summary(double wall_clock_sec) const;

private:
  MediaProber &prober_;
  Encoder &encoder_;
  JobOptions options_;
  int max_jobs_;

  WorkQueue<std::shared_ptr<ExportJob>> queue_;
  std::vector<std::thread> workers_;

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::map<int, std::shared_ptr<ExportJob>> outstanding_;
  std::vector<JobResult> results_;
  int next_id_ = 1;

  CompletionCallback on_complete_;
  JobProgressSink on_progress_;

  /// Worker loop: pop and run jobs until the queue is finished
  void job_worker(int worker_id);

  void start_workers();
};

} // namespace keycrop

#endif // KEYCROP_EXPORT_ORCHESTRATOR_HPP
