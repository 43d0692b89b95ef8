/**
 * @file encoder.cpp
 * @brief FFmpeg child process: spawn, stream progress, cancel, reap
 */

#include "keycrop/encoder.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "keycrop/config.hpp"
#include "keycrop/ffmpeg_command.hpp"
#include "keycrop/logging.hpp"

namespace keycrop {

namespace {

/// Upper bound on buffered stderr before the excerpt is taken
constexpr size_t STDERR_BUFFER_LIMIT = 64 * 1024;

/// poll() timeout; also the cancel-flag polling interval
constexpr int POLL_INTERVAL_MS = 100;

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

} // anonymous namespace

double ProgressTracker::update(double seconds) {
  if (duration_ <= 0.0)
    return last_;
  double fraction = std::min(0.99, std::max(0.0, seconds / duration_));
  last_ = std::max(last_, fraction);
  return last_;
}

std::string tail_excerpt(const std::string &text, size_t max_bytes) {
  if (text.size() <= max_bytes)
    return text;
  return text.substr(text.size() - max_bytes);
}

FfmpegEncoder::FfmpegEncoder()
    : program_(Config::ffmpeg_path()),
      excerpt_bytes_(Config::stderr_excerpt_bytes()),
      grace_ms_(Config::cancel_grace_ms()) {}

FfmpegEncoder::FfmpegEncoder(std::string program, int excerpt_bytes,
                             int grace_ms)
    : program_(std::move(program)), excerpt_bytes_(excerpt_bytes),
      grace_ms_(grace_ms) {}

EncodeResult FfmpegEncoder::encode(const EncodeRequest &request,
                                   const ProgressSink &progress,
                                   const std::atomic<bool> &cancel) {
  EncodeResult result;
  int job = request.job_id;

  std::vector<std::string> args = to_ffmpeg_args(
      request.graph, request.source, request.input_path, request.output_path);
  JOB_LOG_INFO(job, "FFmpeg: {}", format_command_line(program_, args));

  /// argv is assembled before fork(): the child only calls async-safe code
  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(program_.c_str()));
  for (auto &a : args)
    argv.push_back(const_cast<char *>(a.c_str()));
  argv.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) == -1 || pipe2(err_pipe, O_CLOEXEC) == -1) {
    JOB_LOG_ERROR(job, "Failed to create pipes: {}", std::strerror(errno));
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    result.error = ErrorCode::IoError;
    return result;
  }

  pid_t pid = fork();
  if (pid == -1) {
    JOB_LOG_ERROR(job, "fork failed: {}", std::strerror(errno));
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    result.error = ErrorCode::EncoderProcessFailure;
    result.exit_code = -1;
    return result;
  }

  if (pid == 0) {
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(argv[0], argv.data());
    static const char msg[] = "keycrop: exec of encoder failed\n";
    ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    _exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  int out_fd = out_pipe[0];
  int err_fd = err_pipe[0];

  ProgressTracker tracker(request.source.duration);
  std::string line_buffer;
  std::string stderr_text;
  char buf[4096];

  bool term_sent = false;
  bool kill_sent = false;
  auto term_time = std::chrono::steady_clock::now();

  while (out_fd >= 0 || err_fd >= 0) {
    if (cancel.load() && !term_sent) {
      JOB_LOG_WARN(job, "Cancelling encoder (pid {})", pid);
      kill(pid, SIGTERM);
      term_sent = true;
      term_time = std::chrono::steady_clock::now();
    }
    if (term_sent && !kill_sent &&
        std::chrono::steady_clock::now() - term_time >
            std::chrono::milliseconds(grace_ms_)) {
      JOB_LOG_WARN(job, "Encoder ignored SIGTERM, sending SIGKILL");
      kill(pid, SIGKILL);
      kill_sent = true;
    }

    struct pollfd fds[2];
    nfds_t n = 0;
    if (out_fd >= 0)
      fds[n++] = {out_fd, POLLIN, 0};
    if (err_fd >= 0)
      fds[n++] = {err_fd, POLLIN, 0};

    int ready = poll(fds, n, POLL_INTERVAL_MS);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      JOB_LOG_ERROR(job, "poll failed: {}", std::strerror(errno));
      kill(pid, SIGKILL);
      kill_sent = true;
      break;
    }
    if (ready == 0)
      continue;

    for (nfds_t i = 0; i < n; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      ssize_t got = read(fds[i].fd, buf, sizeof(buf));
      if (got < 0 && errno == EINTR)
        continue;

      bool is_out = fds[i].fd == out_fd;
      if (got <= 0) {
        close_fd(is_out ? out_fd : err_fd);
        continue;
      }

      if (is_out) {
        line_buffer.append(buf, static_cast<size_t>(got));
        size_t pos;
        while ((pos = line_buffer.find('\n')) != std::string::npos) {
          std::string line = line_buffer.substr(0, pos);
          line_buffer.erase(0, pos + 1);
          if (!line.empty() && line.back() == '\r')
            line.pop_back();
          double seconds = 0.0;
          if (parse_progress_line(line, seconds) && progress)
            progress(tracker.update(seconds));
        }
      } else {
        stderr_text.append(buf, static_cast<size_t>(got));
        if (stderr_text.size() > STDERR_BUFFER_LIMIT)
          stderr_text = tail_excerpt(stderr_text, STDERR_BUFFER_LIMIT / 2);
      }
    }
  }
  close_fd(out_fd);
  close_fd(err_fd);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      JOB_LOG_ERROR(job, "waitpid failed: {}", std::strerror(errno));
      break;
    }
  }

  if (WIFEXITED(status))
    result.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    result.exit_code = -WTERMSIG(status);

  if (term_sent) {
    result.error = ErrorCode::Cancelled;
    return result;
  }

  if (result.exit_code != 0) {
    result.error = ErrorCode::EncoderProcessFailure;
    result.stderr_excerpt =
        tail_excerpt(stderr_text, static_cast<size_t>(excerpt_bytes_));
    JOB_LOG_ERROR(job, "FFmpeg exited with {}: {}", result.exit_code,
                  result.stderr_excerpt);
    return result;
  }

  if (progress)
    progress(tracker.finish());
  JOB_LOG_INFO(job, "Encoded {}",
               std::filesystem::path(request.output_path).filename().string());
  return result;
}

} // namespace keycrop
