#pragma once
#include "domain/errors.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace download_service {

// Child process with its stdout, stderr and `input_count` extra pipes wired
// to fds 3.. of the child. stdin is /dev/null. Every descriptor the parent
// keeps is close-on-exec so siblings never inherit each other's pipes.
class Subprocess {
public:
  static Result<std::unique_ptr<Subprocess>> spawn(
    const std::vector<std::string>& argv,
    std::size_t input_count,
    std::chrono::milliseconds kill_grace);

  ~Subprocess();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  pid_t pid() const { return pid_; }
  int inputFd(std::size_t index) const;
  int outputFd() const { return stdout_fd_; }
  int errorFd() const { return stderr_fd_; }

  void closeInput(std::size_t index);
  void terminate();
  std::optional<int> wait();
  bool reaped() const;

private:
  Subprocess(pid_t pid, std::vector<int> input_fds, int stdout_fd, int stderr_fd,
             std::chrono::milliseconds kill_grace);

  pid_t pid_;
  std::vector<int> input_fds_;
  int stdout_fd_;
  int stderr_fd_;
  std::chrono::milliseconds kill_grace_;

  mutable std::mutex mutex_;
  std::condition_variable reaped_cv_;
  bool reaped_{false};
  bool terminating_{false};
  std::optional<int> exit_code_;
  std::jthread killer_;
};

struct CapturedOutput {
  int exit_code{-1};
  std::string out;
  std::string err;
};

// Runs argv to completion and collects stdout/stderr. The child is killed
// when it outlives `timeout`.
Result<CapturedOutput> captureOutput(const std::vector<std::string>& argv,
                                     std::chrono::milliseconds timeout);

} // namespace download_service
