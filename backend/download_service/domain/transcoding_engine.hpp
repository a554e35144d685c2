#pragma once
#include "domain/errors.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace download_service {

// A running engine process. Input pipes are numbered from 0 and appear to
// the child as fds 3, 4, ...; the output pipe is the child's stdout.
class EngineProcess {
public:
  virtual ~EngineProcess() = default;

  virtual pid_t pid() const = 0;
  virtual int inputFd(std::size_t index) const = 0;
  virtual int outputFd() const = 0;

  // Half-close one input: the engine sees end of stream on it.
  virtual void closeInput(std::size_t index) = 0;

  // SIGTERM, then SIGKILL once the grace period elapses. Safe to call from
  // any thread and more than once.
  virtual void terminate() = 0;

  // Reaps the child. Returns the exit code, or nullopt when it died by signal.
  virtual std::optional<int> wait() = 0;
};

class TranscodingEngine {
public:
  virtual ~TranscodingEngine() = default;
  virtual Result<std::unique_ptr<EngineProcess>> spawn(
    const std::vector<std::string>& args,
    std::size_t input_count) = 0;
};

} // namespace download_service
