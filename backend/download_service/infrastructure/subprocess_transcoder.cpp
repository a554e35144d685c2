// subprocess_transcoder.cpp
#include "subprocess_transcoder.hpp"

#include <cerrno>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace download_service {

namespace {

class SubprocessEngineProcess : public EngineProcess {
public:
  explicit SubprocessEngineProcess(std::unique_ptr<Subprocess> proc)
    : proc_(std::move(proc)) {
    // Forward engine diagnostics line by line; the thread ends with stderr.
    stderr_drain_ = std::jthread([fd = proc_->errorFd(), pid = proc_->pid()] {
      std::string pending;
      char buf[4096];
      ssize_t n;
      while ((n = ::read(fd, buf, sizeof(buf))) != 0) {
        if (n < 0) {
          if (errno == EINTR) continue;
          break;
        }
        pending.append(buf, static_cast<std::size_t>(n));
        std::size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
          std::cerr << "[engine " << pid << "] " << pending.substr(0, pos) << std::endl;
          pending.erase(0, pos + 1);
        }
      }
      if (!pending.empty()) {
        std::cerr << "[engine " << pid << "] " << pending << std::endl;
      }
    });
  }

  ~SubprocessEngineProcess() override {
    proc_->terminate();
    proc_->wait();
    if (stderr_drain_.joinable()) {
      stderr_drain_.join();
    }
  }

  pid_t pid() const override { return proc_->pid(); }
  int inputFd(std::size_t index) const override { return proc_->inputFd(index); }
  int outputFd() const override { return proc_->outputFd(); }
  void closeInput(std::size_t index) override { proc_->closeInput(index); }
  void terminate() override { proc_->terminate(); }
  std::optional<int> wait() override { return proc_->wait(); }

private:
  std::unique_ptr<Subprocess> proc_;
  std::jthread stderr_drain_;
};

} // namespace

SubprocessTranscoder::SubprocessTranscoder(std::string program, std::chrono::milliseconds stop_grace)
  : program_(std::move(program)), stop_grace_(stop_grace), available_(checkInstalled()) {
  if (!available_) {
    std::cerr << "[engine] " << program_ << " is not installed or not found in PATH" << std::endl;
  }
}

SubprocessTranscoder::~SubprocessTranscoder() = default;

bool SubprocessTranscoder::checkInstalled() const {
  auto result = captureOutput({program_, "-version"}, std::chrono::seconds(5));
  return result && result->exit_code == 0;
}

Result<std::unique_ptr<EngineProcess>> SubprocessTranscoder::spawn(
    const std::vector<std::string>& args,
    std::size_t input_count) {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(program_);
  argv.insert(argv.end(), args.begin(), args.end());

  auto proc = Subprocess::spawn(argv, input_count, stop_grace_);
  if (!proc) {
    return std::unexpected(proc.error());
  }
  std::cout << "[engine] spawned " << program_ << " pid " << (*proc)->pid()
            << " with " << input_count << " input pipe(s)" << std::endl;
  return std::unique_ptr<EngineProcess>(
    std::make_unique<SubprocessEngineProcess>(std::move(*proc)));
}

} // namespace download_service
