#include "subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace download_service {

namespace {

void ignoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void closeFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

struct PipePair {
  int read{-1};
  int write{-1};
};

bool makePipe(PipePair& p) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return false;
  }
  p.read = fds[0];
  p.write = fds[1];
  return true;
}

void closePipes(std::vector<PipePair>& pipes) {
  for (auto& p : pipes) {
    closeFd(p.read);
    closeFd(p.write);
  }
}

} // namespace

Result<std::unique_ptr<Subprocess>> Subprocess::spawn(
    const std::vector<std::string>& argv,
    std::size_t input_count,
    std::chrono::milliseconds kill_grace) {
  if (argv.empty()) {
    return makeError(ErrorCode::ProcessError, "Empty command line");
  }
  ignoreSigpipe();

  // [0..input_count) inputs, then stdout, stderr, exec status
  std::vector<PipePair> pipes(input_count + 3);
  for (auto& p : pipes) {
    if (!makePipe(p)) {
      auto err = std::string(std::strerror(errno));
      closePipes(pipes);
      return makeError(ErrorCode::ProcessError, "pipe2 failed: " + err);
    }
  }
  auto& out = pipes[input_count];
  auto& err = pipes[input_count + 1];
  auto& status = pipes[input_count + 2];

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    cargv.push_back(const_cast<char*>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  const int first_free = static_cast<int>(3 + input_count);

  pid_t pid = ::fork();
  if (pid < 0) {
    auto msg = std::string(std::strerror(errno));
    closePipes(pipes);
    return makeError(ErrorCode::ProcessError, "fork failed: " + msg);
  }

  if (pid == 0) {
    // Only async-signal-safe calls from here on.
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, 0);
    }
    int child_out = ::fcntl(out.write, F_DUPFD_CLOEXEC, first_free);
    int child_err = ::fcntl(err.write, F_DUPFD_CLOEXEC, first_free);
    int child_in[64];
    for (std::size_t i = 0; i < input_count && i < 64; ++i) {
      child_in[i] = ::fcntl(pipes[i].read, F_DUPFD_CLOEXEC, first_free);
    }
    ::dup2(child_out, 1);
    ::dup2(child_err, 2);
    for (std::size_t i = 0; i < input_count && i < 64; ++i) {
      ::dup2(child_in[i], static_cast<int>(3 + i));
    }
    ::signal(SIGPIPE, SIG_DFL);
    ::execvp(cargv[0], cargv.data());
    int code = errno;
    ssize_t ignored = ::write(status.write, &code, sizeof(code));
    (void)ignored;
    ::_exit(127);
  }

  closeFd(status.write);
  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(status.read, &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  closeFd(status.read);

  std::vector<int> input_fds;
  for (std::size_t i = 0; i < input_count; ++i) {
    closeFd(pipes[i].read);
    input_fds.push_back(pipes[i].write);
  }
  closeFd(out.write);
  closeFd(err.write);

  if (n > 0) {
    for (auto fd : input_fds) ::close(fd);
    ::close(out.read);
    ::close(err.read);
    int wstatus = 0;
    ::waitpid(pid, &wstatus, 0);
    return makeError(ErrorCode::ProcessError,
                     "Failed to exec " + argv[0] + ": " + std::strerror(exec_errno));
  }

  return std::unique_ptr<Subprocess>(
    new Subprocess(pid, std::move(input_fds), out.read, err.read, kill_grace));
}

Subprocess::Subprocess(pid_t pid, std::vector<int> input_fds, int stdout_fd, int stderr_fd,
                       std::chrono::milliseconds kill_grace)
  : pid_(pid),
    input_fds_(std::move(input_fds)),
    stdout_fd_(stdout_fd),
    stderr_fd_(stderr_fd),
    kill_grace_(kill_grace) {}

Subprocess::~Subprocess() {
  if (!reaped()) {
    terminate();
    wait();
  }
  if (killer_.joinable()) {
    killer_.request_stop();
    reaped_cv_.notify_all();
    killer_.join();
  }
  for (auto& fd : input_fds_) closeFd(fd);
  closeFd(stdout_fd_);
  closeFd(stderr_fd_);
}

int Subprocess::inputFd(std::size_t index) const {
  std::lock_guard<std::mutex> lock{mutex_};
  return index < input_fds_.size() ? input_fds_[index] : -1;
}

void Subprocess::closeInput(std::size_t index) {
  std::lock_guard<std::mutex> lock{mutex_};
  if (index < input_fds_.size()) {
    closeFd(input_fds_[index]);
  }
}

bool Subprocess::reaped() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return reaped_;
}

void Subprocess::terminate() {
  std::lock_guard<std::mutex> lock{mutex_};
  if (reaped_ || terminating_) {
    return;
  }
  terminating_ = true;
  ::kill(pid_, SIGTERM);

  killer_ = std::jthread([this](std::stop_token stop) {
    std::unique_lock<std::mutex> lock{mutex_};
    bool done = reaped_cv_.wait_for(lock, kill_grace_, [this, &stop] {
      return reaped_ || stop.stop_requested();
    });
    if (!done && !reaped_) {
      ::kill(pid_, SIGKILL);
    }
  });
}

std::optional<int> Subprocess::wait() {
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (reaped_) {
      return exit_code_;
    }
  }

  // Block until exit without reaping, so the pid stays valid for kill()
  // until reaped_ is set under the lock.
  siginfo_t info{};
  int r;
  do {
    r = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
  } while (r < 0 && errno == EINTR);

  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (reaped_) {
      return exit_code_;
    }
    int wstatus = 0;
    if (::waitpid(pid_, &wstatus, 0) == pid_ && WIFEXITED(wstatus)) {
      exit_code_ = WEXITSTATUS(wstatus);
    }
    reaped_ = true;
  }
  reaped_cv_.notify_all();
  return exit_code_;
}

Result<CapturedOutput> captureOutput(const std::vector<std::string>& argv,
                                     std::chrono::milliseconds timeout) {
  auto proc = Subprocess::spawn(argv, 0, std::chrono::milliseconds(1000));
  if (!proc) {
    return std::unexpected(proc.error());
  }
  auto& p = **proc;

  CapturedOutput result;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  pollfd fds[2] = {{p.outputFd(), POLLIN, 0}, {p.errorFd(), POLLIN, 0}};
  std::string* sinks[2] = {&result.out, &result.err};
  int open_count = 2;
  char buf[16384];

  while (open_count > 0) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) {
      p.terminate();
      p.wait();
      return makeError(ErrorCode::UpstreamError,
                       argv[0] + " timed out after " + std::to_string(timeout.count()) + "ms");
    }
    int rc = ::poll(fds, 2, static_cast<int>(left));
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
      if (n > 0) {
        sinks[i]->append(buf, static_cast<std::size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_count;
      }
    }
  }

  result.exit_code = p.wait().value_or(-1);
  return result;
}

} // namespace download_service
