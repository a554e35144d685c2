#include "download_session.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace download_service {

namespace {

constexpr std::size_t kPumpChunk = 64 * 1024;

} // namespace

const char* toString(SessionState state) {
  switch (state) {
    case SessionState::Idle: return "idle";
    case SessionState::Starting: return "starting";
    case SessionState::Running: return "running";
    case SessionState::Paused: return "paused";
    case SessionState::Completed: return "completed";
    case SessionState::Cancelled: return "cancelled";
    case SessionState::Failed: return "failed";
  }
  return "unknown";
}

bool isTerminal(SessionState state) {
  return state == SessionState::Completed ||
         state == SessionState::Cancelled ||
         state == SessionState::Failed;
}

void DownloadSession::Attempt::release() {
  if (released.exchange(true)) {
    return;
  }
  if (pipeline) {
    pipeline->abort();
  }
}

DownloadSession::DownloadSession(DownloadRecord record,
                                 ResourceDescriptor descriptor,
                                 bool want_cover_art,
                                 SessionContext context)
  : id_(record.id),
    descriptor_(std::move(descriptor)),
    want_cover_art_(want_cover_art),
    ctx_(std::move(context)),
    record_(std::move(record)),
    state_(record_.status == DownloadStatus::Paused ? SessionState::Paused : SessionState::Idle) {}

DownloadSession::~DownloadSession() {
  cleanup();
}

SessionState DownloadSession::state() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return state_;
}

DownloadRecord DownloadSession::record() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return record_;
}

Result<void> DownloadSession::start(StartMode mode) {
  OutputKind kind;
  std::string quality;
  CoverArtPolicy cover;
  // Bytes already delivered fix whether the output carries a cover image
  bool continuing = mode.resume && mode.offset > 0;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (state_ != SessionState::Idle && state_ != SessionState::Paused) {
      return makeError(ErrorCode::InvalidState,
                       std::string("Cannot start download in state ") + toString(state_));
    }
    setStateLocked(SessionState::Starting);
    kind = record_.output_kind;
    quality = record_.quality_selector;
    if (continuing) {
      cover = record_.cover_art ? CoverArtPolicy::Required : CoverArtPolicy::Skip;
    } else {
      cover = want_cover_art_ ? CoverArtPolicy::BestEffort : CoverArtPolicy::Skip;
    }
  }

  std::cout << "[session " << id_ << "] starting " << (mode.resume ? "resume" : "fresh")
            << " attempt at offset " << mode.offset << std::endl;

  auto pipeline = ctx_.builder->build(descriptor_, kind, quality, cover);
  if (!pipeline) {
    if (continuing && pipeline.error().code == ErrorCode::UpstreamError) {
      abandonResume(pipeline.error().message);
    } else {
      fail(pipeline.error().message);
    }
    return std::unexpected(pipeline.error());
  }

  auto attempt = std::make_shared<Attempt>();
  attempt->pipeline = std::move(*pipeline);
  attempt->mode = mode;

  std::optional<Error> error;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (state_ != SessionState::Starting) {
      // cancelled while the pipeline was being built
      attempt->release();
      return makeError(ErrorCode::InvalidState,
                       std::string("Download ") + toString(state_) + " during start");
    }

    auto writer = ctx_.artifacts->open(id_, mode.resume ? ArtifactOpenMode::Append : ArtifactOpenMode::Truncate);
    if (!writer) {
      error = writer.error();
    } else {
      attempt->writer = std::move(*writer);
      attempt->tracker = std::make_unique<ProgressTracker>(
        mutex_, mode.offset, *attempt->writer,
        [this](std::uint64_t current) {
          record_.current_size_bytes = current;
          record_.last_modified_at = Clock::now();
          persistLocked();
        },
        ctx_.progress);

      record_.status = DownloadStatus::InProgress;
      record_.current_size_bytes = mode.offset;
      record_.cover_art = attempt->pipeline->coverArt();
      record_.last_modified_at = Clock::now();
      auto saved = persistLocked();
      if (!saved) {
        error = saved.error();
      } else {
        attempt_ = attempt;
        setStateLocked(SessionState::Running);
      }
    }
  }

  if (error) {
    attempt->release();
    fail(error->message);
    return std::unexpected(*error);
  }

  attempt->pipeline->start();
  return {};
}

SessionState DownloadSession::run(ClientSink& sink) {
  std::shared_ptr<Attempt> attempt;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (state_ != SessionState::Running || !attempt_) {
      return state_;
    }
    attempt = attempt_;
  }

  if (attempt->mode.resume && attempt->mode.offset > 0) {
    auto replayed = replayArtifact(sink, attempt->mode.offset);
    if (replayed != ProgressTracker::Outcome::Forwarded) {
      if (replayed == ProgressTracker::Outcome::ClientGone) {
        pauseAfterDisconnect();
      } else if (replayed == ProgressTracker::Outcome::ArtifactFailed) {
        fail("Stored artifact is shorter than the recorded size");
      }
      {
        std::lock_guard<std::mutex> lock{mutex_};
        if (attempt_ == attempt) {
          attempt_.reset();
        }
      }
      attempt->release();
      return state();
    }
  }

  std::vector<std::uint8_t> buffer(kPumpChunk);
  std::optional<std::string> read_error;
  bool interrupted = false;

  while (true) {
    auto n = attempt->pipeline->readOutput(buffer);
    if (!n) {
      read_error = n.error().message;
      break;
    }
    if (*n == 0) {
      break;
    }

    auto outcome = attempt->tracker->onChunk(std::span<const std::uint8_t>(buffer.data(), *n), sink);
    if (outcome == ProgressTracker::Outcome::Stopped) {
      interrupted = true;
      break;
    }
    if (outcome == ProgressTracker::Outcome::ArtifactFailed) {
      fail("Failed to write temp artifact");
      interrupted = true;
      break;
    }
    if (outcome == ProgressTracker::Outcome::ClientGone) {
      pauseAfterDisconnect();
      interrupted = true;
      break;
    }
  }

  if (interrupted || read_error) {
    attempt->release();
  }
  auto exit_code = attempt->pipeline->finish();
  auto feed_error = attempt->pipeline->feedError();

  bool stopped;
  std::uint64_t bytes;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    stopped = attempt->tracker->stoppedLocked();
    bytes = attempt->tracker->bytesLocked();
  }

  if (!stopped) {
    if (read_error) {
      fail(*read_error);
    } else if (feed_error) {
      fail(feed_error->message);
    } else if (!exit_code) {
      fail("Engine terminated by signal");
    } else if (*exit_code != 0) {
      fail("Engine exited with code " + std::to_string(*exit_code));
    } else {
      complete(bytes);
    }
  }

  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (attempt_ == attempt) {
      attempt_.reset();
    }
  }
  attempt->release();
  return state();
}

Result<void> DownloadSession::pause() {
  std::shared_ptr<Attempt> attempt;
  Result<void> saved;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (state_ == SessionState::Paused) {
      return {};
    }
    if (state_ != SessionState::Running) {
      return makeError(ErrorCode::InvalidState, "Download is not in progress");
    }

    auto bytes = attempt_ ? attempt_->tracker->stopLocked() : record_.current_size_bytes;
    record_.status = DownloadStatus::Paused;
    record_.current_size_bytes = bytes;
    record_.last_modified_at = Clock::now();
    saved = persistLocked();
    setStateLocked(SessionState::Paused);
    attempt = std::move(attempt_);
  }

  std::cout << "[session " << id_ << "] paused at " << record().current_size_bytes << " bytes" << std::endl;
  if (attempt) {
    attempt->release();
  }
  notifyInactive(SessionState::Paused);
  return saved;
}

Result<void> DownloadSession::resume() {
  std::uint64_t offset;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (state_ != SessionState::Paused) {
      return makeError(ErrorCode::InvalidState, "Download is not paused");
    }
    offset = record_.current_size_bytes;
  }
  return start(StartMode::resumeFrom(offset));
}

Result<void> DownloadSession::cancel() {
  std::shared_ptr<Attempt> attempt;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (state_ == SessionState::Cancelled) {
      return {};
    }
    if (isTerminal(state_)) {
      return makeError(ErrorCode::InvalidState,
                       std::string("Download already ") + toString(state_));
    }
    stopTrackerLocked();
    setStateLocked(SessionState::Cancelled);
    attempt = std::move(attempt_);
  }

  std::cout << "[session " << id_ << "] cancelled" << std::endl;
  if (attempt) {
    attempt->release();
  }

  auto artifact_removed = ctx_.artifacts->remove(id_);
  auto record_removed = ctx_.repository->remove(id_);
  notifyInactive(SessionState::Cancelled);

  if (!record_removed) {
    return record_removed;
  }
  return artifact_removed;
}

void DownloadSession::cleanup() {
  std::shared_ptr<Attempt> attempt;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    stopTrackerLocked();
    attempt = std::move(attempt_);
  }
  if (attempt) {
    attempt->release();
  }
}

void DownloadSession::complete(std::uint64_t bytes) {
  std::shared_ptr<Attempt> attempt;
  Result<void> saved;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (state_ != SessionState::Running) {
      return;
    }
    stopTrackerLocked();
    auto now = Clock::now();
    record_.status = DownloadStatus::Completed;
    record_.current_size_bytes = bytes;
    record_.final_size_bytes = bytes;
    if (!record_.total_size_bytes) {
      record_.total_size_bytes = bytes;
    }
    record_.completed_at = now;
    record_.last_modified_at = now;
    saved = persistLocked();
    if (!saved) {
      // The stored record keeps its last checkpoint and stays resumable
      record_.status = DownloadStatus::Failed;
      record_.final_size_bytes.reset();
      record_.completed_at.reset();
      setStateLocked(SessionState::Failed);
    } else {
      setStateLocked(SessionState::Completed);
    }
    attempt = std::move(attempt_);
  }

  if (attempt) {
    attempt->release();
  }
  if (!saved) {
    std::cerr << "[session " << id_ << "] output finished but could not be recorded: "
              << saved.error().message << std::endl;
    notifyInactive(SessionState::Failed);
    return;
  }

  std::cout << "[session " << id_ << "] completed, " << bytes << " bytes" << std::endl;
  if (!ctx_.keep_artifact_on_complete) {
    auto removed = ctx_.artifacts->remove(id_);
    if (!removed) {
      std::cerr << "[session " << id_ << "] " << removed.error().message << std::endl;
    }
  }
  notifyInactive(SessionState::Completed);
}

void DownloadSession::fail(const std::string& reason) {
  std::shared_ptr<Attempt> attempt;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (state_ != SessionState::Running && state_ != SessionState::Starting) {
      return;
    }
    if (attempt_ && attempt_->tracker) {
      record_.current_size_bytes = attempt_->tracker->stopLocked();
    }
    record_.status = DownloadStatus::Failed;
    record_.last_modified_at = Clock::now();
    if (!persistLocked()) {
      std::cerr << "[session " << id_ << "] record left at its last checkpoint" << std::endl;
    }
    setStateLocked(SessionState::Failed);
    attempt = std::move(attempt_);
  }

  std::cerr << "[session " << id_ << "] failed: " << reason << std::endl;
  if (attempt) {
    attempt->release();
  }
  notifyInactive(SessionState::Failed);
}

void DownloadSession::abandonResume(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (state_ != SessionState::Starting) {
      return;
    }
    setStateLocked(SessionState::Paused);
  }
  std::cerr << "[session " << id_ << "] cannot resume, staying paused: " << reason << std::endl;
  notifyInactive(SessionState::Paused);
}

void DownloadSession::pauseAfterDisconnect() {
  std::cout << "[session " << id_ << "] client disconnected" << std::endl;
  auto paused = pause();
  if (!paused && paused.error().code != ErrorCode::InvalidState) {
    std::cerr << "[session " << id_ << "] " << paused.error().message << std::endl;
  }
}

Result<void> DownloadSession::persistLocked() {
  auto saved = ctx_.repository->save(record_);
  if (!saved) {
    std::cerr << "[session " << id_ << "] failed to save metadata: " << saved.error().message << std::endl;
  }
  return saved;
}

void DownloadSession::stopTrackerLocked() {
  if (attempt_ && attempt_->tracker) {
    attempt_->tracker->stopLocked();
  }
}

void DownloadSession::setStateLocked(SessionState state) {
  state_ = state;
}

ProgressTracker::Outcome DownloadSession::replayArtifact(ClientSink& sink, std::uint64_t length) {
  auto stream = ctx_.artifacts->read(id_);
  if (!stream) {
    std::cerr << "[session " << id_ << "] " << stream.error().message << std::endl;
    return ProgressTracker::Outcome::ArtifactFailed;
  }

  std::cout << "[session " << id_ << "] replaying " << length << " stored bytes" << std::endl;
  std::vector<std::uint8_t> buffer(kPumpChunk);
  std::uint64_t remaining = length;
  while (remaining > 0) {
    if (state() != SessionState::Running) {
      return ProgressTracker::Outcome::Stopped;
    }
    auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
    auto n = (*stream)->read(std::span<std::uint8_t>(buffer.data(), want));
    if (!n || *n == 0) {
      return ProgressTracker::Outcome::ArtifactFailed;
    }
    if (!sink.write(std::span<const std::uint8_t>(buffer.data(), *n))) {
      return ProgressTracker::Outcome::ClientGone;
    }
    remaining -= *n;
  }
  return ProgressTracker::Outcome::Forwarded;
}

void DownloadSession::notifyInactive(SessionState state) {
  if (ctx_.on_inactive) {
    ctx_.on_inactive(*this, state);
  }
}

} // namespace download_service
