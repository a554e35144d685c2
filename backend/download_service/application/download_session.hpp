#pragma once
#include "application/pipeline_builder.hpp"
#include "application/progress_tracker.hpp"
#include "domain/download_record.hpp"
#include "domain/download_repository.hpp"
#include "infrastructure/temp_artifact_store.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace download_service {

enum class SessionState { Idle, Starting, Running, Paused, Completed, Cancelled, Failed };

const char* toString(SessionState state);
bool isTerminal(SessionState state);

class DownloadSession;

struct SessionContext {
  std::shared_ptr<DownloadRepository> repository;
  std::shared_ptr<TempArtifactStore> artifacts;
  std::shared_ptr<PipelineBuilder> builder;
  ProgressOptions progress;
  bool keep_artifact_on_complete{true};
  // Invoked once each time the session stops being active (Paused or any
  // terminal state), outside the session lock.
  std::function<void(const DownloadSession& session, SessionState state)> on_inactive;
};

struct StartMode {
  bool resume{false};
  std::uint64_t offset{0};

  static StartMode fresh() { return {false, 0}; }
  static StartMode resumeFrom(std::uint64_t offset) { return {true, offset}; }
};

// State machine for one download id:
//   Idle -> Starting -> Running <-> Paused -> Completed
//   Starting/Running/Paused -> Cancelled | Failed
// Every status change is saved before the call that caused it returns.
class DownloadSession : public std::enable_shared_from_this<DownloadSession> {
public:
  DownloadSession(DownloadRecord record, ResourceDescriptor descriptor, bool want_cover_art, SessionContext context);
  ~DownloadSession();

  DownloadSession(const DownloadSession&) = delete;
  DownloadSession& operator=(const DownloadSession&) = delete;

  const std::string& id() const { return id_; }
  SessionState state() const;
  DownloadRecord record() const;

  // Builds the pipeline and opens the artifact (truncate for fresh, append
  // for resume). On error the session is Failed and the error is returned
  // before any byte reaches the client.
  Result<void> start(StartMode mode);

  // Streams the attempt into `sink` on the calling thread: replays the
  // artifact prefix first when resuming, then engine output. Returns the
  // state the attempt ended in.
  SessionState run(ClientSink& sink);

  Result<void> pause();
  Result<void> resume();
  Result<void> cancel();

  // Tears down the live attempt. Idempotent and safe from any thread.
  void cleanup();

private:
  // Resources of one start()..run() cycle.
  struct Attempt {
    std::unique_ptr<Pipeline> pipeline;
    std::unique_ptr<ArtifactWriter> writer;
    std::unique_ptr<ProgressTracker> tracker;
    StartMode mode;
    std::atomic_bool released{false};

    void release();
  };

  void complete(std::uint64_t bytes);
  void fail(const std::string& reason);
  // A resume whose sources are unavailable goes back to Paused; the record
  // and artifact stay as they were so a later resume can retry.
  void abandonResume(const std::string& reason);
  void pauseAfterDisconnect();

  // The following require mutex_ held.
  Result<void> persistLocked();
  void stopTrackerLocked();
  void setStateLocked(SessionState state);

  ProgressTracker::Outcome replayArtifact(ClientSink& sink, std::uint64_t length);
  void notifyInactive(SessionState state);

  const std::string id_;
  ResourceDescriptor descriptor_;
  bool want_cover_art_;
  SessionContext ctx_;

  mutable std::mutex mutex_;
  DownloadRecord record_;
  SessionState state_;
  std::shared_ptr<Attempt> attempt_;
};

} // namespace download_service
