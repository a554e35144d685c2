#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/download_registry.hpp"
#include "application/pipeline_builder.hpp"
#include "application/reaper.hpp"
#include "domain/download_repository.hpp"
#include "domain/media_provider.hpp"
#include "infrastructure/temp_artifact_store.hpp"

namespace download_service {

struct DownloadRequest {
  std::string resource_ref;
  std::string output_kind{"audio"};
  std::string quality{"highest"};
  std::optional<std::string> existing_id;
  bool cover_art{true};
};

// What the inbound layer needs to answer a download request: headers plus a
// body producer that must be run exactly once.
struct DownloadTicket {
  std::string id;
  std::string filename;
  std::string content_type;
  std::optional<std::uint64_t> total_size;
  std::uint64_t resume_offset{0};
  std::function<bool(ClientSink&)> body;  // true when the full output was delivered
};

struct DownloadStatusView {
  DownloadRecord record;
  std::uint64_t stored_bytes{0};
  int progress{0};
  bool is_active{false};
};

struct DownloadServiceOptions {
  ProgressOptions progress;
  std::chrono::milliseconds retention{std::chrono::hours(24)};
  bool keep_artifact_on_complete{true};
};

class DownloadService {
public:
  DownloadService(std::shared_ptr<DownloadRepository> repository,
                  std::shared_ptr<TempArtifactStore> artifacts,
                  std::shared_ptr<MediaProvider> provider,
                  std::shared_ptr<PipelineBuilder> builder,
                  std::shared_ptr<DownloadRegistry> registry,
                  DownloadServiceOptions options);
  ~DownloadService();

  Result<DownloadTicket> startOrResume(const DownloadRequest& request);
  Result<DownloadStatusView> getStatus(const std::string& id);
  Result<void> pause(const std::string& id);
  Result<DownloadTicket> resume(const std::string& id);
  Result<void> remove(const std::string& id);
  Result<std::vector<DownloadRecord>> recent(std::size_t limit);

  // Schedules eviction for every record already on disk.
  void restoreSchedules();

  // Pauses live sessions and stops the reaper.
  void shutdown();

  const DownloadRegistry& registry() const { return *registry_; }
  const Reaper& reaper() const { return reaper_; }

private:
  Result<DownloadTicket> launch(DownloadRecord record,
                                ResourceDescriptor descriptor,
                                bool want_cover_art,
                                StartMode mode);
  DownloadTicket serveStored(const DownloadRecord& record);
  std::optional<Clock::time_point> sweep(const std::string& id);
  void onSessionInactive(const std::string& id, SessionState state, const DownloadSession* session);

  std::shared_ptr<DownloadRepository> repository_;
  std::shared_ptr<TempArtifactStore> artifacts_;
  std::shared_ptr<MediaProvider> provider_;
  std::shared_ptr<PipelineBuilder> builder_;
  std::shared_ptr<DownloadRegistry> registry_;
  DownloadServiceOptions options_;
  std::atomic_bool stopping_{false};
  Reaper reaper_;
};

} // namespace download_service
