#include "download_service.hpp"
#include "application/format_selector.hpp"

#include <algorithm>
#include <iostream>

namespace download_service {

namespace {

bool isValidDownloadId(const std::string& id) {
  return id.size() == 32 && std::all_of(id.begin(), id.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
}

Result<void> checkId(const std::string& id) {
  if (!isValidDownloadId(id)) {
    return makeError(ErrorCode::InputError, "Malformed download id");
  }
  return {};
}

} // namespace

DownloadService::DownloadService(std::shared_ptr<DownloadRepository> repository,
                                 std::shared_ptr<TempArtifactStore> artifacts,
                                 std::shared_ptr<MediaProvider> provider,
                                 std::shared_ptr<PipelineBuilder> builder,
                                 std::shared_ptr<DownloadRegistry> registry,
                                 DownloadServiceOptions options)
  : repository_(std::move(repository)),
    artifacts_(std::move(artifacts)),
    provider_(std::move(provider)),
    builder_(std::move(builder)),
    registry_(std::move(registry)),
    options_(options),
    reaper_([this](const std::string& id) { return sweep(id); }) {}

DownloadService::~DownloadService() {
  shutdown();
}

Result<DownloadTicket> DownloadService::startOrResume(const DownloadRequest& request) {
  if (stopping_.load()) {
    return makeError(ErrorCode::ProcessError, "Service is shutting down");
  }
  auto kind = parseOutputKind(request.output_kind);
  if (!kind) {
    return makeError(ErrorCode::InputError, "type must be audio or video");
  }
  if (request.resource_ref.empty() || !provider_->validate(request.resource_ref)) {
    return makeError(ErrorCode::InputError, "Invalid or missing YouTube URL.");
  }
  auto quality = request.quality.empty() ? std::string("highest") : request.quality;
  auto id = request.existing_id.value_or(makeDownloadId(request.resource_ref, *kind, quality));
  if (auto valid = checkId(id); !valid) {
    return std::unexpected(valid.error());
  }

  if (auto active = registry_->get(id); active && !isTerminal(active->state())) {
    return makeError(ErrorCode::ConflictError, "Download already in progress");
  }

  auto loaded = repository_->load(id);
  if (!loaded) {
    return std::unexpected(loaded.error());
  }
  const auto& existing = *loaded;
  if (existing && (existing->resource_ref != request.resource_ref || existing->output_kind != *kind ||
                   existing->quality_selector != quality)) {
    return makeError(ErrorCode::InputError, "Download id belongs to a different request");
  }
  auto stored = artifacts_->size(id);

  if (existing && existing->status == DownloadStatus::Completed && stored > 0 &&
      (!existing->final_size_bytes || *existing->final_size_bytes == stored)) {
    std::cout << "[service] " << id << " already completed, serving stored file" << std::endl;
    return serveStored(*existing);
  }

  std::cout << "[service] fetching media info for " << request.resource_ref << std::endl;
  auto descriptor = provider_->resolve(request.resource_ref);
  if (!descriptor) {
    return std::unexpected(descriptor.error());
  }
  auto selection = selectFormats(descriptor->formats, *kind, quality);
  if (!selection) {
    return std::unexpected(selection.error());
  }

  bool resumable = existing && stored > 0 &&
                   (existing->status == DownloadStatus::Paused || existing->status == DownloadStatus::InProgress);
  if (resumable) {
    auto record = *existing;
    record.status = DownloadStatus::Paused;
    record.current_size_bytes = stored;
    std::cout << "[service] resuming " << id << " from " << stored << " bytes" << std::endl;
    return launch(std::move(record), std::move(*descriptor), existing->cover_art, StartMode::resumeFrom(stored));
  }

  auto now = Clock::now();
  DownloadRecord record;
  record.id = id;
  record.resource_ref = request.resource_ref;
  record.output_kind = *kind;
  record.quality_selector = quality;
  record.title = sanitizeFilename(descriptor->display_title);
  record.display_filename = record.title + "." + fileExtension(*kind);
  record.content_type = contentType(*kind);
  record.status = DownloadStatus::InProgress;
  record.total_size_bytes = existing && existing->total_size_bytes ? existing->total_size_bytes : estimateSize(*selection);
  record.current_size_bytes = 0;
  record.created_at = existing ? existing->created_at : now;
  record.last_modified_at = now;

  if (auto saved = repository_->save(record); !saved) {
    return std::unexpected(saved.error());
  }
  return launch(std::move(record), std::move(*descriptor), request.cover_art, StartMode::fresh());
}

Result<DownloadTicket> DownloadService::launch(DownloadRecord record,
                                               ResourceDescriptor descriptor,
                                               bool want_cover_art,
                                               StartMode mode) {
  auto id = record.id;
  auto created_at = record.created_at;
  DownloadTicket ticket;
  ticket.id = id;
  ticket.filename = record.display_filename;
  ticket.content_type = record.content_type;
  ticket.total_size = record.total_size_bytes;
  ticket.resume_offset = mode.offset;

  auto created = registry_->getOrCreate(id, [&] {
    SessionContext ctx;
    ctx.repository = repository_;
    ctx.artifacts = artifacts_;
    ctx.builder = builder_;
    ctx.progress = options_.progress;
    ctx.keep_artifact_on_complete = options_.keep_artifact_on_complete;
    ctx.on_inactive = [this](const DownloadSession& session, SessionState state) {
      onSessionInactive(session.id(), state, &session);
    };
    return std::make_shared<DownloadSession>(std::move(record), std::move(descriptor), want_cover_art, std::move(ctx));
  });
  if (!created) {
    return std::unexpected(created.error());
  }
  auto session = *created;

  auto started = mode.resume ? session->resume() : session->start(mode);
  if (!started) {
    registry_->remove(id, session.get());
    return std::unexpected(started.error());
  }

  reaper_.schedule(id, created_at + options_.retention);

  ticket.body = [session](ClientSink& sink) {
    return session->run(sink) == SessionState::Completed;
  };
  return ticket;
}

DownloadTicket DownloadService::serveStored(const DownloadRecord& record) {
  DownloadTicket ticket;
  ticket.id = record.id;
  ticket.filename = record.display_filename;
  ticket.content_type = record.content_type;
  ticket.total_size = record.final_size_bytes;

  auto artifacts = artifacts_;
  auto id = record.id;
  ticket.body = [artifacts, id](ClientSink& sink) {
    auto stream = artifacts->read(id);
    if (!stream) {
      std::cerr << "[service] " << stream.error().message << std::endl;
      return false;
    }
    std::vector<std::uint8_t> buffer(64 * 1024);
    while (true) {
      auto n = (*stream)->read(buffer);
      if (!n) {
        std::cerr << "[service] " << n.error().message << std::endl;
        return false;
      }
      if (*n == 0) {
        return true;
      }
      if (!sink.write(std::span<const std::uint8_t>(buffer.data(), *n))) {
        return false;
      }
    }
  };
  return ticket;
}

Result<DownloadStatusView> DownloadService::getStatus(const std::string& id) {
  if (auto valid = checkId(id); !valid) {
    return std::unexpected(valid.error());
  }
  auto loaded = repository_->load(id);
  if (!loaded) {
    return std::unexpected(loaded.error());
  }
  if (!*loaded) {
    return makeError(ErrorCode::NotFoundError, "Download not found");
  }

  DownloadStatusView view;
  view.record = std::move(**loaded);
  view.stored_bytes = artifacts_->size(id);
  if (auto session = registry_->get(id); session && !isTerminal(session->state())) {
    view.is_active = true;
    view.record = session->record();
  }

  if (view.record.status == DownloadStatus::Completed) {
    view.progress = 100;
  } else if (view.record.total_size_bytes && *view.record.total_size_bytes > 0) {
    auto pct = view.stored_bytes * 100 / *view.record.total_size_bytes;
    view.progress = static_cast<int>(std::min<std::uint64_t>(pct, 99));
  }
  return view;
}

Result<void> DownloadService::pause(const std::string& id) {
  if (auto valid = checkId(id); !valid) {
    return valid;
  }
  auto session = registry_->get(id);
  if (!session) {
    auto loaded = repository_->load(id);
    if (loaded && !*loaded) {
      return makeError(ErrorCode::NotFoundError, "Active download not found");
    }
    return makeError(ErrorCode::InvalidState, "Download is not in progress");
  }
  return session->pause();
}

Result<DownloadTicket> DownloadService::resume(const std::string& id) {
  if (auto valid = checkId(id); !valid) {
    return std::unexpected(valid.error());
  }
  if (stopping_.load()) {
    return makeError(ErrorCode::ProcessError, "Service is shutting down");
  }
  auto loaded = repository_->load(id);
  if (!loaded) {
    return std::unexpected(loaded.error());
  }
  if (!*loaded) {
    return makeError(ErrorCode::NotFoundError, "Download not found");
  }
  auto record = std::move(**loaded);
  if (record.status != DownloadStatus::Paused) {
    return makeError(ErrorCode::InvalidState, "Download is not paused");
  }
  if (auto active = registry_->get(id); active && !isTerminal(active->state())) {
    return makeError(ErrorCode::ConflictError, "Download already in progress");
  }

  auto stored = artifacts_->size(id);
  auto descriptor = provider_->resolve(record.resource_ref);
  if (!descriptor) {
    return std::unexpected(descriptor.error());
  }

  std::cout << "[service] resuming " << id << " from " << stored << " bytes" << std::endl;
  record.current_size_bytes = stored;
  bool cover = record.cover_art;
  return launch(std::move(record), std::move(*descriptor), cover, StartMode::resumeFrom(stored));
}

Result<void> DownloadService::remove(const std::string& id) {
  if (auto valid = checkId(id); !valid) {
    return valid;
  }
  reaper_.cancel(id);

  if (auto session = registry_->get(id)) {
    auto cancelled = session->cancel();
    if (!cancelled && cancelled.error().code != ErrorCode::InvalidState) {
      return cancelled;
    }
    registry_->remove(id, session.get());
  }

  auto artifact_removed = artifacts_->remove(id);
  auto record_removed = repository_->remove(id);
  if (!record_removed) {
    return record_removed;
  }
  return artifact_removed;
}

Result<std::vector<DownloadRecord>> DownloadService::recent(std::size_t limit) {
  auto records = repository_->list();
  if (!records) {
    return std::unexpected(records.error());
  }
  std::sort(records->begin(), records->end(), [](const DownloadRecord& a, const DownloadRecord& b) {
    return a.last_modified_at > b.last_modified_at;
  });
  if (records->size() > limit) {
    records->resize(limit);
  }
  return records;
}

void DownloadService::restoreSchedules() {
  auto records = repository_->list();
  if (!records) {
    std::cerr << "[service] " << records.error().message << std::endl;
    return;
  }
  for (const auto& record : *records) {
    reaper_.schedule(record.id, record.created_at + options_.retention);
  }
  std::cout << "[service] scheduled cleanup for " << records->size() << " stored download(s)" << std::endl;
}

void DownloadService::shutdown() {
  stopping_.store(true);
  reaper_.shutdown();
  for (auto& session : registry_->drain()) {
    if (session->state() == SessionState::Running) {
      auto paused = session->pause();
      if (!paused) {
        std::cerr << "[service] " << paused.error().message << std::endl;
      }
    } else {
      session->cleanup();
    }
  }
}

std::optional<Clock::time_point> DownloadService::sweep(const std::string& id) {
  auto loaded = repository_->load(id);
  if (!loaded) {
    std::cerr << "[reaper] " << loaded.error().message << std::endl;
    return Clock::now() + std::chrono::minutes(5);
  }
  if (!*loaded) {
    return std::nullopt;
  }

  auto expiry = (*loaded)->created_at + options_.retention;
  if (Clock::now() < expiry) {
    return expiry;
  }

  std::cout << "[reaper] cleaning up old download " << id << std::endl;
  if (auto session = registry_->get(id)) {
    auto cancelled = session->cancel();
    if (!cancelled && cancelled.error().code != ErrorCode::InvalidState) {
      std::cerr << "[reaper] " << cancelled.error().message << std::endl;
    }
    registry_->remove(id, session.get());
  }

  for (auto removed : {artifacts_->remove(id), repository_->remove(id)}) {
    if (!removed) {
      std::cerr << "[reaper] " << removed.error().message << std::endl;
    }
  }
  return std::nullopt;
}

void DownloadService::onSessionInactive(const std::string& id, SessionState state, const DownloadSession* session) {
  registry_->remove(id, session);
  if (state == SessionState::Cancelled) {
    reaper_.cancel(id);
  }
}

} // namespace download_service
