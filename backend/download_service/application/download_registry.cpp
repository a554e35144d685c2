#include "download_registry.hpp"

namespace download_service {

Result<std::shared_ptr<DownloadSession>> DownloadRegistry::getOrCreate(const std::string& id,
                                                                       const Factory& factory) {
  std::lock_guard<std::mutex> lock{mutex_};
  auto it = sessions_.find(id);
  if (it != sessions_.end()) {
    auto state = it->second->state();
    if (!isTerminal(state) && state != SessionState::Paused) {
      return makeError(ErrorCode::ConflictError, "Download already in progress");
    }
    sessions_.erase(it);
  }

  auto session = factory();
  if (!session) {
    return makeError(ErrorCode::StorageError, "Failed to create session for " + id);
  }
  sessions_.emplace(id, session);
  return session;
}

std::shared_ptr<DownloadSession> DownloadRegistry::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock{mutex_};
  auto it = sessions_.find(id);
  return it != sessions_.end() ? it->second : nullptr;
}

void DownloadRegistry::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock{mutex_};
  sessions_.erase(id);
}

bool DownloadRegistry::remove(const std::string& id, const DownloadSession* session) {
  std::lock_guard<std::mutex> lock{mutex_};
  auto it = sessions_.find(id);
  if (it == sessions_.end() || it->second.get() != session) {
    return false;
  }
  sessions_.erase(it);
  return true;
}

std::vector<std::string> DownloadRegistry::activeIds() const {
  std::lock_guard<std::mutex> lock{mutex_};
  std::vector<std::string> ids;
  ids.reserve(sessions_.size());
  for (const auto& [id, session] : sessions_) {
    ids.push_back(id);
  }
  return ids;
}

std::size_t DownloadRegistry::size() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return sessions_.size();
}

std::vector<std::shared_ptr<DownloadSession>> DownloadRegistry::drain() {
  std::lock_guard<std::mutex> lock{mutex_};
  std::vector<std::shared_ptr<DownloadSession>> drained;
  drained.reserve(sessions_.size());
  for (auto& [id, session] : sessions_) {
    drained.push_back(std::move(session));
  }
  sessions_.clear();
  return drained;
}

} // namespace download_service
