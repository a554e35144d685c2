#pragma once
#include "application/download_session.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace download_service {

// id -> active session. At most one non-terminal session per id; every
// mutation is serialized by one mutex.
class DownloadRegistry {
public:
  using Factory = std::function<std::shared_ptr<DownloadSession>()>;

  // Registers the session `factory` builds, or fails with ConflictError when
  // a non-terminal session already holds the id. The factory only runs when
  // the id is free.
  Result<std::shared_ptr<DownloadSession>> getOrCreate(const std::string& id, const Factory& factory);

  std::shared_ptr<DownloadSession> get(const std::string& id) const;

  void remove(const std::string& id);

  // Removes the entry only if it still points at `session`.
  bool remove(const std::string& id, const DownloadSession* session);

  std::vector<std::string> activeIds() const;
  std::size_t size() const;

  // Empties the registry and hands back what was in it.
  std::vector<std::shared_ptr<DownloadSession>> drain();

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<DownloadSession>> sessions_;
};

} // namespace download_service
