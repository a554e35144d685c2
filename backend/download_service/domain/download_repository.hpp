#pragma once

// project
#include "download_record.hpp"

// std
#include <optional>
#include <string>
#include <vector>

namespace download_service {

class DownloadRepository {
public:
  virtual ~DownloadRepository() = default;
  virtual Result<std::optional<DownloadRecord>> load(const std::string& id) = 0;
  virtual Result<void> save(const DownloadRecord& record) = 0;
  virtual Result<void> remove(const std::string& id) = 0;
  virtual Result<std::vector<DownloadRecord>> list() = 0;
};

} // namespace download_service
