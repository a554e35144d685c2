#pragma once
#include "domain/download_repository.hpp"

#include <filesystem>
#include <string>

namespace download_service {

#define METADATA_FILE_SUFFIX ".meta.json"

// One JSON document per download id inside the working directory. Saves go
// through a sibling temporary and rename(), so readers never see a partial file.
class JsonFileDownloadRepository : public DownloadRepository {
public:
  explicit JsonFileDownloadRepository(std::filesystem::path directory);
  ~JsonFileDownloadRepository() override;

  Result<std::optional<DownloadRecord>> load(const std::string& id) override;
  Result<void> save(const DownloadRecord& record) override;
  Result<void> remove(const std::string& id) override;
  Result<std::vector<DownloadRecord>> list() override;

  std::filesystem::path pathFor(const std::string& id) const;

private:
  std::filesystem::path directory_;
};

} // namespace download_service
