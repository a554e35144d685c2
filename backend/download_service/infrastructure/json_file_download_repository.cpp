#include "json_file_download_repository.hpp"

#include <atomic>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace download_service {

namespace {

std::atomic<unsigned long> g_tmp_counter{0};

bool endsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

JsonFileDownloadRepository::JsonFileDownloadRepository(std::filesystem::path directory)
  : directory_(std::move(directory)) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw std::runtime_error("Failed to create metadata directory " + directory_.string() + ": " + ec.message());
  }
}

JsonFileDownloadRepository::~JsonFileDownloadRepository() = default;

std::filesystem::path JsonFileDownloadRepository::pathFor(const std::string& id) const {
  return directory_ / (id + METADATA_FILE_SUFFIX);
}

Result<std::optional<DownloadRecord>> JsonFileDownloadRepository::load(const std::string& id) {
  auto path = pathFor(id);
  std::ifstream in(path);
  if (!in) {
    return std::optional<DownloadRecord>{};
  }

  try {
    auto j = nlohmann::json::parse(in);
    return std::optional<DownloadRecord>{j.get<DownloadRecord>()};
  } catch (const std::exception& e) {
    return makeError(ErrorCode::StorageError, "Corrupt metadata for " + id + ": " + e.what());
  }
}

Result<void> JsonFileDownloadRepository::save(const DownloadRecord& record) {
  auto path = pathFor(record.id);
  auto tmp = path;
  tmp += ".part" + std::to_string(::getpid()) + "_" + std::to_string(g_tmp_counter.fetch_add(1));

  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      return makeError(ErrorCode::StorageError, "Failed to open " + tmp.string());
    }
    out << nlohmann::json(record).dump(2);
    out.flush();
    if (!out) {
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      return makeError(ErrorCode::StorageError, "Failed to write " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return makeError(ErrorCode::StorageError, "Failed to replace " + path.string() + ": " + ec.message());
  }
  return {};
}

Result<void> JsonFileDownloadRepository::remove(const std::string& id) {
  std::error_code ec;
  std::filesystem::remove(pathFor(id), ec);
  if (ec) {
    return makeError(ErrorCode::StorageError, "Failed to delete metadata for " + id + ": " + ec.message());
  }
  return {};
}

Result<std::vector<DownloadRecord>> JsonFileDownloadRepository::list() {
  std::vector<DownloadRecord> records;
  std::error_code ec;
  std::filesystem::directory_iterator it(directory_, ec);
  if (ec) {
    return makeError(ErrorCode::StorageError, "Failed to list " + directory_.string() + ": " + ec.message());
  }

  for (const auto& entry : it) {
    auto name = entry.path().filename().string();
    if (!entry.is_regular_file() || !endsWith(name, METADATA_FILE_SUFFIX)) {
      continue;
    }
    auto id = name.substr(0, name.size() - std::string(METADATA_FILE_SUFFIX).size());
    auto record = load(id);
    if (!record) {
      std::cerr << "[metadata] skipping " << name << ": " << record.error().message << std::endl;
      continue;
    }
    if (*record) {
      records.push_back(std::move(**record));
    }
  }
  return records;
}

} // namespace download_service
