#pragma once
#include "domain/byte_stream.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace download_service {

#define TEMP_ARTIFACT_SUFFIX ".tmp"

enum class ArtifactOpenMode { Truncate, Append };

// Append-only handle on one artifact. Every write is flushed before it
// returns so the on-disk size never lags the caller's byte counter.
class ArtifactWriter {
public:
  explicit ArtifactWriter(std::ofstream file);

  Result<void> write(std::span<const std::uint8_t> data);
  void close();

private:
  std::ofstream file_;
};

class TempArtifactStore {
public:
  explicit TempArtifactStore(std::filesystem::path directory);

  Result<std::unique_ptr<ArtifactWriter>> open(const std::string& id, ArtifactOpenMode mode);
  Result<std::unique_ptr<ByteStream>> read(const std::string& id);
  std::uint64_t size(const std::string& id) const;
  Result<void> remove(const std::string& id);

  std::filesystem::path pathFor(const std::string& id) const;

private:
  std::filesystem::path directory_;
};

} // namespace download_service
