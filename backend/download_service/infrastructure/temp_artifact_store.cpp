#include "temp_artifact_store.hpp"

#include <atomic>
#include <system_error>

namespace download_service {

namespace {

class FileByteStream : public ByteStream {
public:
  explicit FileByteStream(std::ifstream file) : file_(std::move(file)) {}

  Result<std::size_t> read(std::span<std::uint8_t> buffer) override {
    if (aborted_.load()) {
      return 0;
    }
    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    auto n = file_.gcount();
    if (n == 0 && file_.bad()) {
      return makeError(ErrorCode::StorageError, "Failed to read artifact");
    }
    return static_cast<std::size_t>(n);
  }

  void abort() override { aborted_.store(true); }

private:
  std::ifstream file_;
  std::atomic_bool aborted_{false};
};

} // namespace

ArtifactWriter::ArtifactWriter(std::ofstream file) : file_(std::move(file)) {}

Result<void> ArtifactWriter::write(std::span<const std::uint8_t> data) {
  if (!file_.is_open()) {
    return makeError(ErrorCode::StorageError, "Artifact already closed");
  }
  file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  file_.flush();
  if (!file_) {
    return makeError(ErrorCode::StorageError, "Failed to write artifact");
  }
  return {};
}

void ArtifactWriter::close() {
  if (file_.is_open()) {
    file_.close();
  }
}

TempArtifactStore::TempArtifactStore(std::filesystem::path directory)
  : directory_(std::move(directory)) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw std::runtime_error("Failed to create artifact directory " + directory_.string() + ": " + ec.message());
  }
}

std::filesystem::path TempArtifactStore::pathFor(const std::string& id) const {
  return directory_ / (id + TEMP_ARTIFACT_SUFFIX);
}

Result<std::unique_ptr<ArtifactWriter>> TempArtifactStore::open(const std::string& id, ArtifactOpenMode mode) {
  auto flags = std::ios::binary | std::ios::out;
  flags |= mode == ArtifactOpenMode::Truncate ? std::ios::trunc : std::ios::app;

  std::ofstream file(pathFor(id), flags);
  if (!file) {
    return makeError(ErrorCode::StorageError, "Failed to open artifact " + pathFor(id).string());
  }
  return std::make_unique<ArtifactWriter>(std::move(file));
}

Result<std::unique_ptr<ByteStream>> TempArtifactStore::read(const std::string& id) {
  std::ifstream file(pathFor(id), std::ios::binary);
  if (!file) {
    return makeError(ErrorCode::NotFoundError, "No artifact for " + id);
  }
  return std::unique_ptr<ByteStream>(std::make_unique<FileByteStream>(std::move(file)));
}

std::uint64_t TempArtifactStore::size(const std::string& id) const {
  std::error_code ec;
  auto n = std::filesystem::file_size(pathFor(id), ec);
  return ec ? 0 : static_cast<std::uint64_t>(n);
}

Result<void> TempArtifactStore::remove(const std::string& id) {
  std::error_code ec;
  std::filesystem::remove(pathFor(id), ec);
  if (ec) {
    return makeError(ErrorCode::StorageError, "Failed to delete artifact for " + id + ": " + ec.message());
  }
  return {};
}

} // namespace download_service
