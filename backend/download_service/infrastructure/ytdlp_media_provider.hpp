#pragma once
#include "domain/media_provider.hpp"
#include "infrastructure/downloader.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace download_service {

// Resolves YouTube references through the yt-dlp binary (`-J` metadata dump)
// and fetches the chosen format URLs with libcurl.
class YtDlpMediaProvider : public MediaProvider {
public:
  YtDlpMediaProvider(std::string ytdlp_program,
                     std::shared_ptr<Downloader> downloader,
                     std::chrono::milliseconds resolve_timeout = std::chrono::seconds(60));

  bool validate(const std::string& resource_ref) const override;
  Result<ResourceDescriptor> resolve(const std::string& resource_ref) override;
  Result<std::unique_ptr<ByteStream>> openStream(const MediaFormat& format) override;
  Result<std::vector<std::uint8_t>> fetchThumbnail(const std::string& url,
                                                   std::chrono::milliseconds timeout) override;

  // Exposed for tests: turns a yt-dlp JSON dump into a descriptor.
  static Result<ResourceDescriptor> parseDescriptor(const std::string& json_text);

private:
  std::string program_;
  std::shared_ptr<Downloader> downloader_;
  std::chrono::milliseconds resolve_timeout_;
};

} // namespace download_service
