#pragma once
#include "domain/byte_stream.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace download_service {

// libcurl front end for the provider: long-lived streaming transfers and
// small whole-body fetches (thumbnails).
class Downloader {
public:
  using Headers = std::map<std::string, std::string>;

  Downloader(std::string user_agent, std::chrono::seconds stall_timeout);
  ~Downloader();

  Downloader(const Downloader&) = delete;
  Downloader& operator=(const Downloader&) = delete;

  // The transfer starts immediately on a background thread and is buffered
  // up to a fixed window; read() drains it.
  std::unique_ptr<ByteStream> openStream(const std::string& url, const Headers& headers) const;

  Result<std::vector<std::uint8_t>> fetch(const std::string& url,
                                          const Headers& headers,
                                          std::chrono::milliseconds timeout) const;

private:
  std::string user_agent_;
  std::chrono::seconds stall_timeout_;
};

} // namespace download_service
