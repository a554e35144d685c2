#include "downloader.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace download_service {

namespace {

constexpr std::size_t kMaxBufferedBytes = 4 * 1024 * 1024;

curl_slist* buildHeaderList(const Downloader::Headers& headers) {
  curl_slist* list = nullptr;
  for (const auto& [name, value] : headers) {
    list = curl_slist_append(list, (name + ": " + value).c_str());
  }
  return list;
}

std::string transferError(CURLcode res, long http_code) {
  if (res == CURLE_HTTP_RETURNED_ERROR || (res == CURLE_OK && http_code >= 400)) {
    return "HTTP error: " + std::to_string(http_code);
  }
  if (res != CURLE_OK) {
    return curl_easy_strerror(res);
  }
  return {};
}

class CurlByteStream : public ByteStream {
public:
  CurlByteStream(std::string url, Downloader::Headers headers, std::string user_agent,
                 std::chrono::seconds stall_timeout)
    : url_(std::move(url)),
      headers_(std::move(headers)),
      user_agent_(std::move(user_agent)),
      stall_timeout_(stall_timeout) {
    transfer_ = std::jthread([this] { run(); });
  }

  ~CurlByteStream() override {
    abort();
    if (transfer_.joinable()) {
      transfer_.join();
    }
  }

  Result<std::size_t> read(std::span<std::uint8_t> buffer) override {
    std::unique_lock<std::mutex> lock{mutex_};
    cv_.wait(lock, [this] { return !chunks_.empty() || done_ || aborted_.load(); });

    if (aborted_.load()) {
      return makeError(ErrorCode::DisconnectError, "Stream aborted");
    }
    if (chunks_.empty()) {
      if (!error_.empty()) {
        return makeError(ErrorCode::UpstreamError, error_);
      }
      return 0;
    }

    auto& front = chunks_.front();
    auto n = std::min(buffer.size(), front.size() - front_offset_);
    std::memcpy(buffer.data(), front.data() + front_offset_, n);
    front_offset_ += n;
    buffered_ -= n;
    if (front_offset_ == front.size()) {
      chunks_.pop_front();
      front_offset_ = 0;
    }
    cv_.notify_all();
    return n;
  }

  void abort() override {
    aborted_.store(true);
    cv_.notify_all();
  }

private:
  static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlByteStream*>(userdata);
    auto total = size * nmemb;

    std::unique_lock<std::mutex> lock{self->mutex_};
    self->cv_.wait(lock, [self] {
      return self->buffered_ < kMaxBufferedBytes || self->aborted_.load();
    });
    if (self->aborted_.load()) {
      return 0;
    }
    self->chunks_.emplace_back(ptr, ptr + total);
    self->buffered_ += total;
    self->cv_.notify_all();
    return total;
  }

  static int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* self = static_cast<CurlByteStream*>(clientp);
    return self->aborted_.load() ? 1 : 0;
  }

  void run() {
    CURL* curl = curl_easy_init();
    if (!curl) {
      finish("Failed to initialize CURL");
      return;
    }
    curl_slist* header_list = buildHeaderList(headers_);

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, this);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    // An error page must never reach the engine as media
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(stall_timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (header_list) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    auto res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (header_list) {
      curl_slist_free_all(header_list);
    }
    curl_easy_cleanup(curl);

    finish(transferError(res, http_code));
  }

  void finish(std::string error) {
    std::lock_guard<std::mutex> lock{mutex_};
    done_ = true;
    error_ = std::move(error);
    cv_.notify_all();
  }

  std::string url_;
  Downloader::Headers headers_;
  std::string user_agent_;
  std::chrono::seconds stall_timeout_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::vector<std::uint8_t>> chunks_;
  std::size_t front_offset_{0};
  std::size_t buffered_{0};
  bool done_{false};
  std::string error_;
  std::atomic_bool aborted_{false};
  std::jthread transfer_;
};

size_t appendCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::vector<std::uint8_t>*>(userdata);
  body->insert(body->end(), ptr, ptr + size * nmemb);
  return size * nmemb;
}

} // namespace

Downloader::Downloader(std::string user_agent, std::chrono::seconds stall_timeout)
  : user_agent_(std::move(user_agent)), stall_timeout_(stall_timeout) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("Failed to initialize CURL");
  }
}

Downloader::~Downloader() {
  curl_global_cleanup();
}

std::unique_ptr<ByteStream> Downloader::openStream(const std::string& url, const Headers& headers) const {
  return std::make_unique<CurlByteStream>(url, headers, user_agent_, stall_timeout_);
}

Result<std::vector<std::uint8_t>> Downloader::fetch(const std::string& url,
                                                    const Headers& headers,
                                                    std::chrono::milliseconds timeout) const {
  CURL* curl = curl_easy_init();
  if (!curl) {
    return makeError(ErrorCode::UpstreamError, "Failed to initialize CURL");
  }

  std::vector<std::uint8_t> body;
  curl_slist* header_list = buildHeaderList(headers);
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  if (header_list) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  auto res = curl_easy_perform(curl);
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (header_list) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);

  if (auto error = transferError(res, http_code); !error.empty()) {
    return makeError(ErrorCode::UpstreamError, error);
  }
  if (http_code != 200) {
    return makeError(ErrorCode::UpstreamError, "HTTP error: " + std::to_string(http_code));
  }
  return body;
}

} // namespace download_service
