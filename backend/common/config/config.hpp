#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <chrono>

namespace config {

struct HttpConfig {
  std::string host;
  unsigned short port;
  std::chrono::seconds read_timeout;  // idle limit while waiting for a request
};

struct StorageConfig {
  std::string directory;
  bool keep_artifact_on_complete;
};

struct EngineConfig {
  std::string ffmpeg_program;
  std::chrono::milliseconds stop_grace;
};

struct ProviderConfig {
  std::string ytdlp_program;
  std::string user_agent;
  std::chrono::milliseconds resolve_timeout;
  std::chrono::milliseconds thumbnail_timeout;
  std::chrono::seconds stream_stall_timeout;
};

struct SessionConfig {
  std::uint64_t persist_every_bytes;
  std::chrono::milliseconds persist_interval;
  std::chrono::milliseconds retention;
  std::size_t recent_limit;
  unsigned int worker_threads;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Getters
const HttpConfig& getHttp() const { return http_; }
const StorageConfig& getStorage() const { return storage_; }
const EngineConfig& getEngine() const { return engine_; }
const ProviderConfig& getProvider() const { return provider_; }
const SessionConfig& getSession() const { return session_; }
std::string getHttpIpPort() const { return http_.host+":"+std::to_string(http_.port);}

private:
  Config();

  // Applies STREAMDL_* environment overrides on top of the defaults.
  void loadEnvironment();

  HttpConfig http_;
  StorageConfig storage_;
  EngineConfig engine_;
  ProviderConfig provider_;
  SessionConfig session_;
};

} // namespace config
