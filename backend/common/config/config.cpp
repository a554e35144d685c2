#include "config.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace config {

namespace {

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

} // namespace

  Config::Config() {
    http_ = {
      .host = "0.0.0.0",
      .port = 5000,
      .read_timeout = std::chrono::seconds(30)
    };

    storage_ = {
      .directory = "/tmp/streamdl",
      .keep_artifact_on_complete = true
    };

    engine_ = {
      .ffmpeg_program = "ffmpeg",
      .stop_grace = std::chrono::milliseconds(1000)
    };

    provider_ = {
      .ytdlp_program = "yt-dlp",
      .user_agent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0 Safari/537.36",
      .resolve_timeout = std::chrono::milliseconds(60000),
      .thumbnail_timeout = std::chrono::milliseconds(5000),
      .stream_stall_timeout = std::chrono::seconds(30)
    };

    session_ = {
      .persist_every_bytes = 1024 * 1024,
      .persist_interval = std::chrono::milliseconds(1000),
      .retention = std::chrono::hours(24),
      .recent_limit = 10,
      .worker_threads = 16
    };

    loadEnvironment();
  }

  void Config::loadEnvironment() {
    if (auto host = env("STREAMDL_HOST")) {
      http_.host = host;
    }
    if (auto port = env("STREAMDL_PORT")) {
      try {
        auto value = std::stoul(port);
        if (value == 0 || value > 65535) {
          throw std::out_of_range(port);
        }
        http_.port = static_cast<unsigned short>(value);
      } catch (const std::exception&) {
        std::cerr << "[config] ignoring invalid STREAMDL_PORT=" << port << std::endl;
      }
    }
    if (auto dir = env("STREAMDL_STORAGE_DIR")) {
      storage_.directory = dir;
    }
    if (auto ffmpeg = env("STREAMDL_FFMPEG")) {
      engine_.ffmpeg_program = ffmpeg;
    }
    if (auto ytdlp = env("STREAMDL_YTDLP")) {
      provider_.ytdlp_program = ytdlp;
    }
  }
}
