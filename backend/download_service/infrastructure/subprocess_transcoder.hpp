// subprocess_transcoder.hpp
#pragma once

#include "domain/transcoding_engine.hpp"
#include "infrastructure/subprocess.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace download_service {

// Runs the engine binary (ffmpeg by default) as a child process. The argument
// vector passed to spawn() excludes the program name.
class SubprocessTranscoder : public TranscodingEngine {
public:
  explicit SubprocessTranscoder(std::string program = "ffmpeg",
                                std::chrono::milliseconds stop_grace = std::chrono::milliseconds(1000));
  ~SubprocessTranscoder() override;

  Result<std::unique_ptr<EngineProcess>> spawn(
    const std::vector<std::string>& args,
    std::size_t input_count) override;

  bool available() const { return available_; }

private:
  bool checkInstalled() const;

  std::string program_;
  std::chrono::milliseconds stop_grace_;
  bool available_;
};

} // namespace download_service
