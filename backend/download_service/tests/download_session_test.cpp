#include "application/download_session.hpp"
#include "domain/download_repository.hpp"
#include "infrastructure/json_file_download_repository.hpp"
#include "infrastructure/subprocess_transcoder.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <fstream>
#include <gtest/gtest.h>
#include <utility>

using namespace download_service;
using namespace download_service::test_support;

namespace {

constexpr std::size_t kSize = 1000000;
const std::string kThumbnail = "https://i.ytimg.com/vi/dQw4w9WgXcQ/maxresdefault.jpg";

bool processGone(pid_t pid) {
  return ::kill(pid, 0) != 0 && errno == ESRCH;
}

std::vector<std::uint8_t> pngBytes() {
  std::vector<std::uint8_t> image{0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
  auto tail = patternBytes(5000, 3);
  image.insert(image.end(), tail.begin(), tail.end());
  return image;
}

std::vector<std::uint8_t> concat(std::vector<std::uint8_t> head, const std::vector<std::uint8_t>& tail) {
  head.insert(head.end(), tail.begin(), tail.end());
  return head;
}

// Passes everything through and remembers what each save carried.
class RecordingRepository : public DownloadRepository {
public:
  explicit RecordingRepository(std::shared_ptr<DownloadRepository> inner) : inner_(std::move(inner)) {}

  Result<std::optional<DownloadRecord>> load(const std::string& id) override { return inner_->load(id); }

  Result<void> save(const DownloadRecord& record) override {
    {
      std::lock_guard<std::mutex> lock{mutex_};
      saves_.emplace_back(record.status, record.current_size_bytes);
    }
    if (fail_status && record.status == *fail_status) {
      return makeError(ErrorCode::StorageError, "No space left on device");
    }
    return inner_->save(record);
  }

  Result<void> remove(const std::string& id) override { return inner_->remove(id); }
  Result<std::vector<DownloadRecord>> list() override { return inner_->list(); }

  std::vector<std::pair<DownloadStatus, std::uint64_t>> saves() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return saves_;
  }

  std::optional<DownloadStatus> fail_status;

private:
  std::shared_ptr<DownloadRepository> inner_;
  mutable std::mutex mutex_;
  std::vector<std::pair<DownloadStatus, std::uint64_t>> saves_;
};

} // namespace

class DownloadSessionTest : public ::testing::Test {
protected:
  void SetUp() override {
    provider_->descriptor.display_title = "Session Test";
    provider_->descriptor.formats = {audioFormat("mem://audio", kSize)};
    provider_->setStream("mem://audio", source_);
    useEngine(writeCopyEngine(dir_.path()));

    ctx_.repository = repository_;
    ctx_.artifacts = artifacts_;
    ctx_.progress.persist_every_bytes = 64 * 1024;
    ctx_.progress.persist_interval = std::chrono::milliseconds(50);
    ctx_.on_inactive = [this](const DownloadSession&, SessionState state) {
      std::lock_guard<std::mutex> lock{mutex_};
      inactive_.push_back(state);
    };
  }

  void useEngine(const std::filesystem::path& program) {
    auto engine = std::make_shared<SubprocessTranscoder>(program.string(), std::chrono::milliseconds(500));
    ctx_.builder = std::make_shared<PipelineBuilder>(provider_, engine, std::chrono::seconds(1));
  }

  std::shared_ptr<DownloadSession> makeSession(DownloadStatus status = DownloadStatus::InProgress,
                                               bool want_cover_art = false) {
    auto record = makeRecord(id_, status);
    record.total_size_bytes = kSize;
    return std::make_shared<DownloadSession>(record, provider_->descriptor, want_cover_art, ctx_);
  }

  // Runs until `at` bytes reached the client, then pauses.
  SessionState runAndPauseAt(DownloadSession& session, CollectingSink& sink, std::size_t at) {
    bool paused = false;
    sink.on_write = [&](std::size_t total) {
      if (!paused && total >= at) {
        paused = true;
        EXPECT_TRUE(session.pause().has_value());
      }
    };
    auto state = session.run(sink);
    EXPECT_TRUE(paused);
    return state;
  }

  DownloadRecord storedRecord() {
    auto loaded = repository_->load(id_);
    EXPECT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->has_value());
    return **loaded;
  }

  std::vector<SessionState> inactive() {
    std::lock_guard<std::mutex> lock{mutex_};
    return inactive_;
  }

  TempDir dir_;
  std::string id_ = makeDownloadId(kResourceRef, OutputKind::Audio, "highest");
  std::vector<std::uint8_t> source_ = patternBytes(kSize);
  std::shared_ptr<FakeMediaProvider> provider_ = std::make_shared<FakeMediaProvider>();
  std::shared_ptr<JsonFileDownloadRepository> repository_ =
    std::make_shared<JsonFileDownloadRepository>(dir_.path());
  std::shared_ptr<TempArtifactStore> artifacts_ = std::make_shared<TempArtifactStore>(dir_.path());
  SessionContext ctx_;
  std::mutex mutex_;
  std::vector<SessionState> inactive_;
};

TEST_F(DownloadSessionTest, CompletesAndPersists) {
  auto session = makeSession();
  EXPECT_EQ(session->state(), SessionState::Idle);
  ASSERT_TRUE(session->start(StartMode::fresh()).has_value());
  EXPECT_EQ(session->state(), SessionState::Running);
  EXPECT_EQ(storedRecord().status, DownloadStatus::InProgress);

  CollectingSink sink;
  EXPECT_EQ(session->run(sink), SessionState::Completed);
  EXPECT_EQ(sink.bytes(), source_);
  EXPECT_EQ(readFile(artifacts_->pathFor(id_)), source_);

  auto record = storedRecord();
  EXPECT_EQ(record.status, DownloadStatus::Completed);
  EXPECT_EQ(record.current_size_bytes, kSize);
  ASSERT_TRUE(record.final_size_bytes.has_value());
  EXPECT_EQ(*record.final_size_bytes, kSize);
  EXPECT_TRUE(record.completed_at.has_value());
  EXPECT_EQ(inactive(), std::vector<SessionState>{SessionState::Completed});
}

TEST_F(DownloadSessionTest, PauseThenResumeDeliversIdenticalStream) {
  auto session = makeSession();
  ASSERT_TRUE(session->start(StartMode::fresh()).has_value());

  CollectingSink first;
  bool paused = false;
  first.on_write = [&](std::size_t total) {
    if (!paused && total >= kSize * 40 / 100) {
      paused = true;
      EXPECT_TRUE(session->pause().has_value());
    }
  };
  EXPECT_EQ(session->run(first), SessionState::Paused);
  ASSERT_TRUE(paused);

  auto partial = first.bytes();
  auto record = storedRecord();
  EXPECT_EQ(record.status, DownloadStatus::Paused);
  EXPECT_EQ(record.current_size_bytes, partial.size());
  EXPECT_EQ(artifacts_->size(id_), partial.size());
  EXPECT_TRUE(std::equal(partial.begin(), partial.end(), source_.begin()));

  ASSERT_TRUE(session->resume().has_value());
  CollectingSink second;
  EXPECT_EQ(session->run(second), SessionState::Completed);

  auto full = second.bytes();
  EXPECT_EQ(full, source_);
  EXPECT_TRUE(std::equal(partial.begin(), partial.end(), full.begin()));
  EXPECT_EQ(readFile(artifacts_->pathFor(id_)), source_);
  EXPECT_EQ(storedRecord().status, DownloadStatus::Completed);
  EXPECT_EQ(inactive(), (std::vector<SessionState>{SessionState::Paused, SessionState::Completed}));
}

TEST_F(DownloadSessionTest, SessionBuiltFromPausedRecordResumes) {
  {
    auto writer = artifacts_->open(id_, ArtifactOpenMode::Truncate);
    ASSERT_TRUE(writer.has_value());
    ASSERT_TRUE((*writer)->write(std::span<const std::uint8_t>(source_).first(300000)).has_value());
  }
  auto paused = makeRecord(id_, DownloadStatus::Paused);
  paused.total_size_bytes = kSize;
  paused.current_size_bytes = 300000;
  auto session = std::make_shared<DownloadSession>(paused, provider_->descriptor, false, ctx_);
  EXPECT_EQ(session->state(), SessionState::Paused);

  ASSERT_TRUE(session->resume().has_value());
  CollectingSink sink;
  EXPECT_EQ(session->run(sink), SessionState::Completed);
  EXPECT_EQ(sink.bytes(), source_);
}

TEST_F(DownloadSessionTest, InvalidTransitionsAreRejected) {
  auto session = makeSession();
  auto paused = session->pause();
  ASSERT_FALSE(paused.has_value());
  EXPECT_EQ(paused.error().code, ErrorCode::InvalidState);

  auto resumed = session->resume();
  ASSERT_FALSE(resumed.has_value());
  EXPECT_EQ(resumed.error().code, ErrorCode::InvalidState);

  ASSERT_TRUE(session->start(StartMode::fresh()).has_value());
  auto again = session->start(StartMode::fresh());
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
  session->cleanup();
}

TEST_F(DownloadSessionTest, CancelDeletesRecordAndArtifact) {
  auto session = makeSession();
  ASSERT_TRUE(session->start(StartMode::fresh()).has_value());

  CollectingSink sink;
  sink.on_write = [&](std::size_t total) {
    if (total >= 100000 && session->state() == SessionState::Running) {
      EXPECT_TRUE(session->cancel().has_value());
    }
  };
  EXPECT_EQ(session->run(sink), SessionState::Cancelled);

  auto loaded = repository_->load(id_);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_FALSE(loaded->has_value());
  EXPECT_FALSE(std::filesystem::exists(artifacts_->pathFor(id_)));

  EXPECT_TRUE(session->cancel().has_value());
  EXPECT_FALSE(session->pause().has_value());
  EXPECT_EQ(inactive(), std::vector<SessionState>{SessionState::Cancelled});
}

TEST_F(DownloadSessionTest, ClientDisconnectPausesAndStopsEngine) {
  auto pid_file = dir_.path() / "engine.pid";
  useEngine(writeScript(dir_.path(), "pid-engine",
                        "if [ \"$1\" = \"-version\" ]; then exit 0; fi\n"
                        "echo $$ > '" + pid_file.string() + "'\n"
                        "exec cat <&3"));
  provider_->descriptor.formats = {audioFormat("mem://endless", std::nullopt)};
  provider_->setEndlessStream("mem://endless");

  auto session = makeSession();
  ASSERT_TRUE(session->start(StartMode::fresh()).has_value());

  CollectingSink sink;
  sink.fail_after = 200000;
  auto started = std::chrono::steady_clock::now();
  EXPECT_EQ(session->run(sink), SessionState::Paused);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));

  auto record = storedRecord();
  EXPECT_EQ(record.status, DownloadStatus::Paused);
  EXPECT_GT(record.current_size_bytes, 0u);
  EXPECT_EQ(record.current_size_bytes, artifacts_->size(id_));

  pid_t pid = 0;
  std::ifstream(pid_file) >> pid;
  ASSERT_GT(pid, 0);
  EXPECT_TRUE(processGone(pid));
}

TEST_F(DownloadSessionTest, EngineFailureMarksFailed) {
  useEngine(writeScript(dir_.path(), "bad-engine",
                        "if [ \"$1\" = \"-version\" ]; then exit 0; fi\n"
                        "echo 'invalid data found' >&2\nexit 1"));
  auto session = makeSession();
  ASSERT_TRUE(session->start(StartMode::fresh()).has_value());

  CollectingSink sink;
  EXPECT_EQ(session->run(sink), SessionState::Failed);
  EXPECT_EQ(storedRecord().status, DownloadStatus::Failed);
  EXPECT_EQ(inactive(), std::vector<SessionState>{SessionState::Failed});
}

TEST_F(DownloadSessionTest, UnavailableSourceFailsBeforeStreaming) {
  provider_->descriptor.formats = {audioFormat("mem://missing", kSize)};
  auto session = makeSession();

  auto started = session->start(StartMode::fresh());
  ASSERT_FALSE(started.has_value());
  EXPECT_EQ(started.error().code, ErrorCode::UpstreamError);
  EXPECT_EQ(session->state(), SessionState::Failed);

  CollectingSink sink;
  EXPECT_EQ(session->run(sink), SessionState::Failed);
  EXPECT_EQ(sink.size(), 0u);
}

TEST_F(DownloadSessionTest, VideoFeedsBothInputsAcrossResume) {
  useEngine(writeMuxEngine(dir_.path()));
  auto video = patternBytes(2 * kSize, 11);
  provider_->descriptor.formats = {videoFormat("137", "1080p", 1080, "mp4", 2 * kSize),
                                   audioFormat("mem://audio", kSize)};
  provider_->setStream("mem://137", video);
  auto expected = concat(video, source_);

  auto record = makeRecord(id_, DownloadStatus::InProgress);
  record.output_kind = OutputKind::Video;
  record.quality_selector = "1080p";
  record.total_size_bytes = expected.size();
  auto session = std::make_shared<DownloadSession>(record, provider_->descriptor, false, ctx_);
  ASSERT_TRUE(session->start(StartMode::fresh()).has_value());

  // past the video input, inside the audio one
  CollectingSink first;
  EXPECT_EQ(runAndPauseAt(*session, first, expected.size() * 80 / 100), SessionState::Paused);
  EXPECT_EQ(storedRecord().current_size_bytes, first.size());

  ASSERT_TRUE(session->resume().has_value());
  CollectingSink second;
  EXPECT_EQ(session->run(second), SessionState::Completed);
  EXPECT_EQ(second.bytes(), expected);
  EXPECT_EQ(provider_->open_calls.load(), 4);
}

TEST_F(DownloadSessionTest, CoverArtIsEmbeddedWhenAvailable) {
  useEngine(writeMuxEngine(dir_.path()));
  auto image = pngBytes();
  provider_->descriptor.thumbnail_candidates = {"https://i.ytimg.com/missing.jpg", kThumbnail};
  provider_->setThumbnail(kThumbnail, image);

  auto session = makeSession(DownloadStatus::InProgress, true);
  ASSERT_TRUE(session->start(StartMode::fresh()).has_value());
  CollectingSink sink;
  EXPECT_EQ(session->run(sink), SessionState::Completed);
  EXPECT_EQ(sink.bytes(), concat(source_, image));
  EXPECT_TRUE(storedRecord().cover_art);
}

TEST_F(DownloadSessionTest, MissingCoverArtFallsBackToPlainAudio) {
  useEngine(writeMuxEngine(dir_.path()));
  provider_->descriptor.thumbnail_candidates = {kThumbnail};

  auto session = makeSession(DownloadStatus::InProgress, true);
  ASSERT_TRUE(session->start(StartMode::fresh()).has_value());
  CollectingSink sink;
  EXPECT_EQ(session->run(sink), SessionState::Completed);
  EXPECT_EQ(sink.bytes(), source_);
  EXPECT_FALSE(storedRecord().cover_art);
}

TEST_F(DownloadSessionTest, ResumeWithoutItsCoverArtStaysPaused) {
  useEngine(writeMuxEngine(dir_.path()));
  auto image = pngBytes();
  auto expected = concat(source_, image);
  provider_->descriptor.thumbnail_candidates = {kThumbnail};
  provider_->setThumbnail(kThumbnail, image);

  auto session = makeSession(DownloadStatus::InProgress, true);
  ASSERT_TRUE(session->start(StartMode::fresh()).has_value());
  CollectingSink first;
  EXPECT_EQ(runAndPauseAt(*session, first, kSize * 40 / 100), SessionState::Paused);
  auto partial = first.size();
  ASSERT_TRUE(storedRecord().cover_art);

  provider_->clearThumbnail(kThumbnail);
  auto resumed = session->resume();
  ASSERT_FALSE(resumed.has_value());
  EXPECT_EQ(resumed.error().code, ErrorCode::UpstreamError);
  EXPECT_EQ(session->state(), SessionState::Paused);

  auto record = storedRecord();
  EXPECT_EQ(record.status, DownloadStatus::Paused);
  EXPECT_TRUE(record.cover_art);
  EXPECT_EQ(record.current_size_bytes, partial);
  EXPECT_EQ(artifacts_->size(id_), partial);

  provider_->setThumbnail(kThumbnail, image);
  ASSERT_TRUE(session->resume().has_value());
  CollectingSink second;
  EXPECT_EQ(session->run(second), SessionState::Completed);
  EXPECT_EQ(second.bytes(), expected);
  EXPECT_TRUE(storedRecord().cover_art);
  EXPECT_EQ(inactive(), (std::vector<SessionState>{SessionState::Paused, SessionState::Paused,
                                                   SessionState::Completed}));
}

TEST_F(DownloadSessionTest, StoredSizeNeverShrinksWhileUnfinished) {
  auto recording = std::make_shared<RecordingRepository>(repository_);
  ctx_.repository = recording;
  ctx_.progress.persist_every_bytes = 16 * 1024;

  auto session = makeSession();
  ASSERT_TRUE(session->start(StartMode::fresh()).has_value());
  CollectingSink first;
  EXPECT_EQ(runAndPauseAt(*session, first, kSize / 2), SessionState::Paused);
  ASSERT_TRUE(session->resume().has_value());
  CollectingSink second;
  EXPECT_EQ(session->run(second), SessionState::Completed);

  auto saves = recording->saves();
  ASSERT_GT(saves.size(), 4u);
  std::uint64_t previous = 0;
  for (const auto& [status, size] : saves) {
    if (status == DownloadStatus::InProgress || status == DownloadStatus::Paused) {
      EXPECT_GE(size, previous);
      previous = size;
    }
  }
  EXPECT_EQ(saves.back().first, DownloadStatus::Completed);
  EXPECT_EQ(saves.back().second, kSize);
}

TEST_F(DownloadSessionTest, UnrecordedCompletionIsNotReportedAsCompleted) {
  auto recording = std::make_shared<RecordingRepository>(repository_);
  recording->fail_status = DownloadStatus::Completed;
  ctx_.repository = recording;

  auto session = makeSession();
  ASSERT_TRUE(session->start(StartMode::fresh()).has_value());
  CollectingSink sink;
  EXPECT_EQ(session->run(sink), SessionState::Failed);
  EXPECT_EQ(session->record().status, DownloadStatus::Failed);

  auto stored = storedRecord();
  EXPECT_EQ(stored.status, DownloadStatus::InProgress);
  EXPECT_FALSE(stored.completed_at.has_value());
  EXPECT_FALSE(stored.final_size_bytes.has_value());
  EXPECT_EQ(inactive(), std::vector<SessionState>{SessionState::Failed});
}
