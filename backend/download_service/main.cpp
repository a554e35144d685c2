#include "application/download_registry.hpp"
#include "application/download_service.hpp"
#include "application/pipeline_builder.hpp"
#include "infrastructure/downloader.hpp"
#include "infrastructure/json_file_download_repository.hpp"
#include "infrastructure/subprocess_transcoder.hpp"
#include "infrastructure/temp_artifact_store.hpp"
#include "infrastructure/ytdlp_media_provider.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include "common/thread_pool.hpp"
#include "interface/rest_api_handler.hpp"
#include <csignal>
#include <filesystem>
#include <iostream>
#include <boost/asio.hpp>

int main(int argc, char** argv) {
  try {
    // Client and engine pipes report EPIPE instead of killing the process
    std::signal(SIGPIPE, SIG_IGN);

    const auto& cfg = config::Config::getInstance();
    const auto& storage = cfg.getStorage();
    std::filesystem::create_directories(storage.directory);

    std::shared_ptr<download_service::DownloadRepository> repository =
      std::make_shared<download_service::JsonFileDownloadRepository>(storage.directory);
    auto artifacts = std::make_shared<download_service::TempArtifactStore>(storage.directory);

    const auto& provider_config = cfg.getProvider();
    auto downloader = std::make_shared<download_service::Downloader>(
      provider_config.user_agent,
      provider_config.stream_stall_timeout
    );
    std::shared_ptr<download_service::MediaProvider> provider =
      std::make_shared<download_service::YtDlpMediaProvider>(
        provider_config.ytdlp_program,
        downloader,
        provider_config.resolve_timeout
      );

    const auto& engine_config = cfg.getEngine();
    auto transcoder = std::make_shared<download_service::SubprocessTranscoder>(
      engine_config.ffmpeg_program,
      engine_config.stop_grace
    );
    if (!transcoder->available()) {
      std::cerr << "Warning: " << engine_config.ffmpeg_program
                << " not found, downloads will fail until it is installed" << std::endl;
    }

    auto builder = std::make_shared<download_service::PipelineBuilder>(
      provider, transcoder, provider_config.thumbnail_timeout
    );

    const auto& session_config = cfg.getSession();
    download_service::DownloadServiceOptions options;
    options.progress.persist_every_bytes = session_config.persist_every_bytes;
    options.progress.persist_interval = session_config.persist_interval;
    options.retention = session_config.retention;
    options.keep_artifact_on_complete = storage.keep_artifact_on_complete;

    auto download_service = std::make_shared<download_service::DownloadService>(
      repository, artifacts, provider, builder,
      std::make_shared<download_service::DownloadRegistry>(), options
    );
    download_service->restoreSchedules();

    // Start REST API server
    const auto& http_config = cfg.getHttp();
    boost::asio::io_context ioc{1};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(http_config.host),
      http_config.port
    };

    auto api_handler = std::make_shared<download_service::RestApiHandler>(
      download_service, session_config.recent_limit);
    common::HttpServer http_server{ioc, http_endpoint, api_handler, http_config.read_timeout};

    boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
    signals.async_wait([&ioc](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        std::cout << "Received signal " << signal_number << ", shutting down" << std::endl;
        ioc.stop();
      }
    });

    std::cout << "HTTP Server listening on " << cfg.getHttpIpPort() << std::endl;
    std::cout << "Storing downloads in " << storage.directory << std::endl;

    http_server.run();
    ioc.run();

    // Live downloads are paused so they can be resumed after a restart
    download_service->shutdown();
    ThreadPool::getInstance().stop();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
