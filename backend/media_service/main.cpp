#include "application/artifact_catalog.hpp"
#include "application/download_server.hpp"
#include "application/job_orchestrator.hpp"
#include "application/job_registry.hpp"
#include "application/output_cleaner.hpp"
#include "application/progress_tracker.hpp"
#include "application/status_query.hpp"
#include "common/config/config.hpp"
#include "common/connection_pool/mysql_connection_pool.hpp"
#include "common/logger.hpp"
#include "common/restful/http_server.hpp"
#include "infrastructure/avformat_media_probe.hpp"
#include "infrastructure/memory_artifact_repository.hpp"
#include "infrastructure/mysql_artifact_repository.hpp"
#include "infrastructure/subprocess_transcoder.hpp"
#include "interface/rest_api_handler.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

namespace {

std::shared_ptr<media_service::ArtifactRepository> makeRepository(const config::StorageConfig& storage) {
  if (storage.backend == "memory") {
    return std::make_shared<media_service::MemoryArtifactRepository>();
  }
  if (storage.backend == "mysql") {
    return std::make_shared<media_service::MysqlArtifactRepository>(
      common::MySQLConnectionPool::getInstance());
  }
  throw std::invalid_argument("Unknown storage backend: " + storage.backend);
}

} // namespace

int main(int argc, char** argv) {
  try {
    const auto& cfg = config::Config::getInstance();

    const auto level = common::parseLogLevel(cfg.getLogging().level);
    if (!level) {
      throw std::invalid_argument("Unknown log level: " + cfg.getLogging().level);
    }
    common::Logger::setLevel(*level);

    auto repository = makeRepository(cfg.getStorage());
    auto tracker = std::make_shared<media_service::ProgressTracker>();
    auto registry = std::make_shared<media_service::JobRegistry>(cfg.getJobs().history_limit);

    std::shared_ptr<media_service::MediaProbe> probe =
      std::make_shared<media_service::AvFormatMediaProbe>();
    std::shared_ptr<media_service::TranscodingService> transcoding_service =
      std::make_shared<media_service::SubprocessTranscoder>(cfg.getTranscode(), tracker, probe);

    auto orchestrator = std::make_shared<media_service::JobOrchestrator>(
      repository, transcoding_service, registry);
    auto status_query = std::make_shared<media_service::StatusQuery>(repository, tracker, registry);
    auto download_server = std::make_shared<media_service::DownloadServer>(repository);
    auto catalog = std::make_shared<media_service::ArtifactCatalog>(repository, probe);

    auto api_handler = std::make_shared<media_service::RestApiHandler>(
      orchestrator, status_query, download_server, catalog);

    const auto& http_config = cfg.getHttp();
    const int threads = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    boost::asio::io_context ioc{threads};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(http_config.host),
      http_config.port
    };

    common::HttpServer http_server{ioc, http_endpoint, api_handler};
    media_service::OutputCleaner cleaner{ioc, repository, cfg.getCleanup()};
    LOG_INFO("main", "HTTP Server listening on " << cfg.getHttpIpPort()
                     << " (storage: " << cfg.getStorage().backend << ")");

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code&, int signal_number) {
      LOG_INFO("main", "Signal " << signal_number << " received, shutting down");
      ioc.stop();
    });

    http_server.run();
    cleaner.start();

    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    for (int i = 1; i < threads; ++i) {
      workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();

    for (auto& worker : workers) {
      worker.join();
    }

    // queued transcodes finish before the transcoder is destroyed
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
