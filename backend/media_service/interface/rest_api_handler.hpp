#pragma once
#include "application/artifact_catalog.hpp"
#include "application/download_server.hpp"
#include "application/job_orchestrator.hpp"
#include "application/status_query.hpp"
#include "common/restful/rest_api_handler_base.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace media_service {

class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<JobOrchestrator> orchestrator,
                 std::shared_ptr<StatusQuery> status_query,
                 std::shared_ptr<DownloadServer> download_server,
                 std::shared_ptr<ArtifactCatalog> catalog);

  static http::status statusFor(ErrorKind kind);

protected:
  common::RestResponse doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<JobOrchestrator> orchestrator_;
  std::shared_ptr<StatusQuery> status_query_;
  std::shared_ptr<DownloadServer> download_server_;
  std::shared_ptr<ArtifactCatalog> catalog_;

  http::response<http::string_body> handleSubmitJob(const nlohmann::json &body);
  http::response<http::string_body> handleGetProgress(const std::string &job_id);
  http::response<http::string_body> handleGetJob(const std::string &job_id);
  http::response<http::string_body> handleRegisterArtifact(const nlohmann::json &body);
  http::response<http::string_body> handleListArtifacts();
  http::response<http::string_body> handleGetArtifact(ArtifactId id);
  http::response<http::string_body> handleGetStatus(ArtifactId id);
  common::RestResponse handleDownload(ArtifactId id, std::optional<std::string_view> range);

  http::response<http::string_body> createServiceErrorResponse(const ServiceError &error);
};

} // namespace media_service
