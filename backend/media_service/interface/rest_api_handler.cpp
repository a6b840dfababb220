#include "rest_api_handler.hpp"

#include <charconv>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <vector>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

namespace media_service {

namespace {

// "/artifacts/12/status?x=1" -> {"artifacts", "12", "status"}
std::vector<std::string> splitTarget(std::string_view target) {
  auto query = target.find('?');
  if (query != std::string_view::npos) {
    target = target.substr(0, query);
  }
  std::vector<std::string> segments;
  boost::algorithm::split(segments, target, boost::algorithm::is_any_of("/"));
  std::erase_if(segments, [](const std::string &segment) { return segment.empty(); });
  return segments;
}

std::optional<ArtifactId> parseArtifactId(const std::string &text) {
  if (text.empty() || text.front() == '-' || text.front() == '+') {
    return std::nullopt;
  }
  ArtifactId id{0};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return id;
}

std::string headerSafe(std::string name) {
  std::erase_if(name, [](char c) { return c == '"' || c == '\\' || c == '\r' || c == '\n'; });
  return name;
}

nlohmann::json failureJson(const std::optional<TranscodeFailureRecord> &failure) {
  if (!failure) {
    return nullptr;
  }
  return {{"jobId", failure->job_id}, {"message", failure->message}};
}

// 2024-05-01T12:30:00Z
std::string isoTimestamp(std::chrono::system_clock::time_point time) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buffer[32];
  const auto length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer, length);
}

nlohmann::json artifactJson(const MediaArtifact &artifact) {
  nlohmann::json json = {
    {"id", artifact.id},
    {"filename", artifact.filename},
    {"sourcePath", artifact.source_path},
    {"size", artifact.size},
    {"mediaType", toString(artifact.media_type)},
    {"specs", artifact.specs},
    {"createdAt", isoTimestamp(artifact.created_at)},
    {"isReEncoded", artifact.isReEncoded()},
    {"lastFailure", failureJson(artifact.last_failure)}
  };
  if (artifact.re_encoded) {
    json["reEncodedPath"] = artifact.re_encoded->path;
    json["reEncodedSize"] = artifact.re_encoded->size;
    json["reEncodedBitrate"] = artifact.re_encoded->bitrate;
  }
  return json;
}

} // namespace

RestApiHandler::RestApiHandler(std::shared_ptr<JobOrchestrator> orchestrator,
                               std::shared_ptr<StatusQuery> status_query,
                               std::shared_ptr<DownloadServer> download_server,
                               std::shared_ptr<ArtifactCatalog> catalog)
    : orchestrator_(orchestrator),
      status_query_(status_query),
      download_server_(download_server),
      catalog_(catalog) {}

http::status RestApiHandler::statusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation: return http::status::bad_request;
    case ErrorKind::NotFound: return http::status::not_found;
    case ErrorKind::NotReady: return http::status::bad_request;
    case ErrorKind::RangeNotSatisfiable: return http::status::range_not_satisfiable;
    case ErrorKind::TranscodeFailure: return http::status::internal_server_error;
    case ErrorKind::Internal: return http::status::internal_server_error;
  }
  return http::status::internal_server_error;
}

http::response<http::string_body>
RestApiHandler::createServiceErrorResponse(const ServiceError &error) {
  if (error.kind == ErrorKind::Internal) {
    LOG_ERROR("api", error.message);
  }
  return createErrorResponse(statusFor(error.kind), error.message);
}

common::RestResponse RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  const auto target = req.target();
  const auto segments = splitTarget(std::string_view(target.data(), target.size()));
  const auto method = req.method();

  try {
    if (segments.size() == 1 && segments[0] == "jobs" && method == http::verb::post) {
      return handleSubmitJob(parseRequestBody(req.body()));
    }
    if (segments.size() == 3 && segments[0] == "jobs" && segments[2] == "progress" &&
        method == http::verb::get) {
      return handleGetProgress(segments[1]);
    }
    if (segments.size() == 2 && segments[0] == "jobs" && method == http::verb::get) {
      return handleGetJob(segments[1]);
    }
    if (segments.size() == 1 && segments[0] == "artifacts" && method == http::verb::post) {
      return handleRegisterArtifact(parseRequestBody(req.body()));
    }
    if (segments.size() == 1 && segments[0] == "artifacts" && method == http::verb::get) {
      return handleListArtifacts();
    }

    if (segments.size() >= 2 && segments.size() <= 3 && segments[0] == "artifacts" &&
        method == http::verb::get) {
      auto id = parseArtifactId(segments[1]);
      if (!id) {
        return createErrorResponse(http::status::bad_request, "Invalid ID");
      }
      if (segments.size() == 2) {
        return handleGetArtifact(*id);
      }
      if (segments[2] == "status") {
        return handleGetStatus(*id);
      }
      if (segments[2] == "download") {
        std::optional<std::string_view> range;
        if (auto it = req.find(http::field::range); it != req.end()) {
          range = std::string_view(it->value().data(), it->value().size());
        }
        return handleDownload(*id, range);
      }
    }
  } catch (const std::invalid_argument &e) {
    return createErrorResponse(http::status::bad_request, e.what());
  }

  return createErrorResponse(http::status::not_found, "Endpoint not found");
}

http::response<http::string_body>
RestApiHandler::handleSubmitJob(const nlohmann::json &body) {
  if (!body.contains("mediaArtifactId") || !body["mediaArtifactId"].is_number_integer()) {
    return createErrorResponse(http::status::bad_request, "mediaArtifactId must be an integer");
  }
  if (!body.contains("targetBitrate") || !body["targetBitrate"].is_string()) {
    return createErrorResponse(http::status::bad_request, "targetBitrate must be a string");
  }

  auto stream_type = StreamType::Video;
  if (body.contains("streamType")) {
    const auto &value = body["streamType"];
    auto parsed = value.is_string() ? parseStreamType(value.get<std::string>()) : std::nullopt;
    if (!parsed) {
      return createErrorResponse(http::status::bad_request, "streamType must be \"video\" or \"audio\"");
    }
    stream_type = *parsed;
  }

  const auto artifact_id = body["mediaArtifactId"].get<ArtifactId>();
  auto job_id = orchestrator_->submit(artifact_id, body["targetBitrate"].get<std::string>(), stream_type);
  if (!job_id) {
    return createServiceErrorResponse(job_id.error());
  }

  nlohmann::json response_json = {
    {"success", true},
    {"jobId", *job_id},
    {"mediaArtifactId", artifact_id},
    {"progress", 0}
  };
  return createJsonResponse(http::status::accepted, response_json);
}

http::response<http::string_body>
RestApiHandler::handleGetProgress(const std::string &job_id) {
  nlohmann::json response_json = {
    {"success", true},
    {"progress", status_query_->progressOf(job_id)}
  };
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::handleGetJob(const std::string &job_id) {
  auto job = status_query_->jobOf(job_id);
  if (!job) {
    return createServiceErrorResponse(job.error());
  }

  nlohmann::json response_json = {
    {"success", true},
    {"jobId", job->job_id},
    {"mediaArtifactId", job->artifact_id},
    {"targetBitrate", job->target_bitrate},
    {"streamType", toString(job->stream_type)},
    {"state", toString(job->state)},
    {"progress", status_query_->progressOf(job_id)}
  };
  if (job->state == JobState::Failed) {
    response_json["error"] = job->error;
  } else if (job->state == JobState::Succeeded) {
    response_json["progress"] = 100;
  }
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::handleRegisterArtifact(const nlohmann::json &body) {
  if (!body.contains("path") || !body["path"].is_string()) {
    return createErrorResponse(http::status::bad_request, "path must be a string");
  }

  std::string filename;
  if (body.contains("filename")) {
    if (!body["filename"].is_string() || body["filename"].get<std::string>().empty()) {
      return createErrorResponse(http::status::bad_request, "filename must be a non-empty string");
    }
    filename = body["filename"].get<std::string>();
  }

  auto artifact = catalog_->registerArtifact(body["path"].get<std::string>(), filename);
  if (!artifact) {
    return createServiceErrorResponse(artifact.error());
  }

  auto response_json = artifactJson(*artifact);
  response_json["success"] = true;
  return createJsonResponse(http::status::created, response_json);
}

http::response<http::string_body>
RestApiHandler::handleListArtifacts() {
  auto artifacts = catalog_->list();
  if (!artifacts) {
    return createServiceErrorResponse(artifacts.error());
  }

  auto items = nlohmann::json::array();
  for (const auto &artifact : *artifacts) {
    items.push_back(artifactJson(artifact));
  }
  nlohmann::json response_json = {
    {"success", true},
    {"artifacts", std::move(items)}
  };
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::handleGetArtifact(ArtifactId id) {
  auto artifact = status_query_->artifactOf(id);
  if (!artifact) {
    return createServiceErrorResponse(artifact.error());
  }
  auto response_json = artifactJson(*artifact);
  response_json["success"] = true;
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::handleGetStatus(ArtifactId id) {
  auto status = status_query_->statusOf(id);
  if (!status) {
    return createServiceErrorResponse(status.error());
  }

  nlohmann::json response_json = {
    {"success", true},
    {"isReEncoded", status->is_re_encoded},
    {"lastFailure", failureJson(status->last_failure)}
  };
  if (status->is_re_encoded) {
    response_json["reEncodedBitrate"] = *status->re_encoded_bitrate;
    response_json["size"] = *status->size;
    response_json["artifactExists"] = *status->artifact_exists;
  }
  return createJsonResponse(http::status::ok, response_json);
}

common::RestResponse RestApiHandler::handleDownload(ArtifactId id, std::optional<std::string_view> range) {
  auto plan = download_server_->prepare(id, range);
  if (!plan) {
    return createServiceErrorResponse(plan.error());
  }

  if (plan->disposition == DownloadPlan::Disposition::Unsatisfiable) {
    auto res = createErrorResponse(http::status::range_not_satisfiable, "Requested range not satisfiable");
    res.set(http::field::content_range, plan->contentRange());
    res.set(http::field::accept_ranges, "bytes");
    return res;
  }

  const bool partial = plan->disposition == DownloadPlan::Disposition::Partial;
  http::response<http::string_body> res{partial ? http::status::partial_content : http::status::ok, 11};
  res.set(http::field::content_type, "application/octet-stream");
  res.set(http::field::accept_ranges, "bytes");
  res.set(http::field::content_disposition,
          "attachment; filename=\"" + headerSafe(plan->filename) + "\"");
  if (partial) {
    res.set(http::field::content_range, plan->contentRange());
  }
  res.content_length(plan->length());

  common::RestResponse response{std::move(res)};
  response.file = common::FileSlice{plan->path, plan->offset(), plan->length()};
  return response;
}

} // namespace media_service
