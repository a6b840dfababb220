#include "download_server.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>

namespace media_service {

namespace {

std::string_view trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
  return text;
}

std::optional<std::uint64_t> parseOffset(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::uint64_t value{0};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::expected<std::optional<ByteRange>, ServiceError> resolveByteRange(std::string_view header,
                                                                       std::uint64_t file_size) {
  constexpr std::string_view prefix{"bytes="};
  header = trim(header);
  if (header.substr(0, prefix.size()) != prefix) {
    return std::nullopt;
  }
  auto range_set = trim(header.substr(prefix.size()));
  // multiple ranges are not served as multipart, fall back to the full body
  if (range_set.find(',') != std::string_view::npos) {
    return std::nullopt;
  }
  auto dash = range_set.find('-');
  if (dash == std::string_view::npos) {
    return std::nullopt;
  }
  auto first_text = trim(range_set.substr(0, dash));
  auto last_text = trim(range_set.substr(dash + 1));

  if (first_text.empty()) {
    // suffix form: the final N bytes
    auto suffix = parseOffset(last_text);
    if (!suffix) {
      return std::nullopt;
    }
    if (*suffix == 0 || file_size == 0) {
      return makeError(ErrorKind::RangeNotSatisfiable, "Requested range not satisfiable");
    }
    auto length = std::min(*suffix, file_size);
    return ByteRange{file_size - length, file_size - 1};
  }

  auto first = parseOffset(first_text);
  if (!first) {
    return std::nullopt;
  }
  std::optional<std::uint64_t> last;
  if (!last_text.empty()) {
    last = parseOffset(last_text);
    if (!last) {
      return std::nullopt;
    }
  }

  if (*first >= file_size) {
    return makeError(ErrorKind::RangeNotSatisfiable, "Requested range not satisfiable");
  }
  if (last && *last < *first) {
    return makeError(ErrorKind::RangeNotSatisfiable, "Requested range not satisfiable");
  }

  auto clamped_last = last ? std::min(*last, file_size - 1) : file_size - 1;
  return ByteRange{*first, clamped_last};
}

std::string DownloadPlan::contentRange() const {
  if (disposition == Disposition::Unsatisfiable || !range) {
    return "bytes */" + std::to_string(file_size);
  }
  return "bytes " + std::to_string(range->first) + "-" + std::to_string(range->last)
         + "/" + std::to_string(file_size);
}

DownloadServer::DownloadServer(std::shared_ptr<ArtifactRepository> repository)
  : repository_(repository) {}

std::string DownloadServer::downloadFilename(const MediaArtifact& artifact) {
  std::filesystem::path source{artifact.filename.empty() ? artifact.source_path : artifact.filename};
  std::string name = source.stem().string() + "_reencoded";
  if (artifact.re_encoded) {
    name += "_" + artifact.re_encoded->bitrate;
    name += std::filesystem::path(artifact.re_encoded->path).extension().string();
  } else {
    name += source.extension().string();
  }
  return name;
}

std::expected<DownloadPlan, ServiceError> DownloadServer::prepare(
  ArtifactId artifact_id,
  std::optional<std::string_view> range_header
) const {
  auto artifact = repository_->findById(artifact_id);
  if (!artifact) {
    return makeError(ErrorKind::Internal, artifact.error());
  }
  if (!*artifact) {
    return makeError(ErrorKind::NotFound, "Media file not found");
  }
  const auto& media = **artifact;
  if (!media.isReEncoded()) {
    return makeError(ErrorKind::NotReady, "Media file has not been re-encoded");
  }

  std::error_code ec;
  const std::filesystem::path path{media.re_encoded->path};
  if (!std::filesystem::is_regular_file(path, ec)) {
    return makeError(ErrorKind::NotFound, "Re-encoded file not found on server");
  }
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return makeError(ErrorKind::NotFound, "Re-encoded file not readable: " + ec.message());
  }

  DownloadPlan plan;
  plan.path = path;
  plan.filename = downloadFilename(media);
  plan.file_size = size;

  if (range_header) {
    auto range = resolveByteRange(*range_header, size);
    if (!range) {
      LOG_DEBUG("download", "Range '" << *range_header << "' not satisfiable for " << size << " bytes");
      plan.disposition = DownloadPlan::Disposition::Unsatisfiable;
      return plan;
    }
    if (*range) {
      plan.disposition = DownloadPlan::Disposition::Partial;
      plan.range = **range;
      LOG_DEBUG("download", "Range requested = " << plan.range->first << "-" << plan.range->last);
    }
  }
  return plan;
}

} // namespace media_service
