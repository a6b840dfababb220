#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "domain/artifact_repository.hpp"
#include "domain/service_error.hpp"

namespace media_service {

// Inclusive byte span
struct ByteRange {
  std::uint64_t first{0};
  std::uint64_t last{0};

  std::uint64_t length() const { return last - first + 1; }
};

// Interprets a Range header against a resource of `file_size` bytes.
// nullopt: no usable range, serve the whole file.
// RangeNotSatisfiable: start beyond the end, or start after end.
std::expected<std::optional<ByteRange>, ServiceError> resolveByteRange(std::string_view header,
                                                                       std::uint64_t file_size);

struct DownloadPlan {
  enum class Disposition { Full, Partial, Unsatisfiable };

  Disposition disposition{Disposition::Full};
  std::filesystem::path path;
  std::string filename;           // suggested name for Content-Disposition
  std::uint64_t file_size{0};
  std::optional<ByteRange> range; // set when Partial

  std::uint64_t offset() const { return range ? range->first : 0; }
  std::uint64_t length() const { return range ? range->length() : file_size; }
  // "bytes first-last/size", or "bytes */size" when unsatisfiable
  std::string contentRange() const;
};

class DownloadServer {
public:
  explicit DownloadServer(std::shared_ptr<ArtifactRepository> repository);

  // NotFound: unknown artifact or output gone from disk.
  // NotReady: artifact has not been re-encoded yet.
  std::expected<DownloadPlan, ServiceError> prepare(
    ArtifactId artifact_id,
    std::optional<std::string_view> range_header
  ) const;

  // "<source stem>_reencoded_<bitrate><output extension>"
  static std::string downloadFilename(const MediaArtifact& artifact);

private:
  std::shared_ptr<ArtifactRepository> repository_;
};

} // namespace media_service
