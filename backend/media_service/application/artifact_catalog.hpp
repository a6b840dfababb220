#pragma once

#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "domain/artifact_repository.hpp"
#include "domain/media_probe.hpp"
#include "domain/service_error.hpp"

namespace media_service {

// Registers staged source files together with what the probe says about them
class ArtifactCatalog {
public:
  ArtifactCatalog(std::shared_ptr<ArtifactRepository> repository,
                  std::shared_ptr<MediaProbe> probe);

  // NotFound when nothing is at path, Validation when it holds no readable
  // audio or video. An empty filename falls back to the file's own name.
  std::expected<MediaArtifact, ServiceError> registerArtifact(const std::string& path,
                                                              const std::string& filename);

  std::expected<std::vector<MediaArtifact>, ServiceError> list() const;

private:
  std::shared_ptr<ArtifactRepository> repository_;
  std::shared_ptr<MediaProbe> probe_;
};

} // namespace media_service
