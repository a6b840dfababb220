#pragma once
#include "media_specs.hpp"
#include <chrono>
#include <expected>
#include <string>

namespace media_service {

struct MediaProbeResult {
  std::chrono::microseconds duration{0};   // zero when the container does not say
  bool has_video{false};                   // attached pictures (cover art) excluded
  bool has_audio{false};
  bool has_attached_picture{false};
  MediaSpecs specs;
};

class MediaProbe {
public:
  virtual ~MediaProbe() = default;
  virtual std::expected<MediaProbeResult, std::string> probe(const std::string& path) = 0;
};

} // namespace media_service
