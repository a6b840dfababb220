#pragma once

// project
#include "domain/media_probe.hpp"

// ffmpeg
extern "C" {
  #include <libavcodec/avcodec.h>
  #include <libavformat/avformat.h>
  #include <libavutil/log.h>
}

namespace media_service {

// Reads container duration, stream kinds and a per-stream summary through libavformat
class AvFormatMediaProbe : public MediaProbe {
public:
  explicit AvFormatMediaProbe(int loglevel = AV_LOG_ERROR);

  std::expected<MediaProbeResult, std::string> probe(const std::string& path) override;
};

} // namespace media_service
