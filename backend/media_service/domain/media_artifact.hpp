#pragma once
#include "media_specs.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace media_service {

using ArtifactId = std::int64_t;

enum class StreamType { Video, Audio };

constexpr std::string_view toString(StreamType type) {
  return type == StreamType::Video ? "video" : "audio";
}

inline std::optional<StreamType> parseStreamType(std::string_view text) {
  if (text == "video") return StreamType::Video;
  if (text == "audio") return StreamType::Audio;
  return std::nullopt;
}

// Result of a successful re-encode, always stored as a whole
struct ReEncodedOutput {
  std::string path;
  std::uint64_t size{0};
  std::string bitrate;     // canonical literal, e.g. "500k"
};

struct TranscodeFailureRecord {
  std::string job_id;
  std::string message;
};

// Everything known about a source file when it is registered
struct NewArtifact {
  std::string filename;
  std::string source_path;
  std::uint64_t size{0};
  StreamType media_type{StreamType::Video};   // video when any non-cover video stream exists
  MediaSpecs specs;
  std::chrono::system_clock::time_point created_at;
};

struct MediaArtifact {
  ArtifactId id{0};
  std::string filename;      // name the client uploaded the file under
  std::string source_path;
  std::uint64_t size{0};
  StreamType media_type{StreamType::Video};
  MediaSpecs specs;
  std::chrono::system_clock::time_point created_at;
  std::optional<ReEncodedOutput> re_encoded;
  std::optional<TranscodeFailureRecord> last_failure;

  bool isReEncoded() const { return re_encoded.has_value(); }
};

} // namespace media_service
