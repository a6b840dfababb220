#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace media_service {

// Container level facts, as libavformat reports them
struct FormatSpec {
  std::string format_name;        // e.g. "mov,mp4,m4a,3gp,3g2,mj2"
  std::string format_long_name;
  double duration{0.0};           // seconds, 0 when unknown
  std::int64_t bit_rate{0};
  unsigned int nb_streams{0};
};

struct StreamSpec {
  int index{0};
  std::string codec_type;         // "video", "audio", "subtitle", ...
  std::string codec_name;
  std::string codec_long_name;
  int width{0};
  int height{0};
  std::int64_t bit_rate{0};
  int sample_rate{0};
  int channels{0};
  bool attached_picture{false};
};

struct MediaSpecs {
  FormatSpec format;
  std::vector<StreamSpec> streams;
};

inline void to_json(nlohmann::json& j, const FormatSpec& format) {
  j = nlohmann::json{
    {"format_name", format.format_name},
    {"format_long_name", format.format_long_name},
    {"duration", format.duration},
    {"bit_rate", format.bit_rate},
    {"nb_streams", format.nb_streams}
  };
}

inline void from_json(const nlohmann::json& j, FormatSpec& format) {
  format.format_name = j.value("format_name", std::string{});
  format.format_long_name = j.value("format_long_name", std::string{});
  format.duration = j.value("duration", 0.0);
  format.bit_rate = j.value("bit_rate", std::int64_t{0});
  format.nb_streams = j.value("nb_streams", 0u);
}

inline void to_json(nlohmann::json& j, const StreamSpec& stream) {
  j = nlohmann::json{
    {"index", stream.index},
    {"codec_type", stream.codec_type},
    {"codec_name", stream.codec_name},
    {"codec_long_name", stream.codec_long_name}
  };
  if (stream.codec_type == "video") {
    j["width"] = stream.width;
    j["height"] = stream.height;
    j["attached_pic"] = stream.attached_picture;
  } else if (stream.codec_type == "audio") {
    j["sample_rate"] = stream.sample_rate;
    j["channels"] = stream.channels;
  }
  if (stream.bit_rate > 0) {
    j["bit_rate"] = stream.bit_rate;
  }
}

inline void from_json(const nlohmann::json& j, StreamSpec& stream) {
  stream.index = j.value("index", 0);
  stream.codec_type = j.value("codec_type", std::string{});
  stream.codec_name = j.value("codec_name", std::string{});
  stream.codec_long_name = j.value("codec_long_name", std::string{});
  stream.width = j.value("width", 0);
  stream.height = j.value("height", 0);
  stream.bit_rate = j.value("bit_rate", std::int64_t{0});
  stream.sample_rate = j.value("sample_rate", 0);
  stream.channels = j.value("channels", 0);
  stream.attached_picture = j.value("attached_pic", false);
}

inline void to_json(nlohmann::json& j, const MediaSpecs& specs) {
  j = nlohmann::json{{"format", specs.format}, {"streams", specs.streams}};
}

inline void from_json(const nlohmann::json& j, MediaSpecs& specs) {
  specs.format = j.value("format", FormatSpec{});
  specs.streams = j.value("streams", std::vector<StreamSpec>{});
}

} // namespace media_service
