#include "avformat_media_probe.hpp"

#include <memory>

namespace media_service {

namespace {

std::string averror(int code) {
  char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, buffer, sizeof(buffer));
  return buffer;
}

int channelCount(const AVCodecParameters* par) {
#if LIBAVUTIL_VERSION_INT >= AV_VERSION_INT(57, 28, 100)
  return par->ch_layout.nb_channels;
#else
  return par->channels;
#endif
}

StreamSpec describeStream(const AVStream* stream) {
  const AVCodecParameters* par = stream->codecpar;
  StreamSpec summary;
  summary.index = stream->index;
  if (const char* type = av_get_media_type_string(par->codec_type)) {
    summary.codec_type = type;
  }
  summary.codec_name = avcodec_get_name(par->codec_id);
  if (const AVCodecDescriptor* descriptor = avcodec_descriptor_get(par->codec_id)) {
    summary.codec_long_name = descriptor->long_name ? descriptor->long_name : "";
  }
  summary.bit_rate = par->bit_rate;
  if (par->codec_type == AVMEDIA_TYPE_VIDEO) {
    summary.width = par->width;
    summary.height = par->height;
    summary.attached_picture = (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) != 0;
  } else if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
    summary.sample_rate = par->sample_rate;
    summary.channels = channelCount(par);
  }
  return summary;
}

struct InputCloser {
  void operator()(AVFormatContext* ctx) const {
    avformat_close_input(&ctx);
  }
};

} // namespace

AvFormatMediaProbe::AvFormatMediaProbe(int loglevel) {
  av_log_set_level(loglevel);
}

std::expected<MediaProbeResult, std::string> AvFormatMediaProbe::probe(const std::string& path) {
  AVFormatContext* raw_ctx = nullptr;
  if (int ret = avformat_open_input(&raw_ctx, path.c_str(), nullptr, nullptr); ret < 0) {
    return std::unexpected("Could not open input file: " + averror(ret));
  }
  std::unique_ptr<AVFormatContext, InputCloser> ctx(raw_ctx);

  if (int ret = avformat_find_stream_info(ctx.get(), nullptr); ret < 0) {
    return std::unexpected("Could not find stream info: " + averror(ret));
  }

  MediaProbeResult result;
  // AV_TIME_BASE is microseconds
  if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
    result.duration = std::chrono::microseconds{ctx->duration};
  }

  auto& format = result.specs.format;
  format.format_name = ctx->iformat->name;
  format.format_long_name = ctx->iformat->long_name ? ctx->iformat->long_name : "";
  format.duration = static_cast<double>(result.duration.count()) / AV_TIME_BASE;
  format.bit_rate = ctx->bit_rate;
  format.nb_streams = ctx->nb_streams;

  for (unsigned int i = 0; i < ctx->nb_streams; ++i) {
    const AVStream* stream = ctx->streams[i];
    result.specs.streams.push_back(describeStream(stream));
    switch (stream->codecpar->codec_type) {
      case AVMEDIA_TYPE_VIDEO:
        if (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) {
          result.has_attached_picture = true;
        } else {
          result.has_video = true;
        }
        break;
      case AVMEDIA_TYPE_AUDIO:
        result.has_audio = true;
        break;
      default:
        break;
    }
  }

  if (!result.has_video && !result.has_audio) {
    return std::unexpected("No audio or video stream in " + path);
  }
  return result;
}

} // namespace media_service
