// subprocess_transcoder.hpp
#pragma once

#include "application/progress_tracker.hpp"
#include "common/config/config.hpp"
#include "domain/media_probe.hpp"
#include "domain/transcoding_service.hpp"

#include <chrono>
#include <condition_variable>
#include <expected>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <vector>

namespace media_service {

// Runs ffmpeg as a child process on a fixed set of worker threads and
// publishes its progress to the ProgressTracker while it runs.
class SubprocessTranscoder : public TranscodingService {
public:
  SubprocessTranscoder(config::TranscodeConfig cfg,
                       std::shared_ptr<ProgressTracker> tracker,
                       std::shared_ptr<MediaProbe> probe);
  ~SubprocessTranscoder() override;

  std::expected<TranscodeJob, ServiceError> start(const TranscodeRequest& request,
                                                  CompletionHandler on_complete) override;

  struct TranscoderParams {
    std::string input_path;
    std::string output_path;
    std::string target_bitrate;
    std::string audio_bitrate;
    StreamType stream_type{StreamType::Video};
    bool has_video{false};
    bool has_attached_picture{false};
  };

  static std::vector<std::string> buildFFmpegArgs(const TranscoderParams& params);

  // <dir>/<stem>_reencoded_<stream>_<bitrate><ext>
  static std::filesystem::path outputPathFor(const std::filesystem::path& input,
                                             StreamType stream_type,
                                             const std::string& bitrate);

  // Where a job encodes before the result is moved over the final name:
  // <dir>/<final stem>.<job id>.part<ext>
  static std::filesystem::path partialPathFor(const std::filesystem::path& output,
                                              const std::string& job_id);

  // Percentage for an ffmpeg out_time, kept below 100 until the process exits
  static int progressPercent(std::chrono::microseconds processed, std::chrono::microseconds total);

private:
  TranscodeResult transcode(const TranscodeRequest& request);
  std::expected<void, TranscodeFailure> executeTranscode(const std::string& job_id,
                                                         const TranscoderParams& params,
                                                         std::chrono::microseconds duration);
  TranscodeResult publishOutput(const std::string& job_id,
                                const std::filesystem::path& partial,
                                const std::filesystem::path& output);
  void handleProgressLine(const std::string& job_id, std::string_view line,
                          std::chrono::microseconds duration);
  std::string findFFmpeg() const;

  config::TranscodeConfig cfg_;
  std::shared_ptr<ProgressTracker> tracker_;
  std::shared_ptr<MediaProbe> probe_;
  std::string ffmpeg_path_;    // empty when ffmpeg cannot be found

  std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::queue<std::packaged_task<TranscodeResult()>> tasks_;
  std::vector<std::future<void>> workers_;
  bool stop_;
};

} // namespace media_service
