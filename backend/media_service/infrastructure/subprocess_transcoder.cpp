// subprocess_transcoder.cpp
#include "subprocess_transcoder.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <functional>
#include <istream>
#include <system_error>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>

namespace media_service {

namespace bp = boost::process;

namespace {

constexpr std::size_t kMaxDiagnosticsSize = 16 * 1024;

// Removes the job's tracker entry exactly once, whatever the outcome
class ProgressEntryGuard {
public:
  ProgressEntryGuard(ProgressTracker& tracker, std::string job_id)
    : tracker_(tracker), job_id_(std::move(job_id)) {}
  ~ProgressEntryGuard() { tracker_.remove(job_id_); }

  ProgressEntryGuard(const ProgressEntryGuard&) = delete;
  ProgressEntryGuard& operator=(const ProgressEntryGuard&) = delete;

private:
  ProgressTracker& tracker_;
  std::string job_id_;
};

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

bool isMp4Family(const std::filesystem::path& path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  return ext == ".mp4" || ext == ".m4v" || ext == ".m4a" || ext == ".mov";
}

std::string joinCommandLine(const std::string& exe, const std::vector<std::string>& args) {
  std::string line = exe;
  for (const auto& arg : args) {
    line += ' ';
    line += arg;
  }
  return line;
}

} // namespace

SubprocessTranscoder::SubprocessTranscoder(config::TranscodeConfig cfg,
                                           std::shared_ptr<ProgressTracker> tracker,
                                           std::shared_ptr<MediaProbe> probe)
    : cfg_(std::move(cfg)), tracker_(tracker), probe_(probe), stop_(false) {
  ffmpeg_path_ = findFFmpeg();
  if (ffmpeg_path_.empty()) {
    LOG_WARN("transcode", "ffmpeg not found (" << cfg_.ffmpeg_path << "), every job will fail");
  } else {
    LOG_INFO("transcode", "Using " << ffmpeg_path_ << " with " << cfg_.workers << " worker(s)");
  }

  const size_t max_threads = std::max<size_t>(cfg_.workers, 1);
  for (size_t i = 0; i < max_threads; ++i) {
    workers_.emplace_back(std::async(std::launch::async, [this] {
      while (true) {
        std::packaged_task<TranscodeResult()> task;

        {
          std::unique_lock<std::mutex> lock(queue_mutex_);
          condition_.wait(lock, [this] {
            return stop_ || !tasks_.empty();
          });

          if (stop_ && tasks_.empty()) return;

          task = std::move(tasks_.front());
          tasks_.pop();
        }

        task();
      }
    }));
  }
}

SubprocessTranscoder::~SubprocessTranscoder() {
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    stop_ = true;
  }

  condition_.notify_all();

  for (auto& worker : workers_) {
    if (worker.valid()) {
      worker.wait();
    }
  }
}

std::string SubprocessTranscoder::findFFmpeg() const {
  std::filesystem::path configured{cfg_.ffmpeg_path};
  if (configured.has_parent_path()) {
    std::error_code ec;
    return std::filesystem::is_regular_file(configured, ec) ? configured.string() : std::string{};
  }
  return bp::search_path(cfg_.ffmpeg_path).string();
}

std::filesystem::path SubprocessTranscoder::partialPathFor(const std::filesystem::path& output,
                                                           const std::string& job_id) {
  auto name = output.stem().string() + "." + job_id + ".part" + output.extension().string();
  return output.parent_path() / name;
}

std::filesystem::path SubprocessTranscoder::outputPathFor(const std::filesystem::path& input,
                                                          StreamType stream_type,
                                                          const std::string& bitrate) {
  auto name = input.stem().string() + "_reencoded_" + std::string(toString(stream_type))
              + "_" + bitrate + input.extension().string();
  return input.parent_path() / name;
}

std::vector<std::string> SubprocessTranscoder::buildFFmpegArgs(const TranscoderParams& params) {
  std::vector<std::string> args{
    "-hide_banner", "-nostdin", "-y",
    "-loglevel", "error",
    "-nostats", "-progress", "pipe:1",
    "-i", params.input_path,
  };

  if (params.stream_type == StreamType::Video) {
    args.insert(args.end(), {"-b:v", params.target_bitrate, "-b:a", params.audio_bitrate});
    if (isMp4Family(params.output_path)) {
      args.insert(args.end(), {"-movflags", "+faststart"});
    }
  } else {
    // cover art is an attached picture stream, copied like any video
    if (params.has_video || params.has_attached_picture) {
      args.insert(args.end(), {"-c:v", "copy"});
    }
    args.insert(args.end(), {"-b:a", params.target_bitrate});
  }

  args.push_back(params.output_path);
  return args;
}

int SubprocessTranscoder::progressPercent(std::chrono::microseconds processed,
                                          std::chrono::microseconds total) {
  if (total.count() <= 0 || processed.count() <= 0) {
    return 0;
  }
  auto percent = processed.count() * 100 / total.count();
  return static_cast<int>(std::min<std::int64_t>(percent, 99));
}

std::expected<TranscodeJob, ServiceError> SubprocessTranscoder::start(const TranscodeRequest& request,
                                                                      CompletionHandler on_complete) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(request.source_path, ec)) {
    return makeError(ErrorKind::NotFound, "Input file not found: " + request.source_path);
  }

  std::packaged_task<TranscodeResult()> task(
    [this, request, on_complete = std::move(on_complete)]() {
      auto result = this->transcode(request);
      if (on_complete) {
        try {
          on_complete(result);
        } catch (const std::exception& e) {
          LOG_ERROR("transcode", "Job " << request.job_id << ": completion handler failed: " << e.what());
        }
      }
      return result;
    }
  );

  auto future = task.get_future();

  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (stop_) {
      return makeError(ErrorKind::Internal, "Transcoder is shutting down");
    }
    tracker_->start(request.job_id);
    tasks_.push(std::move(task));
  }

  condition_.notify_one();
  return TranscodeJob{request.job_id, std::move(future)};
}

TranscodeResult SubprocessTranscoder::transcode(const TranscodeRequest& request) {
  ProgressEntryGuard guard{*tracker_, request.job_id};

  auto media = probe_->probe(request.source_path);
  if (!media) {
    return std::unexpected(TranscodeFailure{"Cannot read source media: " + media.error()});
  }

  const auto output = outputPathFor(request.source_path, request.stream_type, request.target_bitrate);
  const auto partial = partialPathFor(output, request.job_id);

  TranscoderParams params;
  params.input_path = request.source_path;
  params.output_path = partial.string();
  params.target_bitrate = request.target_bitrate;
  params.audio_bitrate = cfg_.audio_bitrate;
  params.stream_type = request.stream_type;
  params.has_video = media->has_video;
  params.has_attached_picture = media->has_attached_picture;

  auto encoded = executeTranscode(request.job_id, params, media->duration);
  if (!encoded) {
    std::error_code ec;
    std::filesystem::remove(partial, ec);
    return std::unexpected(encoded.error());
  }

  auto result = publishOutput(request.job_id, partial, output);
  if (result) {
    tracker_->update(request.job_id, 100);
  }
  return result;
}

TranscodeResult SubprocessTranscoder::publishOutput(const std::string& job_id,
                                                    const std::filesystem::path& partial,
                                                    const std::filesystem::path& output) {
  std::error_code ec;
  // same directory, so readers of a previous output keep their open file
  std::filesystem::rename(partial, output, ec);
  if (ec) {
    LOG_ERROR("transcode", "Job " << job_id << ": cannot move " << partial << " to " << output
                          << ": " << ec.message());
    std::error_code ignored;
    std::filesystem::remove(partial, ignored);
    return std::unexpected(TranscodeFailure{"Cannot publish re-encoded output: " + ec.message()});
  }

  auto size = std::filesystem::file_size(output, ec);
  if (ec) {
    return std::unexpected(TranscodeFailure{"Output file missing after transcode: " + ec.message()});
  }
  return TranscodeOutput{output.string(), size};
}

void SubprocessTranscoder::handleProgressLine(const std::string& job_id, std::string_view line,
                                              std::chrono::microseconds duration) {
  auto eq = line.find('=');
  if (eq == std::string_view::npos) {
    return;
  }
  auto key = trim(line.substr(0, eq));
  auto value = trim(line.substr(eq + 1));

  // out_time_ms is in microseconds as well, kept for older ffmpeg builds
  if (key != "out_time_us" && key != "out_time_ms") {
    return;
  }
  std::int64_t processed{0};
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), processed);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    return;   // "N/A" before the first frame
  }
  tracker_->update(job_id, progressPercent(std::chrono::microseconds{processed}, duration));
}

std::expected<void, TranscodeFailure> SubprocessTranscoder::executeTranscode(
  const std::string& job_id, const TranscoderParams& params, std::chrono::microseconds duration) {
  if (ffmpeg_path_.empty()) {
    return std::unexpected(TranscodeFailure{"FFmpeg is not installed or not found in PATH"});
  }

  const auto args = buildFFmpegArgs(params);
  LOG_INFO("transcode", "Job " << job_id << ": " << joinCommandLine(ffmpeg_path_, args));

  boost::asio::io_context ioc;
  boost::asio::streambuf progress_buffer;
  std::array<char, 4096> diagnostics_chunk;
  std::string diagnostics;
  int exit_code{-1};

  try {
    bp::async_pipe progress_pipe{ioc};
    bp::async_pipe diagnostics_pipe{ioc};

    bp::child child(bp::exe = ffmpeg_path_, bp::args = args,
                    bp::std_in < bp::null,
                    bp::std_out > progress_pipe,
                    bp::std_err > diagnostics_pipe);

    std::function<void()> read_progress = [&]() {
      boost::asio::async_read_until(progress_pipe, progress_buffer, '\n',
        [&](const boost::system::error_code& ec, std::size_t) {
          if (ec) {
            return;
          }
          std::istream is(&progress_buffer);
          std::string line;
          std::getline(is, line);
          handleProgressLine(job_id, line, duration);
          read_progress();
        });
    };

    std::function<void()> read_diagnostics = [&]() {
      diagnostics_pipe.async_read_some(boost::asio::buffer(diagnostics_chunk),
        [&](const boost::system::error_code& ec, std::size_t size) {
          if (size > 0 && diagnostics.size() < kMaxDiagnosticsSize) {
            diagnostics.append(diagnostics_chunk.data(),
                               std::min(size, kMaxDiagnosticsSize - diagnostics.size()));
          }
          if (!ec) {
            read_diagnostics();
          }
        });
    };

    read_progress();
    read_diagnostics();
    ioc.run();

    child.wait();
    exit_code = child.exit_code();
  } catch (const std::system_error& e) {
    // bp::process_error derives from std::system_error
    LOG_ERROR("transcode", "Job " << job_id << ": cannot run ffmpeg: " << e.what());
    return std::unexpected(TranscodeFailure{std::string("Cannot run ffmpeg: ") + e.what()});
  }

  if (exit_code != 0) {
    auto detail = std::string(trim(diagnostics));
    if (detail.empty()) {
      detail = "ffmpeg exited with code " + std::to_string(exit_code);
    }
    LOG_WARN("transcode", "Job " << job_id << ": ffmpeg exited with code " << exit_code);
    return std::unexpected(TranscodeFailure{detail});
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(params.output_path, ec)) {
    return std::unexpected(TranscodeFailure{"ffmpeg exited without writing " + params.output_path});
  }
  return {};
}

} // namespace media_service
