#include <gtest/gtest.h>

#include "infrastructure/subprocess_transcoder.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <fstream>
#include <future>
#include <iterator>

namespace media_service::test {

namespace {

class FakeMediaProbe : public MediaProbe {
public:
  explicit FakeMediaProbe(std::expected<MediaProbeResult, std::string> result)
    : result_(std::move(result)) {}

  std::expected<MediaProbeResult, std::string> probe(const std::string&) override {
    return result_;
  }

private:
  std::expected<MediaProbeResult, std::string> result_;
};

MediaProbeResult tenSecondClip(bool has_video = true) {
  return MediaProbeResult{
    .duration = std::chrono::seconds(10),
    .has_video = has_video,
    .has_audio = true,
  };
}

// Writes its last argument (the output path) and reports progress like ffmpeg
constexpr const char* kSucceedingEncoder =
  "for last; do :; done\n"
  "echo 'out_time_us=N/A'\n"
  "echo 'out_time_us=5000000'\n"
  "echo 'progress=continue'\n"
  "echo 'out_time_us=10000000'\n"
  "echo 'progress=end'\n"
  "printf 'reencoded' > \"$last\"\n"
  "exit 0\n";

// Succeeds on its first run and fails on every later one
constexpr const char* kFailsAfterFirstRunEncoder =
  "for last; do :; done\n"
  "marker=\"$(dirname \"$0\")/ran-once\"\n"
  "if [ -e \"$marker\" ]; then\n"
  "  printf 'broken' > \"$last\"\n"
  "  echo 'Error while decoding stream' >&2\n"
  "  exit 1\n"
  "fi\n"
  "touch \"$marker\"\n"
  "printf 'reencoded' > \"$last\"\n"
  "exit 0\n";

constexpr const char* kFailingEncoder =
  "for last; do :; done\n"
  "printf 'partial' > \"$last\"\n"
  "echo 'Invalid data found when processing input' >&2\n"
  "exit 1\n";

// Halfway through, then waits so the test can observe the running value
constexpr const char* kSlowEncoder =
  "for last; do :; done\n"
  "echo 'out_time_us=5000000'\n"
  "sleep 2\n"
  "printf 'reencoded' > \"$last\"\n"
  "exit 0\n";

config::TranscodeConfig transcodeConfig(const std::filesystem::path& ffmpeg) {
  return config::TranscodeConfig{
    .ffmpeg_path = ffmpeg.string(),
    .audio_bitrate = "128k",
    .workers = 2,
  };
}

bool contains(const std::vector<std::string>& args, const std::vector<std::string>& sequence) {
  return std::search(args.begin(), args.end(), sequence.begin(), sequence.end()) != args.end();
}

} // namespace

TEST(SubprocessTranscoder, outputPathSitsBesideSource) {
  auto path = SubprocessTranscoder::outputPathFor("/media/in/clip.mp4", StreamType::Audio, "96k");
  EXPECT_EQ(path, std::filesystem::path("/media/in/clip_reencoded_audio_96k.mp4"));
}

TEST(SubprocessTranscoder, partialPathKeepsContainerExtension) {
  auto path = SubprocessTranscoder::partialPathFor("/media/in/clip_reencoded_video_1M.mkv", "job-7");
  EXPECT_EQ(path, std::filesystem::path("/media/in/clip_reencoded_video_1M.job-7.part.mkv"));
}

TEST(SubprocessTranscoder, videoArguments) {
  SubprocessTranscoder::TranscoderParams params;
  params.input_path = "in.mp4";
  params.output_path = "out.mp4";
  params.target_bitrate = "500k";
  params.audio_bitrate = "128k";
  params.stream_type = StreamType::Video;

  auto args = SubprocessTranscoder::buildFFmpegArgs(params);
  EXPECT_TRUE(contains(args, {"-progress", "pipe:1"}));
  EXPECT_TRUE(contains(args, {"-i", "in.mp4"}));
  EXPECT_TRUE(contains(args, {"-b:v", "500k", "-b:a", "128k"}));
  EXPECT_TRUE(contains(args, {"-movflags", "+faststart"}));
  EXPECT_EQ(args.back(), "out.mp4");

  params.output_path = "out.mkv";
  EXPECT_FALSE(contains(SubprocessTranscoder::buildFFmpegArgs(params), {"-movflags", "+faststart"}));
}

TEST(SubprocessTranscoder, audioArgumentsCopyVideoWhenPresent) {
  SubprocessTranscoder::TranscoderParams params;
  params.input_path = "in.mp4";
  params.output_path = "out.mp4";
  params.target_bitrate = "96k";
  params.audio_bitrate = "128k";
  params.stream_type = StreamType::Audio;
  params.has_video = true;

  auto args = SubprocessTranscoder::buildFFmpegArgs(params);
  EXPECT_TRUE(contains(args, {"-c:v", "copy"}));
  EXPECT_TRUE(contains(args, {"-b:a", "96k"}));
  EXPECT_FALSE(contains(args, {"-b:v"}));

  params.has_video = false;
  EXPECT_FALSE(contains(SubprocessTranscoder::buildFFmpegArgs(params), {"-c:v", "copy"}));

  // cover art rides along untouched
  params.has_attached_picture = true;
  EXPECT_TRUE(contains(SubprocessTranscoder::buildFFmpegArgs(params), {"-c:v", "copy"}));
}

TEST(SubprocessTranscoder, progressStaysBelowCompleteWhileRunning) {
  using std::chrono::microseconds;
  EXPECT_EQ(SubprocessTranscoder::progressPercent(microseconds(0), microseconds(1000)), 0);
  EXPECT_EQ(SubprocessTranscoder::progressPercent(microseconds(250), microseconds(1000)), 25);
  EXPECT_EQ(SubprocessTranscoder::progressPercent(microseconds(1000), microseconds(1000)), 99);
  EXPECT_EQ(SubprocessTranscoder::progressPercent(microseconds(5000), microseconds(1000)), 99);
  EXPECT_EQ(SubprocessTranscoder::progressPercent(microseconds(500), microseconds(0)), 0);
  EXPECT_EQ(SubprocessTranscoder::progressPercent(microseconds(-5), microseconds(1000)), 0);
}

TEST(SubprocessTranscoder, missingSourceFailsFast) {
  TempDir dir;
  auto tracker = std::make_shared<ProgressTracker>();
  SubprocessTranscoder transcoder(transcodeConfig(dir.writeScript("ffmpeg", kSucceedingEncoder)), tracker,
                                  std::make_shared<FakeMediaProbe>(tenSecondClip()));

  auto job = transcoder.start(TranscodeRequest{
    .job_id = "job-1",
    .source_path = (dir.path() / "missing.mp4").string(),
    .target_bitrate = "500k",
  }, {});

  ASSERT_FALSE(job.has_value());
  EXPECT_EQ(job.error().kind, ErrorKind::NotFound);
  EXPECT_FALSE(tracker->contains("job-1"));
}

TEST(SubprocessTranscoder, successfulTranscode) {
  TempDir dir;
  auto source = dir.writeFile("clip.mp4", 64);
  auto tracker = std::make_shared<ProgressTracker>();
  SubprocessTranscoder transcoder(transcodeConfig(dir.writeScript("ffmpeg", kSucceedingEncoder)), tracker,
                                  std::make_shared<FakeMediaProbe>(tenSecondClip()));

  auto job = transcoder.start(TranscodeRequest{
    .job_id = "job-1",
    .source_path = source.string(),
    .target_bitrate = "500k",
    .stream_type = StreamType::Video,
  }, {});
  ASSERT_TRUE(job.has_value()) << job.error().message;
  EXPECT_EQ(job->job_id, "job-1");

  auto result = job->result.get();
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(result->path, (dir.path() / "clip_reencoded_video_500k.mp4").string());
  EXPECT_EQ(result->size, std::string("reencoded").size());
  EXPECT_TRUE(std::filesystem::exists(result->path));

  // entry is gone by the time the result is visible
  EXPECT_FALSE(tracker->contains("job-1"));
  EXPECT_FALSE(std::filesystem::exists(SubprocessTranscoder::partialPathFor(result->path, "job-1")));
}

TEST(SubprocessTranscoder, completionHandlerSeesResultBeforeFuture) {
  TempDir dir;
  auto source = dir.writeFile("clip.mp4", 64);
  auto tracker = std::make_shared<ProgressTracker>();
  SubprocessTranscoder transcoder(transcodeConfig(dir.writeScript("ffmpeg", kSucceedingEncoder)), tracker,
                                  std::make_shared<FakeMediaProbe>(tenSecondClip()));

  std::promise<std::string> handled;
  auto job = transcoder.start(TranscodeRequest{
    .job_id = "job-1",
    .source_path = source.string(),
    .target_bitrate = "500k",
  }, [&](const TranscodeResult& result) {
    handled.set_value(result ? result->path : result.error().message);
  });
  ASSERT_TRUE(job.has_value()) << job.error().message;

  auto handled_future = handled.get_future();
  ASSERT_EQ(handled_future.wait_for(std::chrono::seconds(10)), std::future_status::ready);
  EXPECT_EQ(handled_future.get(), (dir.path() / "clip_reencoded_video_500k.mp4").string());
  EXPECT_TRUE(job->result.get().has_value());
}

TEST(SubprocessTranscoder, failedRerunKeepsPublishedOutput) {
  TempDir dir;
  auto source = dir.writeFile("clip.mp4", 64);
  auto tracker = std::make_shared<ProgressTracker>();
  SubprocessTranscoder transcoder(transcodeConfig(dir.writeScript("ffmpeg", kFailsAfterFirstRunEncoder)),
                                  tracker, std::make_shared<FakeMediaProbe>(tenSecondClip()));
  const TranscodeRequest request{
    .job_id = "job-1",
    .source_path = source.string(),
    .target_bitrate = "500k",
  };

  auto first = transcoder.start(request, {});
  ASSERT_TRUE(first.has_value());
  auto published = first->result.get();
  ASSERT_TRUE(published.has_value()) << published.error().message;

  auto rerun_request = request;
  rerun_request.job_id = "job-2";
  auto second = transcoder.start(rerun_request, {});
  ASSERT_TRUE(second.has_value());
  auto rerun = second->result.get();
  ASSERT_FALSE(rerun.has_value());

  ASSERT_TRUE(std::filesystem::exists(published->path));
  std::ifstream in(published->path, std::ios::binary);
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "reencoded");
  EXPECT_FALSE(std::filesystem::exists(SubprocessTranscoder::partialPathFor(published->path, "job-2")));
}

TEST(SubprocessTranscoder, progressIsPublishedWhileRunning) {
  TempDir dir;
  auto source = dir.writeFile("clip.mp4", 64);
  auto tracker = std::make_shared<ProgressTracker>();
  SubprocessTranscoder transcoder(transcodeConfig(dir.writeScript("ffmpeg", kSlowEncoder)), tracker,
                                  std::make_shared<FakeMediaProbe>(tenSecondClip()));

  auto job = transcoder.start(TranscodeRequest{
    .job_id = "job-slow",
    .source_path = source.string(),
    .target_bitrate = "1M",
  }, {});
  ASSERT_TRUE(job.has_value()) << job.error().message;

  EXPECT_TRUE(waitFor([&] { return tracker->progressOf("job-slow") == 50; }));

  auto result = job->result.get();
  EXPECT_TRUE(result.has_value());
  EXPECT_EQ(tracker->progressOf("job-slow"), 0);
}

TEST(SubprocessTranscoder, failedTranscodeReportsDiagnosticsAndRemovesPartialOutput) {
  TempDir dir;
  auto source = dir.writeFile("clip.mp4", 64);
  auto tracker = std::make_shared<ProgressTracker>();
  SubprocessTranscoder transcoder(transcodeConfig(dir.writeScript("ffmpeg", kFailingEncoder)), tracker,
                                  std::make_shared<FakeMediaProbe>(tenSecondClip()));

  auto job = transcoder.start(TranscodeRequest{
    .job_id = "job-1",
    .source_path = source.string(),
    .target_bitrate = "500k",
  }, {});
  ASSERT_TRUE(job.has_value());

  auto result = job->result.get();
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().message.find("Invalid data found"), std::string::npos) << result.error().message;
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "clip_reencoded_video_500k.mp4"));
  EXPECT_FALSE(tracker->contains("job-1"));
}

TEST(SubprocessTranscoder, unreadableSourceFails) {
  TempDir dir;
  auto source = dir.writeFile("clip.mp4", 64);
  auto tracker = std::make_shared<ProgressTracker>();
  SubprocessTranscoder transcoder(transcodeConfig(dir.writeScript("ffmpeg", kSucceedingEncoder)), tracker,
                                  std::make_shared<FakeMediaProbe>(std::unexpected("moov atom not found")));

  auto job = transcoder.start(TranscodeRequest{
    .job_id = "job-1",
    .source_path = source.string(),
    .target_bitrate = "500k",
  }, {});
  ASSERT_TRUE(job.has_value());

  auto result = job->result.get();
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().message.find("moov atom not found"), std::string::npos);
  EXPECT_FALSE(tracker->contains("job-1"));
}

TEST(SubprocessTranscoder, missingEncoderFailsEveryJob) {
  TempDir dir;
  auto source = dir.writeFile("clip.mp4", 64);
  auto tracker = std::make_shared<ProgressTracker>();
  SubprocessTranscoder transcoder(transcodeConfig(dir.path() / "no-such-ffmpeg"), tracker,
                                  std::make_shared<FakeMediaProbe>(tenSecondClip()));

  auto job = transcoder.start(TranscodeRequest{
    .job_id = "job-1",
    .source_path = source.string(),
    .target_bitrate = "500k",
  }, {});
  ASSERT_TRUE(job.has_value());

  auto result = job->result.get();
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().message.find("FFmpeg is not installed"), std::string::npos);
}

} // namespace media_service::test
