#include <gtest/gtest.h>

#include "infrastructure/mysql_artifact_repository.hpp"

#include <array>
#include <stdexcept>

namespace media_service::test {

namespace {

using Row = std::array<const char*, 12>;

Row registeredRow() {
  return Row{
    "7", "Trailer.mp4", "/media/in/trailer.mp4", "1000", "audio",
    R"({"format":{"format_name":"mp3","duration":2.5,"nb_streams":2},)"
    R"("streams":[{"index":0,"codec_type":"audio","codec_name":"mp3","sample_rate":44100,"channels":2},)"
    R"({"index":1,"codec_type":"video","codec_name":"mjpeg","width":300,"height":300,"attached_pic":true}]})",
    "1700000000123",
    nullptr, nullptr, nullptr, nullptr, nullptr
  };
}

} // namespace

TEST(MysqlArtifactRepositoryRow, mapsRegisteredArtifact) {
  auto row = registeredRow();
  auto artifact = MysqlArtifactRepository::fromRow(row.data());

  EXPECT_EQ(artifact.id, 7);
  EXPECT_EQ(artifact.filename, "Trailer.mp4");
  EXPECT_EQ(artifact.source_path, "/media/in/trailer.mp4");
  EXPECT_EQ(artifact.size, 1000u);
  EXPECT_EQ(artifact.media_type, StreamType::Audio);
  EXPECT_EQ(artifact.created_at.time_since_epoch(), std::chrono::milliseconds(1700000000123));
  EXPECT_FALSE(artifact.isReEncoded());
  EXPECT_FALSE(artifact.last_failure.has_value());

  EXPECT_EQ(artifact.specs.format.format_name, "mp3");
  EXPECT_DOUBLE_EQ(artifact.specs.format.duration, 2.5);
  ASSERT_EQ(artifact.specs.streams.size(), 2u);
  EXPECT_EQ(artifact.specs.streams[0].sample_rate, 44100);
  EXPECT_TRUE(artifact.specs.streams[1].attached_picture);
  EXPECT_EQ(artifact.specs.streams[1].width, 300);
}

TEST(MysqlArtifactRepositoryRow, mapsOutputAndFailure) {
  auto row = registeredRow();
  row[5] = nullptr;
  row[7] = "/media/in/trailer_reencoded_audio_96k.mp4";
  row[8] = "420";
  row[9] = "96k";
  row[10] = "job-3";
  row[11] = nullptr;

  auto artifact = MysqlArtifactRepository::fromRow(row.data());
  ASSERT_TRUE(artifact.isReEncoded());
  EXPECT_EQ(artifact.re_encoded->path, "/media/in/trailer_reencoded_audio_96k.mp4");
  EXPECT_EQ(artifact.re_encoded->size, 420u);
  EXPECT_EQ(artifact.re_encoded->bitrate, "96k");
  ASSERT_TRUE(artifact.last_failure.has_value());
  EXPECT_EQ(artifact.last_failure->job_id, "job-3");
  EXPECT_EQ(artifact.last_failure->message, "");
  EXPECT_TRUE(artifact.specs.streams.empty());
}

TEST(MysqlArtifactRepositoryRow, partialOutputColumnsAreIgnored) {
  auto row = registeredRow();
  row[7] = "/media/in/trailer_reencoded_audio_96k.mp4";

  EXPECT_FALSE(MysqlArtifactRepository::fromRow(row.data()).isReEncoded());
}

TEST(MysqlArtifactRepositoryRow, unknownMediaTypeReadsAsVideo) {
  auto row = registeredRow();
  row[4] = "subtitle";

  EXPECT_EQ(MysqlArtifactRepository::fromRow(row.data()).media_type, StreamType::Video);
}

TEST(MysqlArtifactRepositoryRow, malformedColumnsThrow) {
  auto bad_size = registeredRow();
  bad_size[3] = "lots";
  EXPECT_THROW(MysqlArtifactRepository::fromRow(bad_size.data()), std::invalid_argument);

  auto bad_specs = registeredRow();
  bad_specs[5] = "{not json";
  EXPECT_THROW(MysqlArtifactRepository::fromRow(bad_specs.data()), std::exception);
}

} // namespace media_service::test
