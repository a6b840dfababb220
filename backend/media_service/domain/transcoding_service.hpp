#pragma once
#include "media_artifact.hpp"
#include "service_error.hpp"
#include <cstdint>
#include <expected>
#include <functional>
#include <future>
#include <string>

namespace media_service {

struct TranscodeRequest {
  std::string job_id;
  std::string source_path;
  std::string target_bitrate;   // validated literal, e.g. "500k"
  StreamType stream_type{StreamType::Video};
};

struct TranscodeOutput {
  std::string path;
  std::uint64_t size{0};
};

struct TranscodeFailure {
  std::string message;          // encoder diagnostics
};

using TranscodeResult = std::expected<TranscodeOutput, TranscodeFailure>;

struct TranscodeJob {
  std::string job_id;
  std::future<TranscodeResult> result;
};

// Called once on the worker that produced the result, before the job's future is ready
using CompletionHandler = std::function<void(const TranscodeResult&)>;

class TranscodingService {
public:
  virtual ~TranscodingService() = default;
  // Returns once the work is queued; NotFound when the source file is missing.
  // on_complete is never called when start itself fails.
  virtual std::expected<TranscodeJob, ServiceError> start(const TranscodeRequest& request,
                                                          CompletionHandler on_complete) = 0;
};

} // namespace media_service
