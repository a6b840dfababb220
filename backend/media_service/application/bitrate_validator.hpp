#pragma once
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace media_service {

enum class BitrateUnit { BitsPerSecond, Kilobits, Megabits };

struct Bitrate {
  std::uint64_t magnitude{0};
  BitrateUnit unit{BitrateUnit::BitsPerSecond};

  std::uint64_t bitsPerSecond() const;
  // Canonical form passed to the encoder, e.g. "500k", "5M", "96000"
  std::string literal() const;
};

// Accepts "<digits>", "<digits>k" and "<digits>M" inside plausible bounds:
// 8-8000 k, 1-50 M, 8000-50000000 bits/s. Returns the reason on rejection.
std::expected<Bitrate, std::string> validateBitrate(std::string_view text);

} // namespace media_service
