#include "bitrate_validator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace media_service {

namespace {

struct Bounds {
  std::uint64_t min;
  std::uint64_t max;
  const char* suffix;
};

Bounds boundsFor(BitrateUnit unit) {
  switch (unit) {
    case BitrateUnit::Kilobits: return {8, 8'000, "k"};
    case BitrateUnit::Megabits: return {1, 50, "M"};
    case BitrateUnit::BitsPerSecond: break;
  }
  return {8'000, 50'000'000, ""};
}

} // namespace

std::uint64_t Bitrate::bitsPerSecond() const {
  switch (unit) {
    case BitrateUnit::Kilobits: return magnitude * 1'000;
    case BitrateUnit::Megabits: return magnitude * 1'000'000;
    case BitrateUnit::BitsPerSecond: break;
  }
  return magnitude;
}

std::string Bitrate::literal() const {
  return std::to_string(magnitude) + boundsFor(unit).suffix;
}

std::expected<Bitrate, std::string> validateBitrate(std::string_view text) {
  if (text.empty()) {
    return std::unexpected("Bitrate is empty");
  }

  Bitrate bitrate;
  std::string_view digits = text;
  if (digits.back() == 'k') {
    bitrate.unit = BitrateUnit::Kilobits;
    digits.remove_suffix(1);
  } else if (digits.back() == 'M') {
    bitrate.unit = BitrateUnit::Megabits;
    digits.remove_suffix(1);
  }

  const bool all_digits = !digits.empty() &&
    std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
  if (!all_digits) {
    return std::unexpected("Bitrate must be a number optionally followed by 'k' (kbps) or 'M' (Mbps), e.g. '5000k' or '5M', got '"
                           + std::string(text) + "'");
  }

  const auto bounds = boundsFor(bitrate.unit);
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), bitrate.magnitude);
  if (ec == std::errc::result_out_of_range || bitrate.magnitude < bounds.min || bitrate.magnitude > bounds.max) {
    return std::unexpected("Bitrate '" + std::string(text) + "' is outside the accepted range "
                           + std::to_string(bounds.min) + bounds.suffix + " to "
                           + std::to_string(bounds.max) + bounds.suffix);
  }
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::unexpected("Bitrate '" + std::string(text) + "' could not be parsed");
  }

  return bitrate;
}

} // namespace media_service
