#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "common/config/config.hpp"
#include "domain/artifact_repository.hpp"

namespace media_service {

// Periodically deletes re-encode leftovers beside registered sources:
// outputs that no artifact points at any more and .part files of jobs that
// never finished. Only files untouched for cleanup.max_age are removed.
class OutputCleaner {
public:
  OutputCleaner(boost::asio::io_context& ioc,
                std::shared_ptr<ArtifactRepository> repository,
                config::CleanupConfig cfg);

  // First sweep one interval from now; does nothing when the interval is zero
  void start();

  // Returns the number of files removed
  std::size_t sweep(std::filesystem::file_time_type now = std::filesystem::file_time_type::clock::now());

private:
  void scheduleSweep();

  std::shared_ptr<ArtifactRepository> repository_;
  config::CleanupConfig cfg_;
  boost::asio::steady_timer timer_;
};

} // namespace media_service
