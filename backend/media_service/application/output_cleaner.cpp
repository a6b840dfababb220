#include "output_cleaner.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace media_service {

OutputCleaner::OutputCleaner(boost::asio::io_context& ioc,
                             std::shared_ptr<ArtifactRepository> repository,
                             config::CleanupConfig cfg)
  : repository_(repository), cfg_(cfg), timer_(ioc) {}

void OutputCleaner::start() {
  if (cfg_.interval.count() == 0) {
    LOG_INFO("cleanup", "Output cleanup disabled");
    return;
  }
  LOG_INFO("cleanup", "Sweeping stale outputs every " << cfg_.interval.count() << "s (max age "
                      << cfg_.max_age.count() << "s)");
  scheduleSweep();
}

void OutputCleaner::scheduleSweep() {
  timer_.expires_after(cfg_.interval);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (ec) {
      LOG_ERROR("cleanup", "Timer failure: " << ec.message());
      return;
    }
    sweep();
    scheduleSweep();
  });
}

std::size_t OutputCleaner::sweep(std::filesystem::file_time_type now) {
  auto artifacts = repository_->list();
  if (!artifacts) {
    LOG_ERROR("cleanup", "Cannot list artifacts: " << artifacts.error());
    return 0;
  }

  // directory -> "<source stem>_reencoded_" of every source in it
  std::map<std::filesystem::path, std::vector<std::string>> prefixes;
  std::set<std::string> in_use;
  for (const auto& artifact : *artifacts) {
    const std::filesystem::path source{artifact.source_path};
    prefixes[source.parent_path()].push_back(source.stem().string() + "_reencoded_");
    in_use.insert(artifact.source_path);
    if (artifact.re_encoded) {
      in_use.insert(artifact.re_encoded->path);
    }
  }

  const auto cutoff = now - cfg_.max_age;
  std::size_t removed = 0;

  for (const auto& [dir, stems] : prefixes) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
      LOG_WARN("cleanup", "Cannot scan " << dir << ": " << ec.message());
      continue;
    }

    for (; !ec && it != std::filesystem::directory_iterator{}; it.increment(ec)) {
      const auto& path = it->path();
      const auto name = path.filename().string();
      const bool leftover = std::any_of(stems.begin(), stems.end(), [&](const std::string& prefix) {
        return name.starts_with(prefix);
      });
      if (!leftover || in_use.contains(path.string())) {
        continue;
      }

      std::error_code file_ec;
      if (!it->is_regular_file(file_ec)) {
        continue;
      }
      auto modified = it->last_write_time(file_ec);
      if (file_ec || modified > cutoff) {
        continue;
      }
      if (std::filesystem::remove(path, file_ec)) {
        ++removed;
        LOG_DEBUG("cleanup", "Removed " << path);
      } else if (file_ec) {
        LOG_WARN("cleanup", "Cannot remove " << path << ": " << file_ec.message());
      }
    }
  }

  if (removed > 0) {
    LOG_INFO("cleanup", "Removed " << removed << " stale output file(s)");
  }
  return removed;
}

} // namespace media_service
