/**
 * @file temp_assets.cpp
 * @brief Scoped temporary directory implementation
 */

#include "keycrop/temp_assets.hpp"

#include <atomic>
#include <chrono>
#include <system_error>

#include <unistd.h>

#include <fmt/core.h>

#include "keycrop/logging.hpp"

namespace keycrop {

namespace fs = std::filesystem;

namespace {

/// Distinguishes directories created in the same process
std::atomic<unsigned> dir_counter{0};

} // anonymous namespace

TempAssetDir::~TempAssetDir() {
  if (!keep_)
    remove();
  else if (created())
    LOG_INFO("Keeping mask assets in {}", path_.string());
}

ErrorCode TempAssetDir::create(const std::string &root,
                               const std::string &prefix) {
  std::error_code ec;
  fs::path base = root.empty() ? fs::temp_directory_path(ec) : fs::path(root);
  if (ec) {
    LOG_ERROR("No temporary directory: {}", ec.message());
    return ErrorCode::IoError;
  }
  fs::create_directories(base, ec);
  if (ec) {
    LOG_ERROR("Cannot create {}: {}", base.string(), ec.message());
    return ErrorCode::IoError;
  }

  auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  for (int attempt = 0; attempt < 16; ++attempt) {
    fs::path candidate =
        base / fmt::format("{}-{}-{:x}-{}", prefix, getpid(), ticks,
                           dir_counter.fetch_add(1));
    if (fs::create_directory(candidate, ec)) {
      path_ = candidate;
      return ErrorCode::Ok;
    }
    if (ec) {
      LOG_ERROR("Cannot create {}: {}", candidate.string(), ec.message());
      return ErrorCode::IoError;
    }
  }
  LOG_ERROR("Could not find a free temporary directory name in {}",
            base.string());
  return ErrorCode::IoError;
}

std::string TempAssetDir::file(const std::string &name) const {
  return (path_ / name).string();
}

bool TempAssetDir::remove() {
  if (path_.empty())
    return true;
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    LOG_WARN("Failed to remove {}: {}", path_.string(), ec.message());
    return false;
  }
  path_.clear();
  return true;
}

} // namespace keycrop
