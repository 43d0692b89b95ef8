/**
 * @file temp_assets.hpp
 * @brief Scoped per-job directory for mask and command files
 *
 * @details The directory and everything written into it are removed when
 *          the owner goes out of scope, on success, failure and
 *          cancellation alike. KEEP_MASK_FILES turns removal off.
 */

#ifndef KEYCROP_TEMP_ASSETS_HPP
#define KEYCROP_TEMP_ASSETS_HPP

#include <filesystem>
#include <string>

#include "error.hpp"

namespace keycrop {

/**
 * @class TempAssetDir
 * @brief RAII owner of one uniquely named temporary directory.
 */
class TempAssetDir {
  std::filesystem::path path_;
  bool keep_ = false;

public:
  explicit TempAssetDir(bool keep = false) : keep_(keep) {}
  ~TempAssetDir();

  TempAssetDir(const TempAssetDir &) = delete;
  TempAssetDir &operator=(const TempAssetDir &) = delete;

  /**
   * @brief Create the directory.
   * @param root Parent directory (empty = system temp directory)
   * @param prefix Name prefix, e.g. "keycrop-job3"
   * @return Ok or IoError
   */
  ErrorCode create(const std::string &root, const std::string &prefix);

  bool created() const { return !path_.empty(); }
  const std::filesystem::path &path() const { return path_; }

  /// Absolute path of a file inside the directory
  std::string file(const std::string &name) const;

  /// Remove now (idempotent); returns false if removal failed
  bool remove();
};

} // namespace keycrop

#endif // KEYCROP_TEMP_ASSETS_HPP
