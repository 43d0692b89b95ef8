/**
 * @file media_probe.hpp
 * @brief Source video inspection
 *
 * @details MediaProber is the seam the orchestrator depends on; FfmpegProbe
 *          reads the container through libavformat without decoding frames.
 */

#ifndef KEYCROP_MEDIA_PROBE_HPP
#define KEYCROP_MEDIA_PROBE_HPP

#include <string>

#include "error.hpp"
#include "types.hpp"

namespace keycrop {

/**
 * @class MediaProber
 * @brief Abstract source-properties supplier.
 */
class MediaProber {
public:
  virtual ~MediaProber() = default;

  /**
   * @brief Probe a source file.
   * @return Ok, or InvalidInput when the file has no readable video stream
   */
  virtual ErrorCode probe(const std::string &path,
                          SourceVideoProperties &out) = 0;
};

/**
 * @class FfmpegProbe
 * @brief libavformat-backed prober (best video stream of the container).
 */
class FfmpegProbe : public MediaProber {
public:
  ErrorCode probe(const std::string &path,
                  SourceVideoProperties &out) override;
};

} // namespace keycrop

#endif // KEYCROP_MEDIA_PROBE_HPP
