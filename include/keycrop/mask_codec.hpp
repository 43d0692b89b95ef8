/**
 * @file mask_codec.hpp
 * @brief Mask bitmap encodings: run-length (AI segmentation) and PGM files
 *
 * @details Run-length formats accepted for AI masks:
 *
 *          - Pair RLE: space-separated "start length" pairs over the
 *            row-major pixel index
 *
 *          - COCO integer RLE: alternating background/foreground run
 *            lengths over the COLUMN-major pixel index, background first
 *
 *          - COCO compressed RLE: the integer runs packed as 6-bit ASCII
 *            groups (offset 48, 5 payload bits + continuation bit), sign
 *            taken from bit 4 of the last group, each run after the second
 *            stored as a delta from the run two positions back
 *
 *          PGM files are binary "P5" with maxval 255, the format the FFmpeg
 *          image demuxer reads for static masks and mask sequences.
 */

#ifndef KEYCROP_MASK_CODEC_HPP
#define KEYCROP_MASK_CODEC_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace keycrop {

/// Values at or above this are foreground when a bitmap is binarized
constexpr uint8_t MASK_THRESHOLD = 128;

/**
 * @brief Decode a string "counts" field.
 * @note Pair RLE is tried first; COCO compressed RLE is the fallback.
 *       Pair runs longer than the frame are clipped.
 * @return Ok, or InvalidInput when neither format parses or a pair run
 *         starts outside the frame
 */
ErrorCode decode_rle_string(const std::string &counts, int width, int height,
                            RenderedMask &out);

/**
 * @brief Decode COCO integer RLE (column-major, background first).
 * @note Runs past the end of the frame are truncated; negative runs count
 *       as empty.
 */
ErrorCode decode_coco_counts(const std::vector<int64_t> &counts, int width,
                             int height, RenderedMask &out);

/// Encode a mask as COCO integer RLE after thresholding at MASK_THRESHOLD
std::vector<int64_t> encode_coco_counts(const RenderedMask &mask);

/// Write a mask as a binary PGM; IoError on any write failure
ErrorCode write_pgm(const RenderedMask &mask, const std::string &path);

/// Read a binary PGM (maxval 255) written by write_pgm or any P5 tool
ErrorCode read_pgm(const std::string &path, RenderedMask &out);

} // namespace keycrop

#endif // KEYCROP_MASK_CODEC_HPP
