/**
 * @file mask_codec.cpp
 * @brief Run-length and PGM mask encodings
 */

#include "keycrop/mask_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>

#include "keycrop/logging.hpp"

namespace keycrop {

namespace {

bool valid_size(int width, int height) { return width > 0 && height > 0; }

void reset(RenderedMask &out, int width, int height) {
  out.pixel_width = width;
  out.pixel_height = height;
  out.bytes.assign(static_cast<size_t>(width) * height, MASK_TRANSPARENT);
}

enum class PairDecode {
  Decoded,
  NotPairs,  //< Not whitespace-separated integers
  OutOfRange //< A run starts outside the frame
};

/// Pair RLE: "start length start length ..." (row-major)
PairDecode decode_pairs(const std::string &counts, int width, int height,
                        RenderedMask &out) {
  std::vector<int64_t> values;
  const char *p = counts.c_str();
  while (*p) {
    while (*p && std::isspace(static_cast<unsigned char>(*p)))
      ++p;
    if (!*p)
      break;
    if (!std::isdigit(static_cast<unsigned char>(*p)))
      return PairDecode::NotPairs;
    char *end = nullptr;
    errno = 0;
    long long v = std::strtoll(p, &end, 10);
    if (end == p)
      return PairDecode::NotPairs;
    if (*end && !std::isspace(static_cast<unsigned char>(*end)))
      return PairDecode::NotPairs;
    if (errno == ERANGE)
      return PairDecode::OutOfRange;
    values.push_back(v);
    p = end;
  }
  if (values.empty() || values.size() % 2 != 0)
    return PairDecode::NotPairs;

  int64_t total = static_cast<int64_t>(width) * height;
  for (size_t i = 0; i < values.size(); i += 2) {
    if (values[i] < 0 || values[i + 1] < 0 || values[i] > total)
      return PairDecode::OutOfRange;
  }

  /// Lengths past the end are clipped to the frame
  reset(out, width, height);
  for (size_t i = 0; i < values.size(); i += 2) {
    int64_t first = values[i];
    int64_t last =
        values[i + 1] > total - first ? total : first + values[i + 1];
    for (int64_t idx = first; idx < last; ++idx)
      out.bytes[static_cast<size_t>(idx)] = MASK_OPAQUE;
  }
  return PairDecode::Decoded;
}

/// COCO compressed string -> integer runs
bool unpack_coco_string(const std::string &s, std::vector<int64_t> &counts) {
  counts.clear();
  size_t p = 0;
  while (p < s.size()) {
    int64_t x = 0;
    int k = 0;
    bool more = true;
    while (more) {
      if (p >= s.size() || 5 * k >= 60)
        return false;
      int c = static_cast<unsigned char>(s[p]) - 48;
      if (c < 0 || c > 63)
        return false;
      x |= static_cast<int64_t>(c & 0x1f) << (5 * k);
      more = (c & 0x20) != 0;
      ++p;
      ++k;
      /// Sign bit lives in the last group
      if (!more && (c & 0x10))
        x |= ~((int64_t{1} << (5 * k)) - 1);
    }
    if (counts.size() > 2) {
      int64_t base = counts[counts.size() - 2];
      if ((base > 0 && x > INT64_MAX - base) ||
          (base < 0 && x < INT64_MIN - base))
        return false;
      x += base;
    }
    counts.push_back(x);
  }
  return !counts.empty();
}

} // anonymous namespace

ErrorCode decode_rle_string(const std::string &counts, int width, int height,
                            RenderedMask &out) {
  if (!valid_size(width, height))
    return ErrorCode::InvalidInput;
  switch (decode_pairs(counts, width, height, out)) {
  case PairDecode::Decoded:
    return ErrorCode::Ok;
  case PairDecode::OutOfRange:
    LOG_WARN("RLE mask run outside the {}x{} frame", width, height);
    return ErrorCode::InvalidInput;
  case PairDecode::NotPairs:
    break;
  }

  std::vector<int64_t> runs;
  if (!unpack_coco_string(counts, runs)) {
    LOG_WARN("Unrecognized RLE mask string ({} chars)", counts.size());
    return ErrorCode::InvalidInput;
  }
  return decode_coco_counts(runs, width, height, out);
}

ErrorCode decode_coco_counts(const std::vector<int64_t> &counts, int width,
                             int height, RenderedMask &out) {
  if (!valid_size(width, height))
    return ErrorCode::InvalidInput;
  reset(out, width, height);

  int64_t total = static_cast<int64_t>(width) * height;
  int64_t col_major = 0;
  uint8_t value = MASK_TRANSPARENT;
  for (int64_t run : counts) {
    for (int64_t j = 0; j < run && col_major < total; ++j, ++col_major) {
      if (value == MASK_OPAQUE) {
        int64_t col = col_major / height;
        int64_t row = col_major % height;
        out.bytes[static_cast<size_t>(row * width + col)] = MASK_OPAQUE;
      }
    }
    value = value == MASK_TRANSPARENT ? MASK_OPAQUE : MASK_TRANSPARENT;
  }
  return ErrorCode::Ok;
}

std::vector<int64_t> encode_coco_counts(const RenderedMask &mask) {
  std::vector<int64_t> counts;
  bool current = false;
  int64_t run = 0;
  for (int col = 0; col < mask.pixel_width; ++col) {
    for (int row = 0; row < mask.pixel_height; ++row) {
      bool fg = mask.bytes[static_cast<size_t>(row) * mask.pixel_width + col] >=
                MASK_THRESHOLD;
      if (fg != current) {
        counts.push_back(run);
        run = 0;
        current = fg;
      }
      ++run;
    }
  }
  counts.push_back(run);
  return counts;
}

ErrorCode write_pgm(const RenderedMask &mask, const std::string &path) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    LOG_ERROR("Cannot open mask file for writing: {}", path);
    return ErrorCode::IoError;
  }
  out << "P5\n" << mask.pixel_width << ' ' << mask.pixel_height << "\n255\n";
  out.write(reinterpret_cast<const char *>(mask.bytes.data()),
            static_cast<std::streamsize>(mask.bytes.size()));
  out.flush();
  if (!out) {
    LOG_ERROR("Short write on mask file: {}", path);
    return ErrorCode::IoError;
  }
  return ErrorCode::Ok;
}

namespace {

/// Next header integer, skipping whitespace and '#' comments
bool read_header_int(std::istream &in, int &value) {
  for (;;) {
    int c = in.peek();
    if (c == '#') {
      std::string comment;
      std::getline(in, comment);
    } else if (c != EOF && std::isspace(c)) {
      in.get();
    } else {
      break;
    }
  }
  return static_cast<bool>(in >> value);
}

} // anonymous namespace

ErrorCode read_pgm(const std::string &path, RenderedMask &out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    LOG_ERROR("Cannot open mask file: {}", path);
    return ErrorCode::IoError;
  }
  char magic[2] = {0, 0};
  in.read(magic, 2);
  int width = 0, height = 0, maxval = 0;
  if (!in || magic[0] != 'P' || magic[1] != '5' ||
      !read_header_int(in, width) || !read_header_int(in, height) ||
      !read_header_int(in, maxval) || !valid_size(width, height) ||
      maxval != 255) {
    LOG_ERROR("Not an 8-bit binary PGM: {}", path);
    return ErrorCode::InvalidInput;
  }
  in.get(); // single whitespace before the raster

  reset(out, width, height);
  in.read(reinterpret_cast<char *>(out.bytes.data()),
          static_cast<std::streamsize>(out.bytes.size()));
  if (in.gcount() != static_cast<std::streamsize>(out.bytes.size())) {
    LOG_ERROR("Truncated PGM raster: {}", path);
    return ErrorCode::InvalidInput;
  }
  return ErrorCode::Ok;
}

} // namespace keycrop
