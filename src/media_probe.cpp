/**
 * @file media_probe.cpp
 * @brief libavformat probe implementation
 */

#include "keycrop/media_probe.hpp"

#include "keycrop/logging.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/pixdesc.h>
}

namespace keycrop {

namespace {

/**
 * @class FormatContext
 * @brief Owns an opened AVFormatContext.
 */
class FormatContext {
  AVFormatContext *ctx_ = nullptr;

public:
  FormatContext() = default;
  FormatContext(const FormatContext &) = delete;
  FormatContext &operator=(const FormatContext &) = delete;
  ~FormatContext() {
    if (ctx_)
      avformat_close_input(&ctx_);
  }

  int open(const std::string &path) {
    return avformat_open_input(&ctx_, path.c_str(), nullptr, nullptr);
  }

  AVFormatContext *get() const { return ctx_; }
};

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

std::string name_or_empty(const char *name) {
  if (!name || std::string(name) == "unknown" ||
      std::string(name) == "unspecified")
    return {};
  return name;
}

} // anonymous namespace

ErrorCode FfmpegProbe::probe(const std::string &path,
                             SourceVideoProperties &out) {
  FormatContext fmt_ctx;
  int ret = fmt_ctx.open(path);
  if (ret < 0) {
    LOG_ERROR("Cannot open {}: {}", path, av_error_string(ret));
    return ErrorCode::InvalidInput;
  }

  ret = avformat_find_stream_info(fmt_ctx.get(), nullptr);
  if (ret < 0) {
    LOG_ERROR("Cannot read stream info of {}: {}", path, av_error_string(ret));
    return ErrorCode::InvalidInput;
  }

  int index = av_find_best_stream(fmt_ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1,
                                  nullptr, 0);
  if (index < 0) {
    LOG_ERROR("No video stream in {}", path);
    return ErrorCode::InvalidInput;
  }

  const AVStream *stream = fmt_ctx.get()->streams[index];
  const AVCodecParameters *par = stream->codecpar;

  out = SourceVideoProperties{};
  out.width = par->width;
  out.height = par->height;

  if (stream->avg_frame_rate.num > 0 && stream->avg_frame_rate.den > 0)
    out.frame_rate = av_q2d(stream->avg_frame_rate);
  else if (stream->r_frame_rate.num > 0 && stream->r_frame_rate.den > 0)
    out.frame_rate = av_q2d(stream->r_frame_rate);

  const AVCodecDescriptor *desc = avcodec_descriptor_get(par->codec_id);
  out.codec = desc ? desc->name : "";

  if (par->codec_tag != 0) {
    char tag[AV_FOURCC_MAX_STRING_SIZE] = {0};
    av_fourcc_make_string(tag, par->codec_tag);
    out.codec_tag = tag;
  }

  if (stream->duration != AV_NOPTS_VALUE && stream->time_base.den > 0)
    out.duration = stream->duration * av_q2d(stream->time_base);
  else if (fmt_ctx.get()->duration > 0)
    out.duration = static_cast<double>(fmt_ctx.get()->duration) / AV_TIME_BASE;

  out.bit_rate = par->bit_rate > 0 ? par->bit_rate : fmt_ctx.get()->bit_rate;

  const AVPixFmtDescriptor *pix =
      av_pix_fmt_desc_get(static_cast<AVPixelFormat>(par->format));
  if (pix)
    out.bit_depth = pix->comp[0].depth;

  out.color_primaries = name_or_empty(av_color_primaries_name(par->color_primaries));
  out.color_transfer = name_or_empty(av_color_transfer_name(par->color_trc));
  out.color_space = name_or_empty(av_color_space_name(par->color_space));

  if (out.width <= 0 || out.height <= 0) {
    LOG_ERROR("Video stream of {} has no dimensions", path);
    return ErrorCode::InvalidInput;
  }

  LOG_INFO("Probed {}: {}x{} @ {:.3f}fps, {} ({}), {:.2f}s", path, out.width,
           out.height, out.frame_rate, out.codec, out.codec_tag, out.duration);
  return ErrorCode::Ok;
}

} // namespace keycrop
