/**
 * @file filter_graph.cpp
 * @brief Timeline summary, encoder table and filter-graph construction
 */

#include "keycrop/filter_graph.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "keycrop/config.hpp"
#include "keycrop/interpolator.hpp"
#include "keycrop/logging.hpp"
#include "keycrop/mask_rasterizer.hpp"

namespace keycrop {

// **----- GRAPH DESCRIPTION -----**

const ParamValue *FilterStage::param(const std::string &key) const {
  for (const auto &p : params) {
    if (p.key == key)
      return &p.value;
  }
  return nullptr;
}

const FilterStage *FilterGraphSpec::find_stage(const std::string &name) const {
  for (const auto &s : stages) {
    if (s.name == name)
      return &s;
  }
  return nullptr;
}

// **----- TIMELINE SUMMARY -----**

PixelRect rect_to_pixels(const NormalizedRect &rect, int width, int height) {
  PixelRect out;
  out.x = std::min(std::max(0, to_pixel(rect.x, width)), width);
  out.y = std::min(std::max(0, to_pixel(rect.y, height)), height);
  out.width = even_floor(to_pixel(rect.width, width));
  out.height = even_floor(to_pixel(rect.height, height));
  if (out.x + out.width > width)
    out.width = even_floor(width - out.x);
  if (out.y + out.height > height)
    out.height = even_floor(height - out.y);
  return out;
}

namespace {

PixelRect union_of(const PixelRect &a, const PixelRect &b) {
  if (a.width <= 0 || a.height <= 0)
    return b;
  if (b.width <= 0 || b.height <= 0)
    return a;
  int x0 = std::min(a.x, b.x);
  int y0 = std::min(a.y, b.y);
  int x1 = std::max(a.x + a.width, b.x + b.width);
  int y1 = std::max(a.y + a.height, b.y + b.height);
  return {x0, y0, x1 - x0, y1 - y0};
}

bool is_degenerate(const CropGeometry &g) {
  return mode_of(g) == CropMode::Freehand &&
         std::get<FreehandCrop>(g).degenerate();
}

} // anonymous namespace

ErrorCode summarize_timeline(const CropTimeline &timeline,
                             const SourceVideoProperties &source,
                             TimelineSummary &out) {
  int width = even_floor(source.width);
  int height = even_floor(source.height);
  if (width == 0 || height == 0)
    return ErrorCode::OddDimension;

  out = TimelineSummary{};
  out.mode = timeline.mode();
  out.frame_rate = source.frame_rate;
  out.representative = default_geometry(timeline.mode());

  if (timeline.empty()) {
    out.passthrough = true;
    out.is_static = true;
    out.frame_count = 0;
    out.union_box = {0, 0, width, height};
    return ErrorCode::Ok;
  }

  int frames = 1;
  if (source.duration > 0.0 && source.frame_rate > 0.0) {
    frames = static_cast<int>(
        std::ceil(source.duration * source.frame_rate - 1e-9));
    frames = std::max(frames, 1);
  }
  out.frame_count = frames;

  std::vector<CropGeometry> samples;
  samples.reserve(frames);
  bool all_degenerate = true;
  PixelRect box;

  for (int i = 0; i < frames; ++i) {
    double t = source.frame_rate > 0.0 ? i / source.frame_rate : 0.0;
    CropGeometry g;
    ErrorCode err = sample(timeline, t, g);
    if (!ok(err))
      return err;

    if (!is_degenerate(g))
      all_degenerate = false;

    if (out.mode == CropMode::Rectangle) {
      PixelRect px =
          rect_to_pixels(std::get<RectangleCrop>(g).rect, width, height);
      out.max_crop_width = std::max(out.max_crop_width, px.width);
      out.max_crop_height = std::max(out.max_crop_height, px.height);
      box = union_of(box, px);
    } else {
      box = union_of(box, pixel_bounds(g, width, height));
    }
    samples.push_back(std::move(g));
  }

  out.representative = samples.front();
  out.passthrough = all_degenerate;
  out.is_static = std::all_of(
      samples.begin(), samples.end(),
      [&](const CropGeometry &g) { return g == samples.front(); });

  box.width = even_floor(box.width);
  box.height = even_floor(box.height);
  out.union_box = box;

  if (!out.is_static)
    out.samples = std::move(samples);
  return ErrorCode::Ok;
}

bool needs_masks(const TimelineSummary &summary) {
  return !summary.passthrough && summary.mode != CropMode::Rectangle;
}

std::string crop_command_script(const TimelineSummary &summary, int width,
                                int height) {
  std::string script;
  if (summary.mode != CropMode::Rectangle || summary.frame_rate <= 0.0)
    return script;

  PixelRect previous{-1, -1, -1, -1};
  for (size_t i = 0; i < summary.samples.size(); ++i) {
    PixelRect px = rect_to_pixels(
        std::get<RectangleCrop>(summary.samples[i]).rect, width, height);
    if (px == previous)
      continue;
    script += fmt::format("{:.6f} crop w {}, crop h {}, crop x {}, crop y {};\n",
                          i / summary.frame_rate, px.width, px.height, px.x,
                          px.y);
    previous = px;
  }
  return script;
}

// **----- ENCODER SELECTION -----**

GraphOptions GraphOptions::from_config() {
  GraphOptions o;
  o.hw_backend = Config::hw_encoder_backend();
  o.vaapi_device = Config::vaapi_device();
  o.background_color = Config::background_color();
  o.default_bit_rate = Config::default_bit_rate();
  return o;
}

namespace {

/**
 * @struct EncoderRow
 * @brief One line of the encoder table.
 * @note backend == nullptr marks the software row of a codec.
 */
struct EncoderRow {
  CodecHint codec;
  const char *backend;
  const char *encoder;
  bool alpha;
};

constexpr EncoderRow ENCODER_TABLE[] = {
    {CodecHint::H264, "nvenc", "h264_nvenc", false},
    {CodecHint::H264, "qsv", "h264_qsv", false},
    {CodecHint::H264, "vaapi", "h264_vaapi", false},
    {CodecHint::H264, "amf", "h264_amf", false},
    {CodecHint::H264, "videotoolbox", "h264_videotoolbox", false},
    {CodecHint::H264, nullptr, "libx264", false},

    {CodecHint::HEVC, "nvenc", "hevc_nvenc", false},
    {CodecHint::HEVC, "qsv", "hevc_qsv", false},
    {CodecHint::HEVC, "vaapi", "hevc_vaapi", false},
    {CodecHint::HEVC, "amf", "hevc_amf", false},
    {CodecHint::HEVC, "videotoolbox", "hevc_videotoolbox", false},
    {CodecHint::HEVC, nullptr, "libx265", false},

    {CodecHint::ProRes, "videotoolbox", "prores_videotoolbox", false},
    {CodecHint::ProRes, nullptr, "prores_ks", true},

    {CodecHint::VP9, "qsv", "vp9_qsv", false},
    {CodecHint::VP9, "vaapi", "vp9_vaapi", false},
    {CodecHint::VP9, nullptr, "libvpx-vp9", true},
};

constexpr const char *KNOWN_BACKENDS[] = {"nvenc", "qsv", "vaapi", "amf",
                                          "videotoolbox"};

bool known_backend(const std::string &name) {
  for (const char *b : KNOWN_BACKENDS) {
    if (name == b)
      return true;
  }
  return false;
}

const EncoderRow *find_row(CodecHint codec, const char *backend) {
  for (const auto &row : ENCODER_TABLE) {
    if (row.codec != codec)
      continue;
    if (backend == nullptr && row.backend == nullptr)
      return &row;
    if (backend != nullptr && row.backend != nullptr &&
        std::string(backend) == row.backend)
      return &row;
  }
  return nullptr;
}

CodecHint codec_from_source(const std::string &codec) {
  if (codec == "h264")
    return CodecHint::H264;
  if (codec == "hevc" || codec == "h265")
    return CodecHint::HEVC;
  if (codec == "prores")
    return CodecHint::ProRes;
  if (codec == "vp9")
    return CodecHint::VP9;
  /// Documented default row
  return CodecHint::H264;
}

std::string pixel_format_for(const EncoderSelection &sel,
                             const SourceVideoProperties &source, bool alpha,
                             int prores_profile) {
  switch (sel.codec) {
  case CodecHint::ProRes:
    if (alpha)
      return "yuva444p10le";
    return prores_profile >= 4 ? "yuv444p10le" : "yuv422p10le";
  case CodecHint::VP9:
    return alpha ? "yuva420p" : "yuv420p";
  case CodecHint::HEVC:
    if (source.bit_depth > 8)
      return sel.hardware ? "p010le" : "yuv420p10le";
    return "yuv420p";
  default:
    return "yuv420p";
  }
}

} // anonymous namespace

int prores_profile_for(const std::string &codec_tag) {
  if (codec_tag == "ap4x")
    return 5;
  if (codec_tag == "ap4h")
    return 4;
  if (codec_tag == "apch")
    return 3;
  if (codec_tag == "apcn")
    return 2;
  if (codec_tag == "apcs")
    return 1;
  if (codec_tag == "apco")
    return 0;
  return 3;
}

ErrorCode resolve_codec(const SourceVideoProperties &source,
                        const ExportSettings &settings, CodecHint &codec) {
  if (settings.codec_hint == CodecHint::MatchSource) {
    codec = codec_from_source(source.codec);
    if (settings.enable_alpha && codec != CodecHint::ProRes &&
        codec != CodecHint::VP9)
      codec = CodecHint::ProRes;
    return ErrorCode::Ok;
  }

  codec = settings.codec_hint;
  if (settings.enable_alpha &&
      (codec == CodecHint::H264 || codec == CodecHint::HEVC))
    return ErrorCode::UnsupportedCodec;
  return ErrorCode::Ok;
}

ErrorCode select_encoder(const SourceVideoProperties &source,
                         const ExportSettings &settings,
                         const GraphOptions &options, EncoderSelection &out) {
  out = EncoderSelection{};

  ErrorCode err = resolve_codec(source, settings, out.codec);
  if (!ok(err))
    return err;

  const EncoderRow *row = nullptr;
  if (settings.use_hardware_encoder) {
    if (!known_backend(options.hw_backend)) {
      LOG_ERROR("Unknown hardware encoder backend: {}", options.hw_backend);
      return ErrorCode::UnsupportedCodec;
    }
    row = find_row(out.codec, options.hw_backend.c_str());
    if (row && settings.enable_alpha && !row->alpha)
      row = nullptr;
  }
  if (!row)
    row = find_row(out.codec, nullptr);
  if (!row)
    return ErrorCode::UnsupportedCodec;

  out.encoder = row->encoder;
  out.hardware = row->backend != nullptr;
  if (out.hardware)
    out.backend = row->backend;

  int profile = prores_profile_for(source.codec_tag);
  if (out.codec == CodecHint::ProRes && settings.enable_alpha)
    profile = std::max(profile, 4);

  if (out.hardware) {
    int64_t bit_rate =
        source.bit_rate > 0 ? source.bit_rate : options.default_bit_rate;
    out.options.emplace_back("b:v", fmt::format("{}k", bit_rate / 1000));
    if (out.codec == CodecHint::HEVC)
      out.options.emplace_back("tag:v", "hvc1");
  } else if (out.encoder == "libx264") {
    out.options.emplace_back("crf", "18");
    out.options.emplace_back("preset", "medium");
  } else if (out.encoder == "libx265") {
    out.options.emplace_back("crf", "20");
    out.options.emplace_back("preset", "medium");
    out.options.emplace_back("tag:v", "hvc1");
  } else if (out.encoder == "libvpx-vp9") {
    out.options.emplace_back("crf", "30");
    out.options.emplace_back("b:v", "0");
  } else if (out.encoder == "prores_ks") {
    out.options.emplace_back("profile:v", std::to_string(profile));
    out.options.emplace_back("vendor", "apl0");
  }

  out.pixel_format =
      pixel_format_for(out, source, settings.enable_alpha, profile);
  if (out.backend == "vaapi")
    out.hw_device = options.vaapi_device;
  return ErrorCode::Ok;
}

// **----- BUILDER -----**

namespace {

/**
 * @class GraphWriter
 * @brief Appends stages to a spec, threading pad labels between them.
 */
class GraphWriter {
  FilterGraphSpec &spec_;
  int next_label_ = 0;

public:
  explicit GraphWriter(FilterGraphSpec &spec) : spec_(spec) {}

  std::string fresh() { return fmt::format("v{}", next_label_++); }

  /// Add a stage reading inputs and producing one fresh pad
  std::string add(const std::string &name, std::vector<std::string> inputs,
                  std::vector<FilterParam> params) {
    FilterStage stage;
    stage.name = name;
    stage.inputs = std::move(inputs);
    stage.outputs.push_back(fresh());
    stage.params = std::move(params);
    spec_.stages.push_back(std::move(stage));
    return spec_.stages.back().outputs.front();
  }
};

std::vector<FilterParam> crop_params(const PixelRect &r) {
  return {{"w", r.width}, {"h", r.height}, {"x", r.x}, {"y", r.y}};
}

} // anonymous namespace

ErrorCode build_filter_graph(const SourceVideoProperties &source,
                             const ExportSettings &settings,
                             const TimelineSummary &summary,
                             const MaskAssets *assets,
                             const GraphOptions &options,
                             FilterGraphSpec &out) {
  out = FilterGraphSpec{};

  int width = even_floor(source.width);
  int height = even_floor(source.height);
  if (width == 0 || height == 0)
    return ErrorCode::OddDimension;

  ErrorCode err = select_encoder(source, settings, options, out.encoder);
  if (!ok(err))
    return err;

  GraphInput src;
  src.kind = InputKind::Source;
  out.inputs.push_back(src);

  GraphWriter graph(out);
  std::string pad = "0:v";
  bool odd_source = width != source.width || height != source.height;
  PixelRect frame{0, 0, width, height};

  out.output_width = width;
  out.output_height = height;

  bool rectangle = summary.mode == CropMode::Rectangle;

  if (summary.passthrough || (rectangle && settings.preserve_full_frame)) {
    if (odd_source)
      pad = graph.add("crop", {pad}, crop_params(frame));

  } else if (rectangle && summary.is_static) {
    PixelRect px = rect_to_pixels(
        std::get<RectangleCrop>(summary.representative).rect, width, height);
    if (px.width == 0 || px.height == 0)
      return ErrorCode::OddDimension;
    if (!(px == frame) || odd_source)
      pad = graph.add("crop", {pad}, crop_params(px));
    out.output_width = px.width;
    out.output_height = px.height;

  } else if (rectangle) {
    if (!assets || assets->crop_commands_path.empty())
      return ErrorCode::InvalidInput;
    if (summary.max_crop_width == 0 || summary.max_crop_height == 0)
      return ErrorCode::OddDimension;
    PixelRect first = rect_to_pixels(
        std::get<RectangleCrop>(summary.representative).rect, width, height);
    pad = graph.add("sendcmd", {pad}, {{"f", assets->crop_commands_path}});
    pad = graph.add("crop", {pad}, crop_params(first));
    /// Each crop is fitted inside the output and letterboxed, never stretched
    pad = graph.add("scale", {pad},
                    {{"w", summary.max_crop_width},
                     {"h", summary.max_crop_height},
                     {"force_original_aspect_ratio", "decrease"},
                     {"force_divisible_by", 2},
                     {"eval", "frame"}});
    pad = graph.add("pad", {pad},
                    {{"w", summary.max_crop_width},
                     {"h", summary.max_crop_height},
                     {"x", "(ow-iw)/2"},
                     {"y", "(oh-ih)/2"},
                     {"color", options.background_color},
                     {"eval", "frame"}});
    pad = graph.add("setsar", {pad}, {{"", 1}});
    out.output_width = summary.max_crop_width;
    out.output_height = summary.max_crop_height;

  } else {
    GraphInput mask;
    mask.frame_rate = source.frame_rate;
    if (summary.is_static) {
      if (!assets || assets->static_mask_path.empty())
        return ErrorCode::InvalidInput;
      mask.kind = InputKind::StaticMask;
      mask.path = assets->static_mask_path;
      mask.duration = source.duration;
    } else {
      if (!assets || assets->sequence_pattern.empty())
        return ErrorCode::InvalidInput;
      mask.kind = InputKind::MaskSequence;
      mask.path = assets->sequence_pattern;
    }
    out.inputs.push_back(mask);

    const PixelRect &box = summary.union_box;
    if (box.width == 0 || box.height == 0)
      return ErrorCode::OddDimension;

    std::string fg = graph.add("crop", {pad}, crop_params(box));
    std::string gray = graph.add("format", {"1:v"}, {{"", "gray"}});
    std::string alpha = graph.add("crop", {gray}, crop_params(box));
    pad = graph.add("alphamerge", {fg, alpha}, {});

    if (!settings.enable_alpha) {
      double rate = source.frame_rate > 0.0 ? source.frame_rate : 30.0;
      std::string bg = graph.add(
          "color", {},
          {{"c", options.background_color},
           {"s", fmt::format("{}x{}", box.width, box.height)},
           {"r", rate}});
      pad = graph.add("overlay", {bg, pad},
                      {{"shortest", 1}, {"format", "auto"}});
    }
    out.output_width = box.width;
    out.output_height = box.height;
  }

  /// VAAPI takes frames from GPU memory; the format is set in-graph
  if (out.encoder.backend == "vaapi") {
    std::string fmt_name =
        out.encoder.pixel_format == "p010le" ? "p010le" : "nv12";
    pad = graph.add("format", {pad}, {{"", fmt_name}});
    pad = graph.add("hwupload", {pad}, {});
    out.encoder.pixel_format.clear();
  }

  if (!out.stages.empty())
    out.output_label = pad;

  out.stream_copy = out.stages.empty() && !settings.enable_alpha &&
                    settings.codec_hint == CodecHint::MatchSource &&
                    !settings.use_hardware_encoder;
  return ErrorCode::Ok;
}

} // namespace keycrop
