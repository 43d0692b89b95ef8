#include <algorithm>
#include <string>

#include <gtest/gtest.h>

#include "keycrop/filter_graph.hpp"

using namespace keycrop;

namespace {

SourceVideoProperties hd_source() {
  SourceVideoProperties s;
  s.width = 1920;
  s.height = 1080;
  s.frame_rate = 30.0;
  s.codec = "h264";
  s.codec_tag = "avc1";
  s.duration = 2.0;
  s.bit_rate = 8000000;
  return s;
}

int int_param(const FilterStage &stage, const std::string &key) {
  const ParamValue *v = stage.param(key);
  EXPECT_NE(v, nullptr) << stage.name << " has no " << key;
  return v ? std::get<int>(*v) : -1;
}

std::string str_param(const FilterStage &stage, const std::string &key) {
  const ParamValue *v = stage.param(key);
  EXPECT_NE(v, nullptr) << stage.name << " has no " << key;
  return v ? std::get<std::string>(*v) : std::string();
}

std::string option(const EncoderSelection &sel, const std::string &key) {
  for (const auto &kv : sel.options)
    if (kv.first == key)
      return kv.second;
  return "";
}

/// Summarize then build, failing the test on summary errors
ErrorCode build(const CropTimeline &tl, const SourceVideoProperties &source,
                const ExportSettings &settings, const MaskAssets *assets,
                FilterGraphSpec &spec, const GraphOptions &options = {}) {
  TimelineSummary summary;
  ErrorCode err = summarize_timeline(tl, source, summary);
  EXPECT_EQ(err, ErrorCode::Ok);
  if (!ok(err))
    return err;
  return build_filter_graph(source, settings, summary, assets, options, spec);
}

CropTimeline static_rect(NormalizedRect r) {
  CropTimeline tl(CropMode::Rectangle);
  Keyframe kf;
  kf.geometry = RectangleCrop{r};
  EXPECT_EQ(tl.add_keyframe(kf), ErrorCode::Ok);
  return tl;
}

CropTimeline static_circle(double radius) {
  CropTimeline tl(CropMode::Circle);
  Keyframe kf;
  kf.geometry = CircleCrop{{0.5, 0.5}, radius};
  EXPECT_EQ(tl.add_keyframe(kf), ErrorCode::Ok);
  return tl;
}

} // namespace

// **----- Graph construction -----**

TEST(FilterGraph, StaticRectangleCrop) {
  FilterGraphSpec spec;
  ASSERT_EQ(build(static_rect({0.1, 0.1, 0.5, 0.5}), hd_source(), {}, nullptr,
                  spec),
            ErrorCode::Ok);

  const FilterStage *crop = spec.find_stage("crop");
  ASSERT_NE(crop, nullptr);
  EXPECT_EQ(int_param(*crop, "x"), 192);
  EXPECT_EQ(int_param(*crop, "y"), 108);
  EXPECT_EQ(int_param(*crop, "w"), 960);
  EXPECT_EQ(int_param(*crop, "h"), 540);
  EXPECT_EQ(spec.stages.size(), 1u);
  EXPECT_EQ(spec.find_stage("alphamerge"), nullptr);
  EXPECT_EQ(spec.inputs.size(), 1u);
  EXPECT_EQ(spec.output_width, 960);
  EXPECT_EQ(spec.output_height, 540);
  EXPECT_EQ(spec.output_label, crop->outputs.front());
  EXPECT_FALSE(spec.stream_copy);
  EXPECT_EQ(spec.encoder.encoder, "libx264");
}

TEST(FilterGraph, OddSourceBecomesEven) {
  SourceVideoProperties src = hd_source();
  src.width = 1365;
  src.height = 767;

  FilterGraphSpec spec;
  ASSERT_EQ(build(CropTimeline(CropMode::Rectangle), src, {}, nullptr, spec),
            ErrorCode::Ok);
  const FilterStage *crop = spec.find_stage("crop");
  ASSERT_NE(crop, nullptr);
  EXPECT_EQ(int_param(*crop, "w"), 1364);
  EXPECT_EQ(int_param(*crop, "h"), 766);
  EXPECT_EQ(spec.output_width, 1364);
  EXPECT_EQ(spec.output_height, 766);
  EXPECT_FALSE(spec.stream_copy);
}

TEST(FilterGraph, OddSourceWithCropStaysEven) {
  SourceVideoProperties src = hd_source();
  src.width = 1365;
  src.height = 767;

  for (NormalizedRect r : {NormalizedRect{0.0, 0.0, 1.0, 1.0},
                           NormalizedRect{0.5, 0.5, 0.5, 0.5},
                           NormalizedRect{0.13, 0.07, 0.71, 0.33}}) {
    FilterGraphSpec spec;
    ASSERT_EQ(build(static_rect(r), src, {}, nullptr, spec), ErrorCode::Ok);
    EXPECT_EQ(spec.output_width % 2, 0);
    EXPECT_EQ(spec.output_height % 2, 0);
    ASSERT_NE(spec.find_stage("crop"), nullptr);
  }
}

TEST(FilterGraph, ShortPolygonIsPassthrough) {
  CropTimeline tl(CropMode::Freehand);
  Keyframe kf;
  kf.geometry = FreehandCrop{{{0.2, 0.2}, {0.8, 0.8}}};
  ASSERT_EQ(tl.add_keyframe(kf), ErrorCode::Ok);

  TimelineSummary summary;
  ASSERT_EQ(summarize_timeline(tl, hd_source(), summary), ErrorCode::Ok);
  EXPECT_TRUE(summary.passthrough);
  EXPECT_FALSE(needs_masks(summary));

  FilterGraphSpec spec;
  ASSERT_EQ(build_filter_graph(hd_source(), {}, summary, nullptr, {}, spec),
            ErrorCode::Ok);
  EXPECT_TRUE(spec.stages.empty());
  EXPECT_TRUE(spec.stream_copy);
  EXPECT_TRUE(spec.output_label.empty());
}

TEST(FilterGraph, PreserveFullFrameSkipsCrop) {
  ExportSettings settings;
  settings.preserve_full_frame = true;
  FilterGraphSpec spec;
  ASSERT_EQ(build(static_rect({0.1, 0.1, 0.5, 0.5}), hd_source(), settings,
                  nullptr, spec),
            ErrorCode::Ok);
  EXPECT_TRUE(spec.stages.empty());
  EXPECT_EQ(spec.output_width, 1920);
  EXPECT_EQ(spec.output_height, 1080);
}

TEST(FilterGraph, KeyframedRectangleUsesCommandScript) {
  SourceVideoProperties src = hd_source();
  src.frame_rate = 10.0;
  src.duration = 1.0;

  CropTimeline tl(CropMode::Rectangle);
  Keyframe a;
  a.geometry = RectangleCrop{{0.0, 0.0, 1.0, 1.0}};
  Keyframe b;
  b.timestamp = 1.0;
  b.geometry = RectangleCrop{{0.25, 0.25, 0.5, 0.5}};
  ASSERT_EQ(tl.add_keyframe(a), ErrorCode::Ok);
  ASSERT_EQ(tl.add_keyframe(b), ErrorCode::Ok);

  TimelineSummary summary;
  ASSERT_EQ(summarize_timeline(tl, src, summary), ErrorCode::Ok);
  EXPECT_FALSE(summary.is_static);
  EXPECT_EQ(summary.frame_count, 10);
  EXPECT_EQ(summary.samples.size(), 10u);
  EXPECT_EQ(summary.max_crop_width, 1920);
  EXPECT_EQ(summary.max_crop_height, 1080);

  FilterGraphSpec spec;
  EXPECT_EQ(build_filter_graph(src, {}, summary, nullptr, {}, spec),
            ErrorCode::InvalidInput);

  MaskAssets assets;
  assets.crop_commands_path = "/tmp/job/crop.cmd";
  ASSERT_EQ(build_filter_graph(src, {}, summary, &assets, {}, spec),
            ErrorCode::Ok);
  ASSERT_EQ(spec.stages.size(), 5u);
  EXPECT_EQ(spec.stages[0].name, "sendcmd");
  EXPECT_EQ(str_param(spec.stages[0], "f"), "/tmp/job/crop.cmd");
  EXPECT_EQ(spec.stages[1].name, "crop");
  EXPECT_EQ(spec.stages[2].name, "scale");
  EXPECT_EQ(int_param(spec.stages[2], "w"), 1920);
  EXPECT_EQ(spec.stages[3].name, "pad");
  EXPECT_EQ(spec.stages[4].name, "setsar");

  std::string script = crop_command_script(summary, 1920, 1080);
  EXPECT_EQ(script.rfind("0.000000 crop w 1920, crop h 1080, crop x 0, crop y 0;\n",
                         0),
            0u);
  EXPECT_EQ(std::count(script.begin(), script.end(), '\n'), 10);
}

TEST(FilterGraph, KeyframedRectangleKeepsAspectRatio) {
  SourceVideoProperties src = hd_source();
  src.frame_rate = 2.0;
  src.duration = 1.5;

  CropTimeline tl(CropMode::Rectangle);
  Keyframe tall;
  tall.geometry = RectangleCrop{{0.0, 0.0, 0.5, 1.0}};
  Keyframe wide;
  wide.timestamp = 1.0;
  wide.geometry = RectangleCrop{{0.0, 0.0, 1.0, 0.5}};
  ASSERT_EQ(tl.add_keyframe(tall), ErrorCode::Ok);
  ASSERT_EQ(tl.add_keyframe(wide), ErrorCode::Ok);

  TimelineSummary summary;
  ASSERT_EQ(summarize_timeline(tl, src, summary), ErrorCode::Ok);
  ASSERT_EQ(summary.samples.size(), 3u);

  MaskAssets assets;
  assets.crop_commands_path = "/tmp/job/crop.cmd";
  GraphOptions options;
  options.background_color = "0x102030";
  FilterGraphSpec spec;
  ASSERT_EQ(build_filter_graph(src, {}, summary, &assets, options, spec),
            ErrorCode::Ok);
  EXPECT_EQ(spec.output_width, 1920);
  EXPECT_EQ(spec.output_height, 1080);

  const FilterStage *scale = spec.find_stage("scale");
  ASSERT_NE(scale, nullptr);
  EXPECT_EQ(str_param(*scale, "force_original_aspect_ratio"), "decrease");
  const FilterStage *pad = spec.find_stage("pad");
  ASSERT_NE(pad, nullptr);
  EXPECT_EQ(int_param(*pad, "w"), spec.output_width);
  EXPECT_EQ(int_param(*pad, "h"), spec.output_height);
  EXPECT_EQ(str_param(*pad, "color"), "0x102030");

  /// Fit every sampled crop the way scale's "decrease" does
  for (const auto &g : summary.samples) {
    PixelRect crop =
        rect_to_pixels(std::get<RectangleCrop>(g).rect, 1920, 1080);
    double scale_by =
        std::min(static_cast<double>(spec.output_width) / crop.width,
                 static_cast<double>(spec.output_height) / crop.height);
    double fitted_w = crop.width * scale_by;
    double fitted_h = crop.height * scale_by;
    EXPECT_LE(fitted_w, spec.output_width + 1e-9);
    EXPECT_LE(fitted_h, spec.output_height + 1e-9);
    EXPECT_NEAR(fitted_w / fitted_h,
                static_cast<double>(crop.width) / crop.height, 1e-9)
        << crop.width << "x" << crop.height;
  }
}

TEST(FilterGraph, CircleMaskOverBackground) {
  TimelineSummary summary;
  ASSERT_EQ(summarize_timeline(static_circle(0.25), hd_source(), summary),
            ErrorCode::Ok);
  EXPECT_TRUE(summary.is_static);
  EXPECT_TRUE(needs_masks(summary));
  EXPECT_EQ(summary.union_box, (PixelRect{690, 270, 540, 540}));

  FilterGraphSpec spec;
  EXPECT_EQ(build_filter_graph(hd_source(), {}, summary, nullptr, {}, spec),
            ErrorCode::InvalidInput);

  MaskAssets assets;
  assets.static_mask_path = "/tmp/job/mask.pgm";
  ASSERT_EQ(build_filter_graph(hd_source(), {}, summary, &assets, {}, spec),
            ErrorCode::Ok);

  ASSERT_EQ(spec.inputs.size(), 2u);
  EXPECT_EQ(spec.inputs[1].kind, InputKind::StaticMask);
  EXPECT_EQ(spec.inputs[1].path, "/tmp/job/mask.pgm");
  EXPECT_DOUBLE_EQ(spec.inputs[1].duration, 2.0);

  const FilterStage *merge = spec.find_stage("alphamerge");
  ASSERT_NE(merge, nullptr);
  EXPECT_EQ(merge->inputs.size(), 2u);
  const FilterStage *color = spec.find_stage("color");
  ASSERT_NE(color, nullptr);
  EXPECT_EQ(str_param(*color, "c"), "black");
  EXPECT_EQ(str_param(*color, "s"), "540x540");
  ASSERT_NE(spec.find_stage("overlay"), nullptr);
  EXPECT_EQ(spec.output_label, spec.stages.back().outputs.front());
  EXPECT_EQ(spec.output_width, 540);
}

TEST(FilterGraph, CircleWithAlphaExportsProRes4444) {
  TimelineSummary summary;
  ASSERT_EQ(summarize_timeline(static_circle(0.25), hd_source(), summary),
            ErrorCode::Ok);
  MaskAssets assets;
  assets.static_mask_path = "/tmp/job/mask.pgm";
  ExportSettings settings;
  settings.enable_alpha = true;

  FilterGraphSpec spec;
  ASSERT_EQ(build_filter_graph(hd_source(), settings, summary, &assets, {},
                               spec),
            ErrorCode::Ok);
  EXPECT_EQ(spec.find_stage("overlay"), nullptr);
  EXPECT_EQ(spec.stages.back().name, "alphamerge");
  EXPECT_EQ(spec.encoder.encoder, "prores_ks");
  EXPECT_EQ(option(spec.encoder, "profile:v"), "4");
  EXPECT_EQ(spec.encoder.pixel_format, "yuva444p10le");
}

TEST(FilterGraph, AnimatedCircleUsesMaskSequence) {
  CropTimeline tl(CropMode::Circle);
  Keyframe a;
  a.geometry = CircleCrop{{0.5, 0.5}, 0.2};
  Keyframe b;
  b.timestamp = 2.0;
  b.geometry = CircleCrop{{0.5, 0.5}, 0.4};
  ASSERT_EQ(tl.add_keyframe(a), ErrorCode::Ok);
  ASSERT_EQ(tl.add_keyframe(b), ErrorCode::Ok);

  TimelineSummary summary;
  ASSERT_EQ(summarize_timeline(tl, hd_source(), summary), ErrorCode::Ok);
  EXPECT_FALSE(summary.is_static);
  EXPECT_EQ(summary.samples.size(), 60u);

  MaskAssets assets;
  assets.sequence_pattern = "/tmp/job/mask_%06d.pgm";
  FilterGraphSpec spec;
  ASSERT_EQ(build_filter_graph(hd_source(), {}, summary, &assets, {}, spec),
            ErrorCode::Ok);
  ASSERT_EQ(spec.inputs.size(), 2u);
  EXPECT_EQ(spec.inputs[1].kind, InputKind::MaskSequence);
  EXPECT_DOUBLE_EQ(spec.inputs[1].frame_rate, 30.0);
  EXPECT_EQ(spec.output_width % 2, 0);
  EXPECT_EQ(spec.output_height % 2, 0);
}

TEST(FilterGraph, VaapiUploadsInGraph) {
  GraphOptions options;
  options.hw_backend = "vaapi";
  ExportSettings settings;
  settings.use_hardware_encoder = true;

  FilterGraphSpec spec;
  ASSERT_EQ(build(static_rect({0.1, 0.1, 0.5, 0.5}), hd_source(), settings,
                  nullptr, spec, options),
            ErrorCode::Ok);
  EXPECT_EQ(spec.encoder.encoder, "h264_vaapi");
  EXPECT_EQ(spec.encoder.hw_device, "/dev/dri/renderD128");
  EXPECT_TRUE(spec.encoder.pixel_format.empty());
  ASSERT_GE(spec.stages.size(), 3u);
  EXPECT_EQ(spec.stages.back().name, "hwupload");
  const FilterStage &format = spec.stages[spec.stages.size() - 2];
  EXPECT_EQ(format.name, "format");
  EXPECT_EQ(str_param(format, ""), "nv12");
  EXPECT_FALSE(spec.stream_copy);
}

// **----- Encoder table -----**

TEST(EncoderTable, SoftwareDefaults) {
  EncoderSelection sel;
  ASSERT_EQ(select_encoder(hd_source(), {}, {}, sel), ErrorCode::Ok);
  EXPECT_EQ(sel.encoder, "libx264");
  EXPECT_FALSE(sel.hardware);
  EXPECT_EQ(option(sel, "crf"), "18");
  EXPECT_EQ(option(sel, "preset"), "medium");
  EXPECT_EQ(sel.pixel_format, "yuv420p");
}

TEST(EncoderTable, UnknownSourceCodecFallsBackToH264) {
  SourceVideoProperties src = hd_source();
  src.codec = "mpeg2video";
  CodecHint codec;
  ASSERT_EQ(resolve_codec(src, {}, codec), ErrorCode::Ok);
  EXPECT_EQ(codec, CodecHint::H264);
}

TEST(EncoderTable, HardwareRowsUseBitrate) {
  ExportSettings settings;
  settings.use_hardware_encoder = true;
  settings.codec_hint = CodecHint::HEVC;
  SourceVideoProperties src = hd_source();
  src.bit_depth = 10;

  EncoderSelection sel;
  ASSERT_EQ(select_encoder(src, settings, {}, sel), ErrorCode::Ok);
  EXPECT_EQ(sel.encoder, "hevc_nvenc");
  EXPECT_TRUE(sel.hardware);
  EXPECT_EQ(option(sel, "b:v"), "8000k");
  EXPECT_EQ(option(sel, "tag:v"), "hvc1");
  EXPECT_EQ(sel.pixel_format, "p010le");

  src.bit_rate = 0;
  ASSERT_EQ(select_encoder(src, settings, {}, sel), ErrorCode::Ok);
  EXPECT_EQ(option(sel, "b:v"), "10000k");

  settings.use_hardware_encoder = false;
  ASSERT_EQ(select_encoder(src, settings, {}, sel), ErrorCode::Ok);
  EXPECT_EQ(sel.encoder, "libx265");
  EXPECT_EQ(sel.pixel_format, "yuv420p10le");
}

TEST(EncoderTable, MissingHardwareRowFallsBackToSoftware) {
  ExportSettings settings;
  settings.use_hardware_encoder = true;
  settings.codec_hint = CodecHint::ProRes;

  EncoderSelection sel;
  ASSERT_EQ(select_encoder(hd_source(), settings, {}, sel), ErrorCode::Ok);
  EXPECT_EQ(sel.encoder, "prores_ks");
  EXPECT_FALSE(sel.hardware);

  GraphOptions vt;
  vt.hw_backend = "videotoolbox";
  ASSERT_EQ(select_encoder(hd_source(), settings, vt, sel), ErrorCode::Ok);
  EXPECT_EQ(sel.encoder, "prores_videotoolbox");

  settings.enable_alpha = true;
  ASSERT_EQ(select_encoder(hd_source(), settings, vt, sel), ErrorCode::Ok);
  EXPECT_EQ(sel.encoder, "prores_ks");
}

TEST(EncoderTable, UnknownBackendRejected) {
  GraphOptions options;
  options.hw_backend = "cuda9000";
  ExportSettings settings;
  settings.use_hardware_encoder = true;
  EncoderSelection sel;
  EXPECT_EQ(select_encoder(hd_source(), settings, options, sel),
            ErrorCode::UnsupportedCodec);
}

TEST(EncoderTable, AlphaNeedsProResOrVp9) {
  ExportSettings settings;
  settings.enable_alpha = true;
  EncoderSelection sel;

  settings.codec_hint = CodecHint::H264;
  EXPECT_EQ(select_encoder(hd_source(), settings, {}, sel),
            ErrorCode::UnsupportedCodec);
  settings.codec_hint = CodecHint::HEVC;
  EXPECT_EQ(select_encoder(hd_source(), settings, {}, sel),
            ErrorCode::UnsupportedCodec);

  settings.codec_hint = CodecHint::VP9;
  ASSERT_EQ(select_encoder(hd_source(), settings, {}, sel), ErrorCode::Ok);
  EXPECT_EQ(sel.encoder, "libvpx-vp9");
  EXPECT_EQ(sel.pixel_format, "yuva420p");
  EXPECT_EQ(option(sel, "b:v"), "0");

  settings.codec_hint = CodecHint::MatchSource;
  ASSERT_EQ(select_encoder(hd_source(), settings, {}, sel), ErrorCode::Ok);
  EXPECT_EQ(sel.codec, CodecHint::ProRes);
}

TEST(EncoderTable, ProResProfileFollowsSourceTag) {
  EXPECT_EQ(prores_profile_for("ap4x"), 5);
  EXPECT_EQ(prores_profile_for("apcn"), 2);
  EXPECT_EQ(prores_profile_for("avc1"), 3);

  SourceVideoProperties src = hd_source();
  src.codec = "prores";
  src.codec_tag = "apcs";
  EncoderSelection sel;
  ASSERT_EQ(select_encoder(src, {}, {}, sel), ErrorCode::Ok);
  EXPECT_EQ(option(sel, "profile:v"), "1");
  EXPECT_EQ(sel.pixel_format, "yuv422p10le");
}

TEST(EncoderTable, ExplicitCodecDisablesStreamCopy) {
  ExportSettings settings;
  settings.codec_hint = CodecHint::HEVC;
  FilterGraphSpec spec;
  ASSERT_EQ(build(CropTimeline(CropMode::Rectangle), hd_source(), settings,
                  nullptr, spec),
            ErrorCode::Ok);
  EXPECT_TRUE(spec.stages.empty());
  EXPECT_FALSE(spec.stream_copy);
}

// **----- Summary -----**

TEST(TimelineSummary, ZeroSizedFrameRejected) {
  SourceVideoProperties src = hd_source();
  src.width = 1;
  TimelineSummary summary;
  EXPECT_EQ(summarize_timeline(static_rect({0, 0, 1, 1}), src, summary),
            ErrorCode::OddDimension);
}

TEST(TimelineSummary, UnknownDurationSamplesOnce) {
  SourceVideoProperties src = hd_source();
  src.duration = 0.0;
  TimelineSummary summary;
  ASSERT_EQ(summarize_timeline(static_circle(0.3), src, summary),
            ErrorCode::Ok);
  EXPECT_EQ(summary.frame_count, 1);
  EXPECT_TRUE(summary.is_static);
}

TEST(RectToPixels, EvenAndInsideFrame) {
  PixelRect px = rect_to_pixels({0.5, 0.5, 0.5, 0.5}, 1364, 766);
  EXPECT_EQ(px.x, 682);
  EXPECT_EQ(px.y, 383);
  EXPECT_EQ(px.width, 682);
  EXPECT_EQ(px.height, 382);
  EXPECT_LE(px.x + px.width, 1364);
  EXPECT_LE(px.y + px.height, 766);
}
