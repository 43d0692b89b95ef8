/**
 * @file filter_graph.hpp
 * @brief Timeline summary, encoder selection and filter-graph construction
 *
 * @details The builder is a pure function from (source, settings, timeline
 *          summary, mask assets) to a structured FilterGraphSpec. It knows
 *          the shape of the graph (which stages, which pads, which typed
 *          parameters) but not FFmpeg's string grammar; ffmpeg_command.hpp
 *          serializes the result.
 *
 * @attention GRAPH SHAPES:
 *
 *   - Passthrough / preserveFullFrame rectangle: no stages (a crop to the
 *     even frame size when the source is odd)
 *
 *   - Static rectangle: crop
 *
 *   - Keyframed rectangle: sendcmd -> crop -> scale -> pad -> setsar (each
 *     crop is fitted inside the largest sampled size and letterboxed)
 *
 *   - Circle / freehand / AI: [0:v]crop + [1:v]format=gray,crop ->
 *     alphamerge, then overlay on a color source unless alpha is exported
 *
 *   - VAAPI encoders append format + hwupload
 */

#ifndef KEYCROP_FILTER_GRAPH_HPP
#define KEYCROP_FILTER_GRAPH_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"
#include "timeline.hpp"
#include "types.hpp"

namespace keycrop {

// **----- GRAPH DESCRIPTION -----**

using ParamValue = std::variant<int, double, std::string>;

/**
 * @struct FilterParam
 * @brief One filter option. An empty key is a positional argument.
 */
struct FilterParam {
  std::string key;
  ParamValue value;
};

/**
 * @struct FilterStage
 * @brief A named filter with its input/output pad labels.
 * @note Source filters (e.g. color) have no inputs.
 */
struct FilterStage {
  std::string name;
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;
  std::vector<FilterParam> params;

  /// Value of the first param named key, or nullptr
  const ParamValue *param(const std::string &key) const;
};

enum class InputKind {
  Source,      //< The video being exported (input 0)
  StaticMask,  //< One mask image looped for the whole duration
  MaskSequence //< One mask image per output frame
};

/**
 * @struct GraphInput
 * @brief An encoder input and how it is to be read.
 */
struct GraphInput {
  InputKind kind = InputKind::Source;
  std::string path;        //< Empty for Source (supplied at invocation)
  double frame_rate = 0.0; //< Mask inputs: rate matching the source
  double duration = 0.0;   //< StaticMask: loop length, 0 = unbounded
};

/**
 * @struct EncoderSelection
 * @brief Resolved encoder row plus its options.
 */
struct EncoderSelection {
  std::string encoder;      //< e.g. "libx264", "hevc_nvenc", "prores_ks"
  CodecHint codec = CodecHint::H264; //< Logical codec (never MatchSource)
  bool hardware = false;
  std::string backend;      //< Hardware family, empty for software
  std::string pixel_format; //< -pix_fmt value, empty when set in-graph
  std::string hw_device;    //< VAAPI render node
  std::vector<std::pair<std::string, std::string>> options;
};

/**
 * @struct FilterGraphSpec
 * @brief Complete, encoder-agnostic description of one export.
 */
struct FilterGraphSpec {
  std::vector<GraphInput> inputs;
  std::vector<FilterStage> stages;
  std::string output_label; //< Pad to map, empty when there are no stages
  int output_width = 0;
  int output_height = 0;
  EncoderSelection encoder;
  bool stream_copy = false; //< Nothing to filter: copy the video stream

  /// First stage with the given filter name, or nullptr
  const FilterStage *find_stage(const std::string &name) const;
};

// **----- TIMELINE SUMMARY -----**

/**
 * @struct TimelineSummary
 * @brief What the builder needs to know about an animated crop.
 * @note Produced by summarize_timeline(); samples are kept only when the
 *       geometry varies (they drive the per-frame mask sequence).
 */
struct TimelineSummary {
  CropMode mode = CropMode::Rectangle;
  bool passthrough = true; //< No visible crop at any time
  bool is_static = true;   //< Every sample equals the first
  double frame_rate = 0.0;
  int frame_count = 0;              //< Number of sampled output frames
  CropGeometry representative;      //< Sample at t = 0
  std::vector<CropGeometry> samples; //< One per output frame when dynamic
  PixelRect union_box;              //< Even-sized union of sample bounds
  int max_crop_width = 0;           //< Rectangle: largest sampled size
  int max_crop_height = 0;
};

/**
 * @brief Sample the timeline once per output frame and classify it.
 *
 * @param timeline Borrowed timeline
 * @param source Probed source (even-truncated internally)
 * @param out Summary
 * @return Ok, OddDimension (frame smaller than 2x2)
 */
ErrorCode summarize_timeline(const CropTimeline &timeline,
                             const SourceVideoProperties &source,
                             TimelineSummary &out);

/**
 * @brief Pixel crop for a normalized rect: offsets floored, sizes
 *        truncated to even and kept inside the frame.
 */
PixelRect rect_to_pixels(const NormalizedRect &rect, int width, int height);

// **----- ENCODER SELECTION -----**

/**
 * @struct GraphOptions
 * @brief Environment-dependent inputs to the builder.
 */
struct GraphOptions {
  std::string hw_backend = "nvenc";
  std::string vaapi_device = "/dev/dri/renderD128";
  std::string background_color = "black";
  int64_t default_bit_rate = 10000000;

  /// Values from the Config namespace
  static GraphOptions from_config();
};

/**
 * @brief Resolve the logical output codec.
 * @return Ok or UnsupportedCodec (explicit H.264/HEVC with alpha)
 */
ErrorCode resolve_codec(const SourceVideoProperties &source,
                        const ExportSettings &settings, CodecHint &codec);

/**
 * @brief Deterministic encoder table lookup.
 * @return Ok or UnsupportedCodec (unknown backend or codec)
 */
ErrorCode select_encoder(const SourceVideoProperties &source,
                         const ExportSettings &settings,
                         const GraphOptions &options, EncoderSelection &out);

/// prores_ks profile number for a source fourcc (hq when unknown)
int prores_profile_for(const std::string &codec_tag);

// **----- BUILDER -----**

/**
 * @struct MaskAssets
 * @brief Files written during mask preparation, referenced by the graph.
 */
struct MaskAssets {
  std::string static_mask_path;   //< Single PGM for constant geometry
  std::string sequence_pattern;   //< printf pattern, e.g. ".../mask_%06d.pgm"
  std::string crop_commands_path; //< sendcmd script for animated rectangles
};

/**
 * @brief Build the filter graph and encoder selection for one export.
 *
 * @param source Probed source properties
 * @param settings Export settings
 * @param summary Result of summarize_timeline()
 * @param assets Mask/command files; may be null when none are needed
 * @param options Backend, device and fill color
 * @param out Filter graph
 * @return Ok, OddDimension, UnsupportedCodec, InvalidInput (missing asset)
 */
ErrorCode build_filter_graph(const SourceVideoProperties &source,
                             const ExportSettings &settings,
                             const TimelineSummary &summary,
                             const MaskAssets *assets,
                             const GraphOptions &options,
                             FilterGraphSpec &out);

/// Whether the summary requires rasterized mask files
bool needs_masks(const TimelineSummary &summary);

/**
 * @brief sendcmd script driving the crop filter of a keyframed rectangle.
 * @note One line per frame whose pixel rect differs from the previous one.
 */
std::string crop_command_script(const TimelineSummary &summary, int width,
                                int height);

} // namespace keycrop

#endif // KEYCROP_FILTER_GRAPH_HPP
