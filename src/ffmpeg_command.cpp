/**
 * @file ffmpeg_command.cpp
 * @brief FFmpeg command-line serialization
 */

#include "keycrop/ffmpeg_command.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>

#include <fmt/core.h>

namespace keycrop {

namespace {

/// Characters with meaning in option lists or the graph grammar
bool needs_quoting(const std::string &s) {
  return s.empty() ||
         s.find_first_of(":,;[]'\\= \t") != std::string::npos;
}

/// Backslash-escape the characters the graph parser splits on
std::string escape_graph_level(const std::string &s) {
  std::string out;
  for (char c : s) {
    if (c == '\\' || c == '\'' || c == '[' || c == ']' || c == ',' ||
        c == ';')
      out += '\\';
    out += c;
  }
  return out;
}

std::string quote(const std::string &s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

} // anonymous namespace

std::string format_param_value(const ParamValue &value) {
  if (const int *i = std::get_if<int>(&value))
    return std::to_string(*i);
  if (const double *d = std::get_if<double>(&value))
    return fmt::format("{}", *d);
  const std::string &s = std::get<std::string>(value);
  /// Quoted for the filter's option parser, then escaped for the graph
  /// parser which unescapes it first
  return needs_quoting(s) ? escape_graph_level(quote(s)) : s;
}

std::string stage_to_string(const FilterStage &stage) {
  std::string out;
  for (const auto &in : stage.inputs)
    out += fmt::format("[{}]", in);
  out += stage.name;
  for (size_t i = 0; i < stage.params.size(); ++i) {
    out += i == 0 ? '=' : ':';
    const auto &p = stage.params[i];
    if (!p.key.empty())
      out += p.key + "=";
    out += format_param_value(p.value);
  }
  for (const auto &o : stage.outputs)
    out += fmt::format("[{}]", o);
  return out;
}

std::string graph_to_string(const FilterGraphSpec &spec) {
  std::string out;
  for (size_t i = 0; i < spec.stages.size(); ++i) {
    if (i > 0)
      out += ';';
    out += stage_to_string(spec.stages[i]);
  }
  return out;
}

std::vector<std::string> to_ffmpeg_args(const FilterGraphSpec &spec,
                                        const SourceVideoProperties &source,
                                        const std::string &input_path,
                                        const std::string &output_path) {
  std::vector<std::string> args = {"-hide_banner", "-y",       "-nostats",
                                   "-progress",    "pipe:1",   "-loglevel",
                                   "error"};

  if (!spec.encoder.hw_device.empty()) {
    args.push_back("-vaapi_device");
    args.push_back(spec.encoder.hw_device);
  }

  for (const auto &in : spec.inputs) {
    switch (in.kind) {
    case InputKind::Source:
      args.push_back("-i");
      args.push_back(input_path);
      break;
    case InputKind::StaticMask:
      args.push_back("-loop");
      args.push_back("1");
      if (in.frame_rate > 0.0) {
        args.push_back("-framerate");
        args.push_back(fmt::format("{}", in.frame_rate));
      }
      if (in.duration > 0.0) {
        args.push_back("-t");
        args.push_back(fmt::format("{:.6f}", in.duration));
      }
      args.push_back("-i");
      args.push_back(in.path);
      break;
    case InputKind::MaskSequence:
      if (in.frame_rate > 0.0) {
        args.push_back("-framerate");
        args.push_back(fmt::format("{}", in.frame_rate));
      }
      args.push_back("-start_number");
      args.push_back("0");
      args.push_back("-i");
      args.push_back(in.path);
      break;
    }
  }

  if (!spec.stages.empty()) {
    args.push_back("-filter_complex");
    args.push_back(graph_to_string(spec));
    args.push_back("-map");
    args.push_back(fmt::format("[{}]", spec.output_label));
  } else {
    args.push_back("-map");
    args.push_back("0:v:0");
  }
  args.push_back("-map");
  args.push_back("0:a?");

  if (spec.stream_copy) {
    args.push_back("-c:v");
    args.push_back("copy");
  } else {
    args.push_back("-c:v");
    args.push_back(spec.encoder.encoder);
    for (const auto &opt : spec.encoder.options) {
      args.push_back("-" + opt.first);
      args.push_back(opt.second);
    }
    if (!spec.encoder.pixel_format.empty()) {
      args.push_back("-pix_fmt");
      args.push_back(spec.encoder.pixel_format);
    }
    if (!source.color_primaries.empty()) {
      args.push_back("-color_primaries");
      args.push_back(source.color_primaries);
    }
    if (!source.color_transfer.empty()) {
      args.push_back("-color_trc");
      args.push_back(source.color_transfer);
    }
    if (!source.color_space.empty()) {
      args.push_back("-colorspace");
      args.push_back(source.color_space);
    }
  }

  args.push_back("-c:a");
  args.push_back("copy");
  args.push_back("-map_metadata");
  args.push_back("0");

  /// A looped mask with no known length never ends on its own
  bool unbounded_mask = std::any_of(
      spec.inputs.begin(), spec.inputs.end(), [](const GraphInput &in) {
        return in.kind == InputKind::StaticMask && in.duration <= 0.0;
      });
  if (unbounded_mask)
    args.push_back("-shortest");
  args.push_back(output_path);
  return args;
}

std::string format_command_line(const std::string &program,
                                const std::vector<std::string> &args) {
  std::string out = program;
  for (const auto &a : args) {
    out += ' ';
    out += a.find_first_of(" '\"[];|&") == std::string::npos ? a : quote(a);
  }
  return out;
}

bool parse_progress_line(const std::string &line, double &seconds) {
  size_t eq = line.find('=');
  if (eq == std::string::npos)
    return false;
  std::string key = line.substr(0, eq);
  std::string value = line.substr(eq + 1);
  if (value.empty() || value == "N/A")
    return false;

  if (key == "out_time_us" || key == "out_time_ms") {
    char *end = nullptr;
    long long us = std::strtoll(value.c_str(), &end, 10);
    if (end == value.c_str() || us < 0)
      return false;
    seconds = us / 1e6;
    return true;
  }

  if (key == "out_time") {
    int h = 0, m = 0;
    double s = 0.0;
    bool negative = !value.empty() && value[0] == '-';
    if (negative)
      return false;
    if (std::sscanf(value.c_str(), "%d:%d:%lf", &h, &m, &s) != 3)
      return false;
    seconds = h * 3600.0 + m * 60.0 + s;
    return true;
  }
  return false;
}

} // namespace keycrop
