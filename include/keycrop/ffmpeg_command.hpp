/**
 * @file ffmpeg_command.hpp
 * @brief FilterGraphSpec -> FFmpeg command line, and progress parsing
 *
 * @details The only place that knows FFmpeg's filtergraph grammar:
 *          "[in]name=key=value:key=value[out];..." with values quoted when
 *          they contain graph metacharacters.
 */

#ifndef KEYCROP_FFMPEG_COMMAND_HPP
#define KEYCROP_FFMPEG_COMMAND_HPP

#include <string>
#include <vector>

#include "filter_graph.hpp"
#include "types.hpp"

namespace keycrop {

/// Filter option value as FFmpeg reads it (quoted when needed)
std::string format_param_value(const ParamValue &value);

/// One stage: "[a][b]name=k=v:k=v[out]"
std::string stage_to_string(const FilterStage &stage);

/// Whole -filter_complex argument, stages joined by ';'
std::string graph_to_string(const FilterGraphSpec &spec);

/**
 * @brief Full argv (without the program name) for one export.
 *
 * @param spec Built filter graph
 * @param source Probed source (color metadata is forwarded)
 * @param input_path Source video
 * @param output_path Destination file (overwritten)
 */
std::vector<std::string> to_ffmpeg_args(const FilterGraphSpec &spec,
                                        const SourceVideoProperties &source,
                                        const std::string &input_path,
                                        const std::string &output_path);

/// Shell-readable rendering of an argv, for logs only
std::string format_command_line(const std::string &program,
                                const std::vector<std::string> &args);

/**
 * @brief Parse one "-progress" key=value line.
 *
 * @note Understands out_time_us, out_time_ms (microseconds despite the
 *       name) and out_time=HH:MM:SS.ffffff.
 * @param line A single line without the trailing newline
 * @param seconds Output position in seconds
 * @return true when the line carried a usable position
 */
bool parse_progress_line(const std::string &line, double &seconds);

} // namespace keycrop

#endif // KEYCROP_FFMPEG_COMMAND_HPP
