/**
 * @file ffmpeg_executor.hpp
 * @brief FFmpeg execution for frame-accurate segment extraction
 *
 * @details Builds and runs the external ffmpeg command for one validated
 *          ExtractionPlan. The segment is re-encoded so the cut lands on the
 *          requested frame rather than the nearest keyframe.
 */

#ifndef SCENE_CUT_FFMPEG_EXECUTOR_HPP
#define SCENE_CUT_FFMPEG_EXECUTOR_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace scene_cut {

/**
 * @brief Build the ffmpeg argv for an extraction.
 *
 * @param ffmpeg_bin FFmpeg executable
 * @param input_path Source video
 * @param output_path Destination file (overwritten)
 * @param plan Seek position and duration
 */
std::vector<std::string> build_extract_command(const std::string &ffmpeg_bin,
                                               const std::string &input_path,
                                               const std::string &output_path,
                                               const ExtractionPlan &plan);

/**
 * @brief Execute FFmpeg to extract a segment.
 *
 * @param input_path Source video
 * @param output_path Destination file
 * @param plan Seek position and duration
 * @param stream_id Stream ID for logging (-1 = no prefix)
 * @return 0 on success, non-zero on error
 */
int execute_ffmpeg_extract(const std::string &input_path,
                           const std::string &output_path,
                           const ExtractionPlan &plan, int stream_id = -1);

} // namespace scene_cut

#endif // SCENE_CUT_FFMPEG_EXECUTOR_HPP
