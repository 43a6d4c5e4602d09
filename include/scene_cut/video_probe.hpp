/**
 * @file video_probe.hpp
 * @brief Video metadata extraction
 */

#ifndef SCENE_CUT_VIDEO_PROBE_HPP
#define SCENE_CUT_VIDEO_PROBE_HPP

#include <string>

#include "types.hpp"

namespace scene_cut {

/**
 * @brief Probe duration, exact frame rate, resolution and frame count.
 *
 * @note The frame rate is taken as a rational straight from the stream and
 *       total_frames is derived with compute_total_frames(), so repeated
 *       probes of one file always agree.
 *
 * @param path Video file path
 * @return Populated VideoInfo
 * @throws ProbeError if the file cannot be opened, has no decodable video
 *         stream, no usable frame rate, or no frames
 */
VideoInfo probe_video(const std::string &path);

} // namespace scene_cut

#endif // SCENE_CUT_VIDEO_PROBE_HPP
