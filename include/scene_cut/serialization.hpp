/**
 * @file serialization.hpp
 * @brief JSON encoding of results printed by the CLI and batch mode
 *
 * @details Field names follow the analyzer's wire format (snake_case), so a
 *          scene list written here can be read back by parse_primary_output().
 */

#ifndef SCENE_CUT_SERIALIZATION_HPP
#define SCENE_CUT_SERIALIZATION_HPP

#include <nlohmann/json.hpp>

#include "scene_detection.hpp"
#include "types.hpp"

namespace scene_cut {

void to_json(nlohmann::json &j, const Rational &r);
void to_json(nlohmann::json &j, const VideoInfo &info);
void to_json(nlohmann::json &j, const Scene &scene);
void to_json(nlohmann::json &j, const FrameRange &range);
void to_json(nlohmann::json &j, const ExtractionPlan &plan);
void to_json(nlohmann::json &j, const DetectionReport &report);

} // namespace scene_cut

#endif // SCENE_CUT_SERIALIZATION_HPP
