#ifndef BOWTIEMODEL_SERIALIZATION_GEOMETRY_JSON_HPP
#define BOWTIEMODEL_SERIALIZATION_GEOMETRY_JSON_HPP

#include <nlohmann/json.hpp>
#include <geometry/bowtie_builder.hpp>
#include <geometry/primitives.hpp>
#include <model/command_formatter.hpp>
#include "config_json.hpp"

namespace bowtiemodel {

// Triangle serialization
inline void to_json(nlohmann::json& j, const Triangle& triangle) {
    j = {
        {"vertices", triangle.vertices},
        {"thickness", triangle.thickness},
        {"material", triangle.material}
    };
}

// GeometryView serialization
inline void to_json(nlohmann::json& j, const GeometryView& view) {
    j = {
        {"min", view.min_corner},
        {"max", view.max_corner},
        {"step", view.step},
        {"id", view.id},
        {"mode", view_mode_code(view.mode)}
    };
}

inline nlohmann::json bowtie_geometry_to_json(const BowtieGeometry& geometry) {
    nlohmann::json j;
    j["feed_point"] = geometry.feed_point;
    j["wings"] = geometry.wings;
    if (geometry.probe_point) {
        j["probe_point"] = *geometry.probe_point;
    }
    j["views"] = nlohmann::json::array({geometry.full_view, geometry.detail_view});
    j["extent"] = {
        {"min", geometry.antenna_min()},
        {"max", geometry.antenna_max()}
    };
    return j;
}

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_SERIALIZATION_GEOMETRY_JSON_HPP
