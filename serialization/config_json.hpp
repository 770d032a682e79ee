#ifndef BOWTIEMODEL_SERIALIZATION_CONFIG_JSON_HPP
#define BOWTIEMODEL_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <common/errors.hpp>
#include <geometry/axis.hpp>
#include <geometry/placement.hpp>
#include <geometry/primitives.hpp>
#include <math/vec3.hpp>
#include <model/model_config.hpp>
#include <model/simulation_settings.hpp>
#include "json_serialization.hpp"
#include <string>

namespace bowtiemodel {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    if (!j.is_array() || j.size() != 3) {
        throw ConfigError("Expected an array of three numbers, got " + j.dump());
    }
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
    v.z = j[2].get<double>();
}

// Domain and spacing are written as plain [x, y, z] triples
inline void to_json(nlohmann::json& j, const Domain& domain) {
    j = domain.extent();
}

inline void from_json(const nlohmann::json& j, Domain& domain) {
    Vec3 v = j.get<Vec3>();
    domain = Domain{v.x, v.y, v.z};
}

inline void to_json(nlohmann::json& j, const GridSpacing& spacing) {
    j = spacing.step();
}

inline void from_json(const nlohmann::json& j, GridSpacing& spacing) {
    Vec3 v = j.get<Vec3>();
    spacing = GridSpacing{v.x, v.y, v.z};
}

// BowtieSpec serialization
inline void to_json(nlohmann::json& j, const BowtieSpec& bowtie) {
    j = {
        {"length", bowtie.length},
        {"height", bowtie.height}
    };
}

inline void from_json(const nlohmann::json& j, BowtieSpec& bowtie) {
    bowtie.length = j.value("length", bowtie.length);
    bowtie.height = j.value("height", bowtie.height);
}

// FeedOffset serialization
inline void to_json(nlohmann::json& j, const FeedOffset& offset) {
    j = {
        {"axis", std::string(1, axis_name(offset.axis))},
        {"cells", offset.cells},
        {"wings", offset_wings_name(offset.wings)}
    };
}

inline void from_json(const nlohmann::json& j, FeedOffset& offset) {
    if (j.contains("axis")) {
        offset.axis = axis_from_string(j["axis"].get<std::string>());
    }
    offset.cells = j.value("cells", offset.cells);
    if (j.contains("wings")) {
        offset.wings = offset_wings_from_string(j["wings"].get<std::string>());
    }
}

// Placement serialization. Reading only overrides the fields present, so a
// preset chosen from "variant" can be adjusted field by field.
inline void to_json(nlohmann::json& j, const Placement& placement) {
    j = {
        {"variant", variant_name(placement.variant)},
        {"ground_height", placement.ground_height},
        {"feed_offset", placement.feed_offset},
        {"receiver", placement.receiver},
        {"probe_offset", placement.probe_offset},
        {"full_domain_view", placement.full_domain_view},
        {"view_prefix", placement.view_prefix}
    };
}

inline void from_json(const nlohmann::json& j, Placement& placement) {
    if (j.contains("variant")) {
        placement.variant = variant_from_string(j["variant"].get<std::string>());
    }
    placement.ground_height = j.value("ground_height", placement.ground_height);
    if (j.contains("feed_offset")) {
        from_json(j["feed_offset"], placement.feed_offset);
    }
    placement.receiver = j.value("receiver", placement.receiver);
    if (j.contains("probe_offset")) {
        placement.probe_offset = j["probe_offset"].get<Vec3>();
    } else if (placement.variant == PlacementVariant::GroundOffset && j.contains("ground_height")) {
        // Receiver stays as far above the feed as the feed is above ground
        placement.probe_offset = vec3::unit_z() * placement.ground_height;
    }
    placement.full_domain_view = j.value("full_domain_view", placement.full_domain_view);
    placement.view_prefix = j.value("view_prefix", placement.view_prefix);
}

// Waveform serialization
inline void to_json(nlohmann::json& j, const Waveform& waveform) {
    j = {
        {"type", waveform_type_name(waveform.type)},
        {"amplitude", waveform.amplitude},
        {"frequency", waveform.frequency},
        {"id", waveform.id}
    };
}

inline void from_json(const nlohmann::json& j, Waveform& waveform) {
    if (j.contains("type")) {
        waveform.type = waveform_type_from_string(j["type"].get<std::string>());
    }
    waveform.amplitude = j.value("amplitude", waveform.amplitude);
    waveform.frequency = j.value("frequency", waveform.frequency);
    waveform.id = j.value("id", waveform.id);
}

// SourceSettings serialization
inline void to_json(nlohmann::json& j, const SourceSettings& source) {
    j = {
        {"type", source_type_name(source.type)},
        {"impedance", source.impedance}
    };
}

inline void from_json(const nlohmann::json& j, SourceSettings& source) {
    if (j.contains("type")) {
        source.type = source_type_from_string(j["type"].get<std::string>());
    }
    source.impedance = j.value("impedance", source.impedance);
}

// SnapshotRequest serialization
inline void to_json(nlohmann::json& j, const SnapshotRequest& snap) {
    j = {
        {"time", snap.time},
        {"file", snap.file}
    };
    if (snap.min_corner) j["min"] = *snap.min_corner;
    if (snap.max_corner) j["max"] = *snap.max_corner;
    if (snap.step) j["step"] = *snap.step;
}

inline void from_json(const nlohmann::json& j, SnapshotRequest& snap) {
    snap.time = j.at("time").get<double>();
    snap.file = j.at("file").get<std::string>();
    if (j.contains("min")) snap.min_corner = j["min"].get<Vec3>();
    if (j.contains("max")) snap.max_corner = j["max"].get<Vec3>();
    if (j.contains("step")) snap.step = j["step"].get<Vec3>();
}

// SimulationSettings live at the top level of a model config
inline void to_json(nlohmann::json& j, const SimulationSettings& settings) {
    j = {
        {"title", settings.title},
        {"time_window", settings.time_window},
        {"waveform", settings.waveform},
        {"source", settings.source},
        {"snapshots", settings.snapshots}
    };
}

inline void from_json(const nlohmann::json& j, SimulationSettings& settings) {
    settings.title = j.value("title", settings.title);
    settings.time_window = j.value("time_window", settings.time_window);
    if (j.contains("waveform")) {
        from_json(j["waveform"], settings.waveform);
    }
    if (j.contains("source")) {
        from_json(j["source"], settings.source);
    }
    if (j.contains("snapshots")) {
        settings.snapshots = j["snapshots"].get<std::vector<SnapshotRequest>>();
    }
}

// ModelConfig serialization
inline void to_json(nlohmann::json& j, const ModelConfig& config) {
    j = config.settings;
    j["domain"] = config.domain;
    j["spacing"] = config.spacing;
    j["bowtie"] = config.bowtie;
    j["placement"] = config.placement;
}

inline void from_json(const nlohmann::json& j, ModelConfig& config) {
    if (j.contains("domain")) {
        config.domain = j["domain"].get<Domain>();
    }
    if (j.contains("spacing")) {
        config.spacing = j["spacing"].get<GridSpacing>();
    }
    if (j.contains("bowtie")) {
        from_json(j["bowtie"], config.bowtie);
    }
    if (j.contains("placement")) {
        const auto& p = j["placement"];
        if (p.contains("variant")) {
            config.placement = placement_preset(p["variant"].get<std::string>(), config.domain);
        }
        from_json(p, config.placement);
    }
    from_json(j, config.settings);
}

// Apply a model config on top of `config`, reporting JSON type errors as ConfigError
inline void apply_model_config(const nlohmann::json& j, ModelConfig& config) {
    if (!j.is_object()) {
        throw ConfigError("Model config must be a JSON object");
    }
    try {
        from_json(j, config);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid model config: ") + e.what());
    }
}

inline ModelConfig model_config_from_json(const nlohmann::json& j) {
    ModelConfig config;
    apply_model_config(j, config);
    return config;
}

inline nlohmann::json read_model_config_file(const std::string& path) {
    try {
        return json::read_json_file(path);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse " + path + ": " + e.what());
    }
}

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_SERIALIZATION_CONFIG_JSON_HPP
