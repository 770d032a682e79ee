#ifndef BOWTIEMODEL_MODEL_MODEL_CONFIG_HPP
#define BOWTIEMODEL_MODEL_MODEL_CONFIG_HPP

#include "command.hpp"
#include "simulation_settings.hpp"
#include <geometry/bowtie_builder.hpp>
#include <geometry/placement.hpp>
#include <geometry/primitives.hpp>
#include <string>
#include <vector>

namespace bowtiemodel {

// Complete, immutable description of one model variant
struct ModelConfig {
    Domain domain{0.2, 0.2, 0.1};
    GridSpacing spacing{0.001, 0.001, 0.001};
    BowtieSpec bowtie{0.05, 0.1};
    Placement placement = Placement::centered();
    SimulationSettings settings;

    // 20 x 20 x 10 cm free-space domain, 1 mm cells
    static ModelConfig free_space() {
        return ModelConfig{};
    }

    // Antenna 2 cm above the bottom of a 20 x 12 x 12 cm domain, with receiver
    static ModelConfig ground_offset() {
        ModelConfig config;
        config.domain = Domain{0.2, 0.12, 0.12};
        config.placement = Placement::ground_offset(0.02);
        config.settings.title = "Bowtie antenna above ground";
        return config;
    }

    // Built-in model by variant name; throws UnknownVariantError
    static ModelConfig preset(const std::string& name);
};

// Validate settings and geometry; nothing is emitted if either fails
BowtieGeometry build_geometry(const ModelConfig& config);

std::vector<Command> build_commands(const ModelConfig& config);

// Full solver input file text
std::string render_model(const ModelConfig& config, int precision = 6);

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_MODEL_MODEL_CONFIG_HPP
