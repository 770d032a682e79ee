#include "model_config.hpp"
#include "command_formatter.hpp"
#include "model_emitter.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>

namespace bowtiemodel {

ModelConfig ModelConfig::preset(const std::string& name) {
    switch (variant_from_string(name)) {
        case PlacementVariant::Centered: return free_space();
        case PlacementVariant::GroundOffset: return ground_offset();
    }
    throw UnknownVariantError("Unknown placement variant: " + name);
}

BowtieGeometry build_geometry(const ModelConfig& config) {
    validate_settings(config.settings);
    validate_snapshot_volumes(config.settings, config.domain, config.spacing);
    return build_bowtie(config.domain, config.spacing, config.bowtie, config.placement);
}

std::vector<Command> build_commands(const ModelConfig& config) {
    auto log = bowtiemodel::logging::get_logger();

    log->debug("Stage 1: Building bowtie geometry");
    BowtieGeometry geometry = build_geometry(config);

    log->debug("Stage 2: Emitting commands");
    return emit_model(config.settings, config.domain, config.spacing, geometry, config.placement);
}

std::string render_model(const ModelConfig& config, int precision) {
    auto log = bowtiemodel::logging::get_logger();
    std::vector<Command> commands = build_commands(config);

    log->debug("Stage 3: Formatting {} commands", commands.size());
    CommandFormatter formatter(precision);
    return formatter.format_all(commands);
}

}  // namespace bowtiemodel
