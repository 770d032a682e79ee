#ifndef BOWTIEMODEL_CLI_MODEL_LOADER_HPP
#define BOWTIEMODEL_CLI_MODEL_LOADER_HPP

#include "cli_common.hpp"
#include <common/logging.hpp>
#include <model/model_config.hpp>
#include <serialization/config_json.hpp>

namespace bowtiemodel::cli {

// Resolve the model from --preset and/or --config. A config file is
// applied on top of the preset; without either the free-space model is used.
inline ModelConfig load_model(const CommandContext& ctx) {
    auto log = bowtiemodel::logging::get_logger();

    ModelConfig config = ModelConfig::free_space();
    if (ctx.preset.has_value()) {
        config = ModelConfig::preset(ctx.preset.value());
        log->info("Using preset: {}", ctx.preset.value());
    }

    if (ctx.config_path.has_value()) {
        apply_model_config(read_model_config_file(ctx.config_path.value()), config);
        log->info("Loaded configuration from: {}", ctx.config_path.value());
    }

    return config;
}

}  // namespace bowtiemodel::cli

#endif // BOWTIEMODEL_CLI_MODEL_LOADER_HPP
