#include "cli_common.hpp"
#include <common/logging.hpp>
#include <geometry/placement.hpp>
#include <model/model_config.hpp>
#include <serialization/config_json.hpp>

namespace bowtiemodel::cli {

int command_presets(int argc, char** argv) {
    auto log = bowtiemodel::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        bowtiemodel::logging::set_verbose(ctx.verbose);

        for (const auto& name : preset_names()) {
            if (!ctx.verbose) {
                std::cout << name << "\n";
                continue;
            }
            log->debug("Dumping preset {}", name);
            nlohmann::json j = ModelConfig::preset(name);
            std::cout << name << ":\n" << j.dump(2) << "\n";
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace bowtiemodel::cli
