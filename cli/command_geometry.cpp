#include "cli_common.hpp"
#include "model_loader.hpp"
#include <common/logging.hpp>
#include <model/model_config.hpp>
#include <serialization/config_json.hpp>
#include <serialization/geometry_json.hpp>
#include <serialization/json_serialization.hpp>

namespace bowtiemodel::cli {

int command_geometry(int argc, char** argv) {
    auto log = bowtiemodel::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.output_path.empty()) {
            std::cerr << "Usage: bowtiemodel geometry [-p <preset>] [-c <config.json>] -o <geometry.json>\n";
            return ctx.help ? 0 : 1;
        }
        bowtiemodel::logging::set_verbose(ctx.verbose);

        ModelConfig config = load_model(ctx);
        BowtieGeometry geometry = build_geometry(config);

        json::SerializedData data;
        data.step = "bowtie_geometry";
        data.timestamp = json::get_timestamp();
        if (ctx.config_path.has_value()) {
            data.source_file = ctx.config_path.value();
        }
        data.config = config;
        data.data = bowtie_geometry_to_json(geometry);

        Vec3 extent = geometry.antenna_max() - geometry.antenna_min();
        data.stats = {
            {"wing_count", geometry.wings.size()},
            {"has_receiver", geometry.probe_point.has_value()},
            {"antenna_extent", extent}
        };

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote geometry to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (extent "
                  << extent.x << " x " << extent.y << " m)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace bowtiemodel::cli
