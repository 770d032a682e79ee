#include "cli_common.hpp"
#include "model_loader.hpp"
#include <common/logging.hpp>
#include <model/model_config.hpp>

namespace bowtiemodel::cli {

int command_model(int argc, char** argv) {
    auto log = bowtiemodel::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help) {
            std::cerr << "Usage: bowtiemodel model [-p <preset>] [-c <config.json>] [-o <model.in>]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -p, --preset <name>   Start from a built-in variant (see 'presets')\n";
            std::cerr << "  -c, --config <file>   Model configuration applied on top of the preset\n";
            std::cerr << "  -o, --output <file>   Output file (defaults to stdout)\n";
            std::cerr << "  --precision <n>       Significant digits for numbers (default 6)\n";
            return 0;
        }
        bowtiemodel::logging::set_verbose(ctx.verbose);

        ModelConfig config = load_model(ctx);
        log->info("Building model '{}' ({})", config.settings.title,
                  variant_name(config.placement.variant));

        std::string text = render_model(config, ctx.precision);

        if (ctx.output_path.empty()) {
            std::cout << text;
        } else {
            write_file(ctx.output_path, text);
            log->info("Wrote model to {}", ctx.output_path);
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace bowtiemodel::cli
