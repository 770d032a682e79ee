#include "cli_common.hpp"
#include <common/logging.hpp>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Generates FDTD solver input for a bowtie dipole antenna.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  model       Write the solver command file\n";
    std::cerr << "  geometry    Write the antenna geometry as JSON\n";
    std::cerr << "  presets     List built-in placement variants (-v prints their configs)\n";
    std::cerr << "\n";
    std::cerr << "Common options:\n";
    std::cerr << "  -p, --preset <name>   Built-in variant to start from\n";
    std::cerr << "  -c, --config <file>   JSON model configuration\n";
    std::cerr << "  -o, --output <file>   Output file\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  BOWTIEMODEL_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "model") {
        return bowtiemodel::cli::command_model(argc, argv);
    } else if (command == "geometry") {
        return bowtiemodel::cli::command_geometry(argc, argv);
    } else if (command == "presets") {
        return bowtiemodel::cli::command_presets(argc, argv);
    } else if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    bowtiemodel::logging::get_logger()->error("Unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
