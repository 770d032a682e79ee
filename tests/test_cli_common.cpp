#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include <cli/cli_common.hpp>
#include <cli/model_loader.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bowtiemodel;
using namespace bowtiemodel::test;

namespace {

// argv-style view over owned strings; argv[0] and argv[1] are program and command
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() const { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

cli::CommandContext parse(std::initializer_list<std::string> args) {
    Args a(args);
    return cli::parse_common_args(a.argc(), a.argv(), 2).first;
}

}  // namespace

TEST(CliCommonTest, ParsesOptions) {
    cli::CommandContext ctx = parse({"bowtiemodel", "model", "-p", "ground_offset",
                                     "-c", "model.json", "-o", "out.in",
                                     "--precision", "9", "-v"});
    EXPECT_EQ(ctx.preset.value_or(""), "ground_offset");
    EXPECT_EQ(ctx.config_path.value_or(""), "model.json");
    EXPECT_EQ(ctx.output_path, "out.in");
    EXPECT_EQ(ctx.precision, 9);
    EXPECT_TRUE(ctx.verbose);
    EXPECT_FALSE(ctx.help);
}

TEST(CliCommonTest, PrecisionBounds) {
    EXPECT_EQ(parse({"bowtiemodel", "model", "--precision", "1"}).precision, 1);
    EXPECT_EQ(parse({"bowtiemodel", "model", "--precision", "17"}).precision, 17);
    EXPECT_THROW(parse({"bowtiemodel", "model", "--precision", "0"}), std::runtime_error);
    EXPECT_THROW(parse({"bowtiemodel", "model", "--precision", "18"}), std::runtime_error);
    EXPECT_THROW(parse({"bowtiemodel", "model", "--precision"}), std::runtime_error);
}

TEST(CliCommonTest, NonNumericPrecisionIsRejected) {
    EXPECT_THROW(parse({"bowtiemodel", "model", "--precision", "six"}), std::runtime_error);
    EXPECT_THROW(parse({"bowtiemodel", "model", "--precision", "6x"}), std::runtime_error);
    EXPECT_THROW(parse({"bowtiemodel", "model", "--precision", "99999999999999999999"}),
                 std::runtime_error);
}

TEST(CliCommonTest, UnknownOptionIsRejected) {
    EXPECT_THROW(parse({"bowtiemodel", "model", "--frobnicate"}), std::runtime_error);
}

TEST(CliCommonTest, PresetByName) {
    EXPECT_EQ(render_model(ModelConfig::preset("centered")),
              render_model(ModelConfig::free_space()));
    EXPECT_EQ(render_model(ModelConfig::preset("ground_offset")),
              render_model(ModelConfig::ground_offset()));
    EXPECT_THROW(ModelConfig::preset("stacked"), UnknownVariantError);
}

TEST(CliCommonTest, LoadModelWithoutOptionsIsFreeSpace) {
    cli::CommandContext ctx;
    EXPECT_EQ(render_model(cli::load_model(ctx)), render_model(ModelConfig::free_space()));
}

TEST(CliCommonTest, ConfigFileAppliesOnTopOfPreset) {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "bowtiemodel_cli_preset_config.json";
    cli::write_file(path.string(), R"({"title": "Raised bowtie", "time_window": 5e-9})");

    cli::CommandContext ctx;
    ctx.preset = "ground_offset";
    ctx.config_path = path.string();
    ModelConfig config = cli::load_model(ctx);
    fs::remove(path);

    // Overridden by the file
    EXPECT_EQ(config.settings.title, "Raised bowtie");
    EXPECT_DOUBLE_EQ(config.settings.time_window, 5e-9);
    // Kept from the preset
    EXPECT_EQ(config.placement.variant, PlacementVariant::GroundOffset);
    EXPECT_TRUE(config.placement.receiver);
    expect_vec_near(config.domain.extent(), {0.2, 0.12, 0.12});
}

TEST(CliCommonTest, MissingConfigFileFails) {
    cli::CommandContext ctx;
    ctx.config_path = (std::filesystem::temp_directory_path() /
                       "bowtiemodel_no_such_config.json").string();
    EXPECT_THROW(cli::load_model(ctx), std::runtime_error);
}

TEST(LoggingTest, VerboseRaisesToDebug) {
    auto log = logging::get_logger();
    auto saved = log->level();

    log->set_level(spdlog::level::info);
    logging::set_verbose(false);
    EXPECT_EQ(log->level(), spdlog::level::info);
    logging::set_verbose(true);
    EXPECT_EQ(log->level(), spdlog::level::debug);

    log->set_level(spdlog::level::trace);
    logging::set_verbose(true);
    EXPECT_EQ(log->level(), spdlog::level::trace);

    log->set_level(saved);
}
