#include <filesystem>
#include <iostream>
#include <lectern/config.hpp>
#include <lectern/logger.hpp>
#include <string>
#include <vector>

#include "../../core/command_line.hpp"
#include "app.hpp"

int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);

    lectern::CommandLine cmd;
    std::string          error;
    if (!lectern::parse_command_line(args, cmd, error))
    {
        std::cerr << "lectern_cockpit: " << error << "\n" << lectern::usage(argv[0]);
        return 2;
    }
    if (cmd.help)
    {
        std::cout << lectern::usage(argv[0]);
        return 0;
    }

    auto& logger = lectern::Logger::instance();
    logger.add_sink(lectern::sinks::console_sink());

    lectern::CockpitConfig config;
    const std::string config_path =
        cmd.config_path.empty() ? lectern::CockpitConfig::default_path() : cmd.config_path;
    // First run: write the defaults out so there is a file to edit.
    std::error_code ec;
    if (!config.load(config_path) && cmd.config_path.empty()
        && !std::filesystem::exists(config_path, ec))
    {
        if (config.save(config_path))
            LECTERN_LOG_INFO("config", "Wrote default settings to {}", config_path);
    }
    lectern::apply_command_line(cmd, config);

    if (auto level = lectern::Logger::level_from_string(config.log_level))
        logger.set_level(*level);
    else
        LECTERN_LOG_WARN("config", "Unknown log level '{}'", config.log_level);

    if (!config.log_file.empty())
        logger.add_sink(lectern::sinks::file_sink(config.log_file));

    LECTERN_LOG_INFO("cockpit", "Starting with config {}", config_path);

    lectern::CockpitApp app(config);
    return app.run(cmd.context);
}
