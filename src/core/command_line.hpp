#pragma once

#include <cstdint>
#include <lectern/cockpit_types.hpp>
#include <lectern/config.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lectern
{

struct CommandLine
{
    CockpitContext             context;
    std::optional<uint32_t>    panes;
    std::optional<std::string> log_level;
    std::string                config_path;
    bool                       help = false;
};

// Parses argv[1..].  Returns false with `error` set on an unknown flag, a
// missing value or a malformed number.
bool parse_command_line(const std::vector<std::string>& args, CommandLine& out, std::string& error);

// Command-line values override the config file.
void apply_command_line(const CommandLine& cmd, CockpitConfig& config);

std::string usage(const std::string& program);

}   // namespace lectern
