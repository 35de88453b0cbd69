#include "command_line.hpp"

#include <charconv>

namespace lectern
{

static bool parse_int(const std::string& text, int64_t& value)
{
    const char* first = text.data();
    const char* last  = text.data() + text.size();
    auto [ptr, ec]    = std::from_chars(first, last, value);
    return ec == std::errc() && ptr == last;
}

static bool parse_entity(const std::string& flag,
                         const std::string& text,
                         std::optional<EntityId>& out,
                         std::string& error)
{
    int64_t v = 0;
    if (!parse_int(text, v) || v <= 0)
    {
        error = flag + " expects a positive integer, got '" + text + "'";
        return false;
    }
    out = v;
    return true;
}

bool parse_command_line(const std::vector<std::string>& args, CommandLine& out, std::string& error)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help")
        {
            out.help = true;
            continue;
        }

        if (arg.rfind("--", 0) != 0)
        {
            error = "unexpected argument '" + arg + "'";
            return false;
        }
        if (i + 1 >= args.size())
        {
            error = arg + " requires a value";
            return false;
        }
        const std::string& value = args[++i];

        if (arg == "--url")
            out.context.url = value;
        else if (arg == "--title")
            out.context.title = value;
        else if (arg == "--reference-id")
        {
            if (!parse_entity(arg, value, out.context.reference_id, error))
                return false;
        }
        else if (arg == "--idea-id")
        {
            if (!parse_entity(arg, value, out.context.idea_id, error))
                return false;
        }
        else if (arg == "--writing-id")
        {
            if (!parse_entity(arg, value, out.context.writing_id, error))
                return false;
        }
        else if (arg == "--panes")
        {
            int64_t n = 0;
            if (!parse_int(value, n) || n < 1 || n > static_cast<int64_t>(MAX_PANES))
            {
                error = "--panes expects 1.." + std::to_string(MAX_PANES) + ", got '" + value + "'";
                return false;
            }
            out.panes = static_cast<uint32_t>(n);
        }
        else if (arg == "--config")
            out.config_path = value;
        else if (arg == "--log-level")
            out.log_level = value;
        else
        {
            error = "unknown option '" + arg + "'";
            return false;
        }
    }
    return true;
}

void apply_command_line(const CommandLine& cmd, CockpitConfig& config)
{
    if (cmd.panes)
        config.initial_pane_count = *cmd.panes;
    if (cmd.log_level)
        config.log_level = *cmd.log_level;
}

std::string usage(const std::string& program)
{
    return "Usage: " + program
           + " [options]\n"
             "  --url <url>            Page to open in the first pane\n"
             "  --title <text>         Session title\n"
             "  --reference-id <id>    Attach snippets to a reference note\n"
             "  --idea-id <id>         Attach snippets to an idea note\n"
             "  --writing-id <id>      Attach snippets to a writing note\n"
             "  --panes <1-3>          Initial pane count\n"
             "  --config <path>        Config file (default: "
           + CockpitConfig::default_path()
           + ")\n"
             "  --log-level <level>    trace, debug, info, warning, error, critical\n"
             "  -h, --help             Show this help\n";
}

}   // namespace lectern
