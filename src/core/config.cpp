#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <lectern/config.hpp>
#include <lectern/cockpit_types.hpp>
#include <lectern/logger.hpp>
#include <sstream>
#include <system_error>

#include "json_util.hpp"

namespace lectern
{

static uint32_t clamp_u32(double v, uint32_t lo, uint32_t hi)
{
    if (!(v == v))   // NaN
        return lo;
    v = std::clamp(v, static_cast<double>(lo), static_cast<double>(hi));
    return static_cast<uint32_t>(v);
}

bool CockpitConfig::deserialize(const std::string& json)
{
    if (!json::looks_like_object(json))
        return false;

    if (auto v = json::read_number(json, "initial_pane_count"))
        initial_pane_count = clamp_u32(*v, 1, static_cast<uint32_t>(MAX_PANES));
    if (auto v = json::read_string(json, "default_url"); v && !v->empty())
        default_url = *v;

    if (auto v = json::read_number(json, "layout_retry_attempts"))
        layout_retry_attempts = clamp_u32(*v, 1, 600);
    if (auto v = json::read_number(json, "settle_burst_frames"))
        settle_burst_frames = clamp_u32(*v, 0, 600);

    if (auto v = json::read_string(json, "selection_channel"); v && !v->empty())
        selection_channel = *v;
    if (auto v = json::read_string(json, "host_label"); v && !v->empty())
        host_label = *v;
    if (auto v = json::read_number(json, "selection_debounce_ms"))
        selection_debounce_ms = clamp_u32(*v, 0, 5000);

    if (auto v = json::read_number(json, "note_autosave_delay_ms"))
        note_autosave_delay_ms = clamp_u32(*v, 50, 60000);
    if (auto v = json::read_number(json, "toast_ttl_ms"))
        toast_ttl_ms = clamp_u32(*v, 500, 60000);

    if (auto v = json::read_number(json, "window_width"))
        window_width = clamp_u32(*v, 320, 16384);
    if (auto v = json::read_number(json, "window_height"))
        window_height = clamp_u32(*v, 240, 16384);

    if (auto v = json::read_string(json, "log_level"))
    {
        if (Logger::level_from_string(*v))
            log_level = *v;
        else
            LECTERN_LOG_WARN("config", "Ignoring unknown log_level '{}'", *v);
    }
    if (auto v = json::read_string(json, "log_file"))
        log_file = *v;

    return true;
}

std::string CockpitConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"initial_pane_count\": " << initial_pane_count << ",\n";
    os << "  \"default_url\": \"" << json::escape(default_url) << "\",\n";
    os << "  \"layout_retry_attempts\": " << layout_retry_attempts << ",\n";
    os << "  \"settle_burst_frames\": " << settle_burst_frames << ",\n";
    os << "  \"selection_channel\": \"" << json::escape(selection_channel) << "\",\n";
    os << "  \"host_label\": \"" << json::escape(host_label) << "\",\n";
    os << "  \"selection_debounce_ms\": " << selection_debounce_ms << ",\n";
    os << "  \"note_autosave_delay_ms\": " << note_autosave_delay_ms << ",\n";
    os << "  \"toast_ttl_ms\": " << toast_ttl_ms << ",\n";
    os << "  \"window_width\": " << window_width << ",\n";
    os << "  \"window_height\": " << window_height << ",\n";
    os << "  \"log_level\": \"" << json::escape(log_level) << "\",\n";
    os << "  \"log_file\": \"" << json::escape(log_file) << "\"\n";
    os << "}\n";
    return os.str();
}

bool CockpitConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        LECTERN_LOG_WARN("config", "Cannot read config file {}, using defaults", path);
        return false;
    }
    std::string contents((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(contents))
    {
        LECTERN_LOG_WARN("config", "{} is not a JSON object, using defaults", path);
        return false;
    }
    LECTERN_LOG_INFO("config", "Loaded {}", path);
    return true;
}

bool CockpitConfig::save(const std::string& path) const
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            LECTERN_LOG_WARN("config", "Cannot create {}: {}", dir.string(), ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        LECTERN_LOG_WARN("config", "Cannot write {}", path);
        return false;
    }
    f << serialize();
    return f.good();
}

std::string CockpitConfig::default_path()
{
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return (std::filesystem::path(xdg) / "lectern" / "cockpit.json").string();

    const char* home = std::getenv("HOME");
    if (!home)
        return "cockpit.json";
    return (std::filesystem::path(home) / ".config" / "lectern" / "cockpit.json").string();
}

}   // namespace lectern
