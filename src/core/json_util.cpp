#include "json_util.hpp"

#include <cctype>
#include <cstdlib>

namespace lectern::json
{

std::string escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

static size_t skip_ws(const std::string& json, size_t pos)
{
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos])))
        ++pos;
    return pos;
}

// Position of the first character of the value for "key", or npos.
// Occurrences of "key" that are not followed by ':' (e.g. inside a value) are skipped.
static size_t find_value(const std::string& json, const std::string& key)
{
    const std::string search = "\"" + key + "\"";
    size_t            pos    = json.find(search);
    while (pos != std::string::npos)
    {
        size_t after = skip_ws(json, pos + search.size());
        if (after < json.size() && json[after] == ':')
            return skip_ws(json, after + 1);
        pos = json.find(search, pos + 1);
    }
    return std::string::npos;
}

static void append_utf8(std::string& out, unsigned long cp)
{
    if (cp < 0x80)
    {
        out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

static std::optional<unsigned long> read_hex4(const std::string& json, size_t at)
{
    if (at + 4 > json.size())
        return std::nullopt;
    std::string   hex = json.substr(at, 4);
    char*         end = nullptr;
    unsigned long cp  = std::strtoul(hex.c_str(), &end, 16);
    if (end != hex.c_str() + 4)
        return std::nullopt;
    return cp;
}

std::optional<std::string> read_string(const std::string& json, const std::string& key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos || pos >= json.size() || json[pos] != '"')
        return std::nullopt;

    std::string out;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        char c = json[i];
        if (c == '"')
            return out;
        if (c != '\\')
        {
            out += c;
            continue;
        }
        if (++i >= json.size())
            break;
        switch (json[i])
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            case 'b':
                out += '\b';
                break;
            case 'f':
                out += '\f';
                break;
            case 'u':
            {
                auto cp = read_hex4(json, i + 1);
                if (!cp)
                    return std::nullopt;
                i += 4;
                // Surrogate pair
                if (*cp >= 0xD800 && *cp <= 0xDBFF && i + 2 < json.size() && json[i + 1] == '\\'
                    && json[i + 2] == 'u')
                {
                    auto low = read_hex4(json, i + 3);
                    if (low && *low >= 0xDC00 && *low <= 0xDFFF)
                    {
                        cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                        i += 6;
                    }
                }
                append_utf8(out, *cp);
                break;
            }
            default:
                out += json[i];
                break;
        }
    }
    // Unterminated string
    return std::nullopt;
}

std::optional<double> read_number(const std::string& json, const std::string& key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    double      value = std::strtod(begin, &end);
    if (end == begin)
        return std::nullopt;
    return value;
}

bool looks_like_object(const std::string& json)
{
    size_t first = skip_ws(json, 0);
    if (first >= json.size() || json[first] != '{')
        return false;
    size_t last = json.find_last_not_of(" \t\r\n");
    return last != std::string::npos && json[last] == '}';
}

}   // namespace lectern::json
