#include "url.hpp"

#include <cctype>

#include "text.hpp"

namespace lectern
{

bool has_scheme(std::string_view url)
{
    if (url.empty() || !std::isalpha(static_cast<unsigned char>(url[0])))
        return false;

    size_t i = 1;
    while (i < url.size())
    {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (std::isalnum(c) || c == '+' || c == '.' || c == '-')
        {
            ++i;
            continue;
        }
        break;
    }
    if (i >= url.size() || url[i] != ':')
        return false;

    // "localhost:3000" / "example.com:8080/x": digits up to the path are a port.
    size_t j = i + 1;
    while (j < url.size() && std::isdigit(static_cast<unsigned char>(url[j])))
        ++j;
    bool port_like = j > i + 1 && (j == url.size() || url[j] == '/' || url[j] == '?' || url[j] == '#');
    return !port_like;
}

std::string normalize_url(std::string_view raw)
{
    std::string_view trimmed = trim_view(raw);
    if (trimmed.empty())
        return std::string();
    if (has_scheme(trimmed))
        return std::string(trimmed);
    return "https://" + std::string(trimmed);
}

std::optional<std::string> parse_user_url(std::string_view raw)
{
    std::string_view trimmed = trim_view(raw);
    if (trimmed.empty())
        return std::nullopt;

    for (char c : trimmed)
    {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || std::iscntrl(uc))
            return std::nullopt;
    }

    std::string url = normalize_url(trimmed);

    auto starts_with_ci = [&](std::string_view prefix)
    {
        if (url.size() < prefix.size())
            return false;
        for (size_t i = 0; i < prefix.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(url[i])) != prefix[i])
                return false;
        }
        return true;
    };

    size_t authority = std::string::npos;
    if (starts_with_ci("https://"))
        authority = 8;
    else if (starts_with_ci("http://"))
        authority = 7;

    if (authority != std::string::npos)
    {
        size_t host_end = url.find_first_of("/?#", authority);
        std::string_view host =
            std::string_view(url).substr(authority, host_end == std::string::npos
                                                        ? std::string::npos
                                                        : host_end - authority);
        if (host.empty() || host.front() == ':' || host.front() == '@')
            return std::nullopt;
    }
    return url;
}

}   // namespace lectern
