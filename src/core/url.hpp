#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace lectern
{

// True when the text starts with an RFC 3986 scheme ("https:", "mailto:",
// "tauri:" ...).  "host:8080/path" is a host with a port, not a scheme.
bool has_scheme(std::string_view url);

// Trims the input and prefixes "https://" when no scheme is present.  URLs
// that already carry a scheme are returned unchanged apart from trimming.
std::string normalize_url(std::string_view raw);

// Normalizes user input from the URL bar.  Returns nullopt for input that
// must not be navigated to: empty, embedded whitespace or control
// characters, or an http(s) URL without a host.
std::optional<std::string> parse_user_url(std::string_view raw);

}   // namespace lectern
