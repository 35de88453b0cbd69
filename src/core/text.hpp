#pragma once

#include <string>
#include <string_view>

namespace lectern
{

std::string_view trim_view(std::string_view s);
std::string      trim(std::string_view s);

bool is_blank(std::string_view s);

// Escapes & < > " ' for HTML text and attribute values.
std::string html_escape(std::string_view s);

}   // namespace lectern
