#pragma once

#include <optional>
#include <string>

namespace lectern::json
{

// Flat-object helpers for the small JSON documents lectern reads and writes
// (config file, selection channel payloads).  Nested objects are not parsed.

std::string escape(const std::string& s);

// Value of a top-level "key": "string" pair, unescaped.  nullopt when the key
// is absent or its value is not a string.
std::optional<std::string> read_string(const std::string& json, const std::string& key);

std::optional<double> read_number(const std::string& json, const std::string& key);


// True when the text is a single {...} object (whitespace allowed around it).
bool looks_like_object(const std::string& json);

}   // namespace lectern::json
