#pragma once

#include <string>

namespace codenv {

std::string home_dir();

// Non-empty environment value, or empty string.
std::string env_value(const char* name);

// Truthy unless empty, "0", "false", "no" or "off".
bool env_flag(const char* name);

// Expands a leading "~" and makes relative paths absolute. Empty stays empty.
std::string resolve_path(const std::string& path);

// Creates the parent directory of `path` if missing.
bool ensure_parent_dir(const std::string& path);

}
