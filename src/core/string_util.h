#pragma once

#include <string>

namespace codenv {

std::string trim(const std::string& input);
std::string to_lower(std::string value);
bool starts_with(const std::string& value, const std::string& prefix);

// Lowercase alphanumerics only; "Claude Sonnet 4.5" -> "claudesonnet45".
std::string compact_key(const std::string& value);

}
