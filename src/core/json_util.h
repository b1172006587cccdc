#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace codenv {

// Finite numbers and numeric strings; null/empty/other types yield nullopt.
std::optional<double> coerce_number(const nlohmann::json& value);

// First key in `keys` whose value coerces to a number.
std::optional<double> first_number(const nlohmann::json& object,
                                   std::initializer_list<const char*> keys);

// Non-empty string value of `key`.
std::optional<std::string> string_field(const nlohmann::json& object, const char* key);

std::optional<std::string> first_string(const nlohmann::json& object,
                                        std::initializer_list<const char*> keys);

// First key in `keys` holding a JSON object, or nullptr.
const nlohmann::json* object_field(const nlohmann::json& object,
                                   std::initializer_list<const char*> keys);

// Parses one line; only JSON objects are accepted.
std::optional<nlohmann::json> parse_object_line(const std::string& line);

// Largest token count a single field may hold; larger inputs are clamped.
constexpr int64_t kMaxTokenCount = int64_t{1} << 53;

// Rounded, clamped to [0, kMaxTokenCount]; non-finite values give 0.
int64_t to_token_count(std::optional<double> value);

// Sum of two non-negative counts, saturating at INT64_MAX.
int64_t add_tokens(int64_t a, int64_t b);

}
