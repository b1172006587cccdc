#include "core/json_util.h"
#include "core/string_util.h"
#include <cmath>
#include <cstdlib>
#include <limits>

namespace codenv {

std::optional<double> coerce_number(const nlohmann::json& value) {
    if (value.is_number()) {
        double num = value.get<double>();
        if (!std::isfinite(num)) {
            return std::nullopt;
        }
        return num;
    }
    if (value.is_string()) {
        std::string text = trim(value.get<std::string>());
        if (text.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        double num = std::strtod(text.c_str(), &end);
        if (end == nullptr || *end != '\0' || !std::isfinite(num)) {
            return std::nullopt;
        }
        return num;
    }
    return std::nullopt;
}

std::optional<double> first_number(const nlohmann::json& object,
                                   std::initializer_list<const char*> keys) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    for (const char* key : keys) {
        auto it = object.find(key);
        if (it == object.end()) continue;
        if (auto num = coerce_number(*it)) {
            return num;
        }
    }
    return std::nullopt;
}

std::optional<std::string> string_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    std::string value = trim(it->get<std::string>());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> first_string(const nlohmann::json& object,
                                        std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (auto value = string_field(object, key)) {
            return value;
        }
    }
    return std::nullopt;
}

const nlohmann::json* object_field(const nlohmann::json& object,
                                   std::initializer_list<const char*> keys) {
    if (!object.is_object()) {
        return nullptr;
    }
    for (const char* key : keys) {
        auto it = object.find(key);
        if (it != object.end() && it->is_object()) {
            return &(*it);
        }
    }
    return nullptr;
}

std::optional<nlohmann::json> parse_object_line(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    auto json = nlohmann::json::parse(trimmed, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    return json;
}

int64_t to_token_count(std::optional<double> value) {
    if (!value || !std::isfinite(*value) || *value <= 0) {
        return 0;
    }
    if (*value >= static_cast<double>(kMaxTokenCount)) {
        return kMaxTokenCount;
    }
    return static_cast<int64_t>(std::llround(*value));
}

int64_t add_tokens(int64_t a, int64_t b) {
    if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) {
        return std::numeric_limits<int64_t>::max();
    }
    return a + b;
}

}
