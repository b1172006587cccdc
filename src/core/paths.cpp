#include "core/paths.h"
#include "core/string_util.h"
#include <cstdlib>
#include <filesystem>

namespace codenv {

std::string home_dir() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) : std::string();
}

std::string env_value(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::string();
    }
    return trim(value);
}

bool env_flag(const char* name) {
    std::string value = to_lower(env_value(name));
    if (value.empty()) {
        return false;
    }
    return value != "0" && value != "false" && value != "no" && value != "off";
}

std::string resolve_path(const std::string& path) {
    namespace fs = std::filesystem;

    if (path.empty()) {
        return path;
    }
    std::string expanded = path;
    if (expanded[0] == '~') {
        std::string home = home_dir();
        std::string rest = expanded.substr(1);
        while (!rest.empty() && (rest[0] == '/' || rest[0] == '\\')) {
            rest.erase(0, 1);
        }
        expanded = rest.empty() ? home : (fs::path(home) / rest).string();
    }
    fs::path p(expanded);
    if (p.is_absolute()) {
        return p.lexically_normal().string();
    }
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) {
        return expanded;
    }
    return abs.lexically_normal().string();
}

bool ensure_parent_dir(const std::string& path) {
    namespace fs = std::filesystem;

    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return true;
    }
    std::error_code ec;
    if (fs::exists(parent, ec)) {
        return true;
    }
    fs::create_directories(parent, ec);
    return !ec;
}

}
