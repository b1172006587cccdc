#include "usage/lock_file.h"
#include "core/paths.h"
#include "core/string_util.h"
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace codenv {

LockFile::LockFile(Token, std::string path)
    : path_(std::move(path))
{
}

LockFile::~LockFile() {
    release();
}

bool LockFile::try_create(const std::string& path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        return false;
    }
    std::string content = std::to_string(static_cast<long>(::getpid())) + "\n" +
                          format_iso8601(std::chrono::system_clock::now()) + "\n";
    ssize_t written = ::write(fd, content.data(), content.size());
    ::close(fd);
    if (written != static_cast<ssize_t>(content.size())) {
        ::unlink(path.c_str());
        return false;
    }
    return true;
}

std::unique_ptr<LockFile> LockFile::acquire(const std::string& path) {
    if (path.empty() || !ensure_parent_dir(path)) {
        return nullptr;
    }

    if (try_create(path)) {
        return std::make_unique<LockFile>(Token{}, path);
    }
    if (errno != EEXIST) {
        return nullptr;
    }

    if (!is_stale(read_info(path), std::chrono::system_clock::now())) {
        return nullptr;
    }
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        return nullptr;
    }
    if (try_create(path)) {
        return std::make_unique<LockFile>(Token{}, path);
    }
    return nullptr;
}

void LockFile::release() {
    if (!held_) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    held_ = false;
}

LockInfo LockFile::read_info(const std::string& path) {
    LockInfo info;
    std::ifstream file(path);
    if (!file) {
        return info;
    }
    std::string pid_line;
    std::string ts_line;
    std::getline(file, pid_line);
    std::getline(file, ts_line);

    pid_line = trim(pid_line);
    if (!pid_line.empty()) {
        char* end = nullptr;
        long pid = std::strtol(pid_line.c_str(), &end, 10);
        if (end != nullptr && *end == '\0' && pid > 0) {
            info.pid = static_cast<int>(pid);
        }
    }
    info.timestamp = parse_iso8601(trim(ts_line));
    return info;
}

std::optional<bool> LockFile::probe_process(int pid) {
    if (pid <= 0) {
        return std::nullopt;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    if (errno == EPERM) {
        return true;
    }
    if (errno == ESRCH) {
        return false;
    }
    return std::nullopt;
}

bool LockFile::is_stale(const LockInfo& info, TimePoint now) {
    if (info.pid) {
        if (auto alive = probe_process(*info.pid)) {
            return !*alive;
        }
    }
    if (info.timestamp) {
        return now - *info.timestamp > kStaleAfter;
    }
    return true;
}

}
