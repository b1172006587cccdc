#pragma once

#include "core/time_util.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace codenv {

struct LockInfo {
    std::optional<int> pid;
    std::optional<TimePoint> timestamp;
};

// Exclusive-create lock file holding "<pid>\n<iso timestamp>\n". Released
// (deleted) on destruction.
class LockFile {
    struct Token {
        explicit Token() = default;
    };

public:
    static constexpr std::chrono::minutes kStaleAfter{10};

    // nullptr when another live holder owns the lock. Never blocks.
    static std::unique_ptr<LockFile> acquire(const std::string& path);

    // Only acquire() can build the token.
    LockFile(Token, std::string path);
    ~LockFile();

    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;

    void release();
    bool held() const { return held_; }
    const std::string& path() const { return path_; }

    static LockInfo read_info(const std::string& path);
    static bool is_stale(const LockInfo& info, TimePoint now);
    static std::optional<bool> probe_process(int pid);

private:
    static bool try_create(const std::string& path);

    std::string path_;
    bool held_ = true;
};

}
