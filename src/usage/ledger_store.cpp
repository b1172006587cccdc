#include "usage/ledger_store.h"
#include "core/json_util.h"
#include "core/paths.h"
#include <cstdio>
#include <fstream>

namespace codenv {

LedgerStore::LedgerStore(std::string path)
    : path_(std::move(path))
{
}

bool LedgerStore::append(const UsageRecord& record) const {
    if (path_.empty()) return false;
    if (!ensure_parent_dir(path_)) {
        fprintf(stderr, "codenv: cannot create directory for %s\n", path_.c_str());
        return false;
    }

    nlohmann::json j = record;
    std::string line = j.dump() + "\n";

    std::ofstream file(path_, std::ios::app | std::ios::binary);
    if (!file.is_open()) {
        fprintf(stderr, "codenv: cannot open usage ledger %s\n", path_.c_str());
        return false;
    }
    file.write(line.data(), static_cast<std::streamsize>(line.size()));
    file.flush();
    return file.good();
}

std::vector<UsageRecord> LedgerStore::read_all() const {
    std::vector<UsageRecord> records;
    if (path_.empty()) return records;

    std::ifstream file(path_);
    if (!file) return records;

    std::string line;
    while (std::getline(file, line)) {
        auto json = parse_object_line(line);
        if (!json) continue;
        if (auto record = parse_usage_record(*json)) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

}
