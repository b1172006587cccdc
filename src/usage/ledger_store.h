#pragma once

#include "usage/usage_record.h"
#include <string>
#include <vector>

namespace codenv {

// Append-only JSONL usage ledger. Writers are serialized by the sync lock;
// readers never lock.
class LedgerStore {
public:
    explicit LedgerStore(std::string path);

    bool append(const UsageRecord& record) const;

    // Lines that are not JSON objects are skipped.
    std::vector<UsageRecord> read_all() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}
