#pragma once

#include "usage/usage_record.h"
#include <cstdint>
#include <optional>

namespace codenv {

// Fresh cumulative totals for one session. Fields the source did not report
// stay empty and take no part in delta or reset detection.
struct UsageObservation {
    std::optional<int64_t> input_tokens;
    std::optional<int64_t> output_tokens;
    std::optional<int64_t> cache_read_tokens;
    std::optional<int64_t> cache_write_tokens;
    std::optional<int64_t> total_tokens;

    bool empty() const {
        return !input_tokens && !output_tokens && !cache_read_tokens &&
               !cache_write_tokens && !total_tokens;
    }

    // Explicit total, else the sum of reported fields.
    std::optional<int64_t> resolved_total() const;

    static UsageObservation from_counters(const TokenCounters& counters);
};

struct UsageDelta {
    TokenCounters tokens;
    bool reset = false;

    bool should_emit() const { return tokens.total_tokens > 0; }
};

// Per-field maximum of two independently tracked counter sets.
TokenCounters merge_maxima(const TokenCounters& a, const TokenCounters& b);

// Counters for one session as seen by the caller's own source (`own`) and by
// the other ingestion path (`peer`). A restart is detected only when a fresh
// field falls below `own`; every field then re-emits its fresh absolute value.
// Otherwise each field emits fresh - max(own, peer), floored at zero.
UsageDelta compute_delta(const UsageObservation& fresh,
                         const TokenCounters& own,
                         const TokenCounters& peer = TokenCounters{});

// Counters to store after observing `fresh`: fresh values where reported,
// previous values elsewhere. Never a running sum.
TokenCounters advance_counters(const TokenCounters& previous, const UsageObservation& fresh);

}
