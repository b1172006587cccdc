#include "usage/delta_engine.h"
#include <algorithm>

namespace codenv {

std::optional<int64_t> UsageObservation::resolved_total() const {
    if (total_tokens) {
        return total_tokens;
    }
    if (!input_tokens && !output_tokens && !cache_read_tokens && !cache_write_tokens) {
        return std::nullopt;
    }
    return add_tokens(add_tokens(input_tokens.value_or(0), output_tokens.value_or(0)),
                      add_tokens(cache_read_tokens.value_or(0), cache_write_tokens.value_or(0)));
}

UsageObservation UsageObservation::from_counters(const TokenCounters& counters) {
    UsageObservation obs;
    obs.input_tokens = counters.input_tokens;
    obs.output_tokens = counters.output_tokens;
    obs.cache_read_tokens = counters.cache_read_tokens;
    obs.cache_write_tokens = counters.cache_write_tokens;
    obs.total_tokens = counters.total_tokens;
    return obs;
}

TokenCounters merge_maxima(const TokenCounters& a, const TokenCounters& b) {
    TokenCounters merged;
    merged.input_tokens = std::max(a.input_tokens, b.input_tokens);
    merged.output_tokens = std::max(a.output_tokens, b.output_tokens);
    merged.cache_read_tokens = std::max(a.cache_read_tokens, b.cache_read_tokens);
    merged.cache_write_tokens = std::max(a.cache_write_tokens, b.cache_write_tokens);
    merged.total_tokens = std::max(a.total_tokens, b.total_tokens);
    return merged;
}

namespace {

bool has_counts(const TokenCounters& c) {
    return c.input_tokens > 0 || c.output_tokens > 0 || c.cache_read_tokens > 0 ||
           c.cache_write_tokens > 0 || c.total_tokens > 0;
}

int64_t growth(std::optional<int64_t> fresh, int64_t base) {
    if (!fresh) return 0;
    return std::max<int64_t>(0, *fresh - base);
}

}

UsageDelta compute_delta(const UsageObservation& fresh,
                         const TokenCounters& own,
                         const TokenCounters& peer) {
    UsageDelta delta;
    const auto total = fresh.resolved_total();

    delta.reset = (fresh.input_tokens && *fresh.input_tokens < own.input_tokens) ||
                  (fresh.output_tokens && *fresh.output_tokens < own.output_tokens) ||
                  (fresh.cache_read_tokens && *fresh.cache_read_tokens < own.cache_read_tokens) ||
                  (fresh.cache_write_tokens && *fresh.cache_write_tokens < own.cache_write_tokens) ||
                  (total && *total < own.total_tokens);

    if (delta.reset) {
        delta.tokens.input_tokens = fresh.input_tokens.value_or(0);
        delta.tokens.output_tokens = fresh.output_tokens.value_or(0);
        delta.tokens.cache_read_tokens = fresh.cache_read_tokens.value_or(0);
        delta.tokens.cache_write_tokens = fresh.cache_write_tokens.value_or(0);
        delta.tokens.total_tokens = total.value_or(0);
        return delta;
    }

    const TokenCounters base = merge_maxima(own, peer);
    delta.tokens.input_tokens = growth(fresh.input_tokens, base.input_tokens);
    delta.tokens.output_tokens = growth(fresh.output_tokens, base.output_tokens);
    delta.tokens.cache_read_tokens = growth(fresh.cache_read_tokens, base.cache_read_tokens);
    delta.tokens.cache_write_tokens = growth(fresh.cache_write_tokens, base.cache_write_tokens);

    const bool has_breakdown = fresh.input_tokens || fresh.output_tokens ||
                               fresh.cache_read_tokens || fresh.cache_write_tokens;
    if (!has_breakdown) {
        delta.tokens.total_tokens = growth(total, base.total_tokens);
    } else if (has_counts(peer)) {
        // The two sources disagree on totals; only the breakdown is comparable.
        delta.tokens.total_tokens = delta.tokens.breakdown_total();
    } else {
        delta.tokens.total_tokens =
            std::max(delta.tokens.breakdown_total(), growth(total, own.total_tokens));
    }
    return delta;
}

TokenCounters advance_counters(const TokenCounters& previous, const UsageObservation& fresh) {
    TokenCounters next = previous;
    if (fresh.input_tokens) next.input_tokens = *fresh.input_tokens;
    if (fresh.output_tokens) next.output_tokens = *fresh.output_tokens;
    if (fresh.cache_read_tokens) next.cache_read_tokens = *fresh.cache_read_tokens;
    if (fresh.cache_write_tokens) next.cache_write_tokens = *fresh.cache_write_tokens;
    if (auto total = fresh.resolved_total()) next.total_tokens = *total;
    return next;
}

}
