#pragma once

#include <stddef.h>
#include <stdint.h>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <utility>

#include "scheduling.h"

// Order ids that already triggered a dispense. tryClaim() is the only gate
// against the provider redelivering the same webhook.
//
// retentionMs == 0 keeps every id for the life of the process. Otherwise ids
// older than the window are dropped on the next claim.
class OrderLedger {
public:
    explicit OrderLedger(uint32_t retentionMs = 0, ClockFn clock = ClockFn());

    // true exactly once per retained id; check and insert are one step
    bool tryClaim(const std::string& orderId);

    bool   contains(const std::string& orderId) const;
    size_t size() const;

private:
    void evictExpired(uint32_t nowMs);

    uint32_t m_retentionMs;
    ClockFn  m_clock;

    mutable std::mutex m_mutex;
    std::set<std::string> m_claimed;
    std::deque<std::pair<uint32_t, std::string> > m_byAge;  // oldest first
};
