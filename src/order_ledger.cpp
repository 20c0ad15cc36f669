#include "order_ledger.h"

#include "logging.h"

OrderLedger::OrderLedger(uint32_t retentionMs, ClockFn clock)
    : m_retentionMs(clock ? retentionMs : 0), m_clock(clock) {}

bool OrderLedger::tryClaim(const std::string& orderId) {
    if (orderId.empty()) return false;

    std::lock_guard<std::mutex> lock(m_mutex);

    uint32_t now = m_clock ? m_clock() : 0;
    if (m_retentionMs > 0) evictExpired(now);

    if (!m_claimed.insert(orderId).second) return false;
    if (m_retentionMs > 0) m_byAge.push_back(std::make_pair(now, orderId));
    return true;
}

void OrderLedger::evictExpired(uint32_t nowMs) {
    size_t evicted = 0;
    while (!m_byAge.empty() && nowMs - m_byAge.front().first >= m_retentionMs) {
        m_claimed.erase(m_byAge.front().second);
        m_byAge.pop_front();
        evicted++;
    }
    if (evicted) logDebug("[LEDGER] Evicted %u expired order ids", (unsigned)evicted);
}

bool OrderLedger::contains(const std::string& orderId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_claimed.count(orderId) != 0;
}

size_t OrderLedger::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_claimed.size();
}
