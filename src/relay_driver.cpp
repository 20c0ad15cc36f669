#include "relay_driver.h"

#include "logging.h"

RelayDriver::RelayDriver() : m_configured(false) {}

bool RelayDriver::attach(int channel, std::unique_ptr<OutputPin> pin) {
    if (m_configured) {
        logWarn("[RELAY] Cannot attach channel %d after configure()", channel);
        return false;
    }
    if (!pin) return false;
    if (m_pins.count(channel)) {
        logWarn("[RELAY] Channel %d attached twice", channel);
        return false;
    }
    m_pins[channel] = std::move(pin);
    return true;
}

bool RelayDriver::configure() {
    bool ok = true;
    for (auto& entry : m_pins) {
        if (!entry.second->configureAsOutput()) {
            logError("[RELAY] Could not claim output for channel %d", entry.first);
            ok = false;
            continue;
        }
        entry.second->setHigh();
    }
    m_configured = ok;
    if (ok) logInfo("[RELAY] %u channels configured, all idle", (unsigned)m_pins.size());
    return ok;
}

OutputPin* RelayDriver::find(int channel, const char* action) {
    if (!m_configured) {
        logWarn("[RELAY] %s channel %d refused: driver not configured", action, channel);
        return nullptr;
    }
    auto it = m_pins.find(channel);
    if (it == m_pins.end()) {
        logWarn("[RELAY] %s: channel %d not found", action, channel);
        return nullptr;
    }
    return it->second.get();
}

bool RelayDriver::engage(int channel) {
    OutputPin* pin = find(channel, "engage");
    if (pin == nullptr) return false;
    pin->setLow();
    return true;
}

bool RelayDriver::disengage(int channel) {
    OutputPin* pin = find(channel, "disengage");
    if (pin == nullptr) return false;
    pin->setHigh();
    return true;
}

void RelayDriver::releaseAll() {
    if (!m_configured) return;
    for (auto& entry : m_pins) {
        entry.second->setHigh();
    }
}

bool RelayDriver::hasChannel(int channel) const {
    return m_pins.count(channel) != 0;
}

std::vector<int> RelayDriver::channels() const {
    std::vector<int> result;
    result.reserve(m_pins.size());
    for (const auto& entry : m_pins) result.push_back(entry.first);
    return result;
}
