#include "dispense_controller.h"

#include "logging.h"

DispenseController::DispenseController(const ActuatorMap& map, RelayDriver& relays,
                                       TaskRunner& runner, SleepFn sleep, uint32_t dwellMs)
    : m_map(map), m_relays(relays), m_runner(runner), m_sleep(sleep),
      m_dwellMs(dwellMs), m_active(0) {}

bool DispenseController::dispense(const std::string& slot) {
    std::vector<int> channels;
    if (!m_map.lookup(slot, channels)) {
        logWarn("[DISPENSE] Unknown slot label: %s", slot.c_str());
        return false;
    }
    return pulse(slot, channels, m_dwellMs);
}

bool DispenseController::pulse(const std::string& label, const std::vector<int>& channels,
                               uint32_t holdMs) {
    if (channels.empty()) return false;

    m_active++;
    bool started = m_runner.spawn("dispense", [this, label, channels, holdMs]() {
        runCycle(label, channels, holdMs);
        m_active--;
    });
    if (!started) {
        m_active--;
        logError("[DISPENSE] Could not start cycle for %s", label.c_str());
    }
    return started;
}

void DispenseController::runCycle(const std::string& label, const std::vector<int>& channels,
                                  uint32_t holdMs) {
    logInfo("[DISPENSE] Dispensing %s (%u relays, %lu ms)", label.c_str(),
            (unsigned)channels.size(), (unsigned long)holdMs);

    int engaged = 0;
    for (int channel : channels) {
        if (m_relays.engage(channel)) engaged++;
    }
    if (engaged != (int)channels.size()) {
        logWarn("[DISPENSE] %s: only %d of %u relays engaged", label.c_str(), engaged,
                (unsigned)channels.size());
    }

    m_sleep(holdMs);

    // release everything, including channels whose engage failed
    for (int channel : channels) {
        m_relays.disengage(channel);
    }

    logInfo("[DISPENSE] Finished dispensing %s", label.c_str());
}
