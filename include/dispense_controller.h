#pragma once

#include <stdint.h>
#include <atomic>
#include <string>
#include <vector>

#include "actuator_map.h"
#include "relay_driver.h"
#include "scheduling.h"

// Drives a slot's relays through engage -> dwell -> release on a detached
// task. Cycles are never queued or serialized: two slots sharing a lift
// relay may overlap, and whichever finishes first opens the shared relay.
class DispenseController {
public:
    DispenseController(const ActuatorMap& map, RelayDriver& relays, TaskRunner& runner,
                       SleepFn sleep, uint32_t dwellMs);

    // Fire-and-forget. false for an unknown slot or if no task could be started.
    bool dispense(const std::string& slot);

    // Same cycle over an arbitrary channel list, used by the service console.
    bool pulse(const std::string& label, const std::vector<int>& channels, uint32_t holdMs);

    // Blocking body of one cycle. Always releases every channel it was given.
    void runCycle(const std::string& label, const std::vector<int>& channels, uint32_t holdMs);

    uint32_t dwellMs() const { return m_dwellMs; }
    int      activeCycles() const { return m_active.load(); }

private:
    const ActuatorMap& m_map;
    RelayDriver&       m_relays;
    TaskRunner&        m_runner;
    SleepFn            m_sleep;
    uint32_t           m_dwellMs;
    std::atomic<int>   m_active;
};
