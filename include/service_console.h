#pragma once

#include <functional>
#include <string>
#include <vector>

#include "actuator_map.h"
#include "dispense_controller.h"
#include "order_ledger.h"
#include "relay_driver.h"

// Maintenance commands typed on the serial port. Replies go to the log.
class ServiceConsole {
public:
    ServiceConsole(const ActuatorMap& map, RelayDriver& relays, DispenseController& dispenser,
                   const OrderLedger& ledger);

    void setStatusReporter(std::function<void()> reporter) { m_statusReporter = reporter; }

    // false if the line was not a known command or its arguments were bad
    bool handleLine(const std::string& line);
    void printHelp() const;

private:
    bool parseChannels(const std::string& args, std::vector<int>& channels) const;
    void listSlots() const;

    const ActuatorMap&    m_map;
    RelayDriver&          m_relays;
    DispenseController&   m_dispenser;
    const OrderLedger&    m_ledger;
    std::function<void()> m_statusReporter;
};
