#pragma once

#include <stddef.h>
#include <map>
#include <string>
#include <vector>

#include "config.h"

class RelayDriver;

// Slot label -> relay channels released together. Built once at startup
// and only read afterwards.
class ActuatorMap {
public:
    ActuatorMap() {}

    static ActuatorMap fromTable(const SlotBinding* table, size_t count);

    bool addSlot(const std::string& slot, const std::vector<int>& channels);

    bool lookup(const std::string& slot, std::vector<int>& channels) const;
    bool contains(const std::string& slot) const { return m_slots.count(slot) != 0; }
    size_t size() const { return m_slots.size(); }
    std::vector<std::string> slots() const;

    // Every referenced channel must exist in the driver. Logs each miss.
    bool validate(const RelayDriver& relays) const;

private:
    std::map<std::string, std::vector<int> > m_slots;
};
