#include "actuator_map.h"

#include "logging.h"
#include "relay_driver.h"

ActuatorMap ActuatorMap::fromTable(const SlotBinding* table, size_t count) {
    ActuatorMap map;
    for (size_t i = 0; i < count; i++) {
        const SlotBinding& binding = table[i];
        std::vector<int> channels(binding.channels, binding.channels + binding.channelCount);
        map.addSlot(binding.slot, channels);
    }
    return map;
}

bool ActuatorMap::addSlot(const std::string& slot, const std::vector<int>& channels) {
    if (slot.empty() || channels.empty()) {
        logWarn("[CONFIG] Ignoring empty slot binding '%s'", slot.c_str());
        return false;
    }
    if (m_slots.count(slot)) {
        logWarn("[CONFIG] Slot %s defined twice, keeping the first", slot.c_str());
        return false;
    }
    m_slots[slot] = channels;
    return true;
}

bool ActuatorMap::lookup(const std::string& slot, std::vector<int>& channels) const {
    auto it = m_slots.find(slot);
    if (it == m_slots.end()) return false;
    channels = it->second;
    return true;
}

std::vector<std::string> ActuatorMap::slots() const {
    std::vector<std::string> result;
    result.reserve(m_slots.size());
    for (const auto& entry : m_slots) result.push_back(entry.first);
    return result;
}

bool ActuatorMap::validate(const RelayDriver& relays) const {
    bool ok = true;
    for (const auto& entry : m_slots) {
        for (int channel : entry.second) {
            if (!relays.hasChannel(channel)) {
                logError("[CONFIG] Slot %s references missing channel %d",
                         entry.first.c_str(), channel);
                ok = false;
            }
        }
    }
    return ok;
}
