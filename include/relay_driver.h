#pragma once

#include <stddef.h>
#include <map>
#include <memory>
#include <vector>

#include "output_pin.h"

// Owns every relay output. Channels are attached before configure() and
// never change afterwards, so engage/disengage need no locking.
class RelayDriver {
public:
    RelayDriver();

    bool attach(int channel, std::unique_ptr<OutputPin> pin);

    // Claims every attached pin as an output and forces it idle (HIGH).
    // false if any pin could not be claimed.
    bool configure();
    bool isConfigured() const { return m_configured; }

    bool engage(int channel);     // LOW
    bool disengage(int channel);  // HIGH
    void releaseAll();

    bool   hasChannel(int channel) const;
    size_t channelCount() const { return m_pins.size(); }
    std::vector<int> channels() const;

private:
    OutputPin* find(int channel, const char* action);

    std::map<int, std::unique_ptr<OutputPin> > m_pins;
    bool m_configured;
};
