#pragma once

#include <stddef.h>
#include <stdint.h>

// Relay channel -> GPIO. Index 0 is channel 1.
// Relay board is active LOW: HIGH = idle/open, LOW = engaged.
constexpr uint8_t RELAY_PINS[] = {
    17, // 1
    21, // 2
    22, // 3
    25, // 4
    32, // 5
    15, // 6
    33, // 7
    27, // 8
    4,  // 9
    16, // 10
    26, // 11
    14, // 12
    13, // 13
    18, // 14
    19, // 15
    23  // 16
};
constexpr int NUM_RELAY_CHANNELS = sizeof(RELAY_PINS) / sizeof(RELAY_PINS[0]);

constexpr uint8_t STATUS_LED_PIN = 2;

// Slot label -> relay channels that must be driven together
constexpr int MAX_CHANNELS_PER_SLOT = 8;

struct SlotBinding {
    const char* slot;
    uint8_t     channels[MAX_CHANNELS_PER_SLOT];
    uint8_t     channelCount;
};

extern const SlotBinding SLOT_BINDINGS[];
extern const size_t      NUM_SLOT_BINDINGS;

// Timing configuration (ms)
constexpr uint32_t DISPENSE_DWELL_MS       = 3300;
constexpr uint32_t MAX_DISPENSE_DWELL_MS   = 10000;
constexpr uint32_t MANUAL_RELAY_HOLD_MS    = 5000;
constexpr uint32_t SQUARE_REQUEST_BUDGET_MS = 30000;
constexpr uint32_t MAX_REQUEST_BUDGET_MS   = 120000;
constexpr uint32_t LEDGER_RETENTION_MS     = 72UL * 60UL * 60UL * 1000UL;

constexpr uint16_t HTTP_PORT = 8000;
