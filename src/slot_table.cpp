#include "config.h"

// A/B/C/F rows: one column relay plus three of the shared row relays.
// D/E rows: wide trays, eight relays each. Channel 4 selects D, 1 selects E.
const SlotBinding SLOT_BINDINGS[] = {
    { "A1", { 3, 12, 13, 14 }, 4 },
    { "A2", { 3, 7, 13, 14 }, 4 },
    { "A3", { 3, 7, 12, 14 }, 4 },
    { "A4", { 3, 7, 12, 13 }, 4 },

    { "B1", { 2, 12, 13, 14 }, 4 },
    { "B2", { 2, 7, 13, 14 }, 4 },
    { "B3", { 2, 7, 12, 14 }, 4 },
    { "B4", { 2, 7, 12, 13 }, 4 },

    { "C1", { 5, 12, 13, 14 }, 4 },
    { "C2", { 5, 7, 13, 14 }, 4 },
    { "C3", { 5, 7, 12, 14 }, 4 },
    { "C4", { 5, 7, 12, 13 }, 4 },

    { "D1", { 4, 16, 15, 14, 13, 12, 10, 8 }, 8 },
    { "D2", { 4, 16, 15, 14, 13, 10, 8, 7 }, 8 },
    { "D3", { 4, 16, 15, 14, 12, 10, 8, 7 }, 8 },
    { "D4", { 4, 16, 15, 13, 12, 10, 8, 7 }, 8 },
    { "D5", { 4, 16, 14, 13, 12, 7, 8, 10 }, 8 },
    { "D6", { 4, 16, 14, 13, 12, 7, 8, 15 }, 8 },
    { "D7", { 4, 15, 14, 13, 12, 10, 8, 7 }, 8 },
    { "D8", { 4, 16, 15, 14, 13, 12, 10, 7 }, 8 },

    { "E1", { 1, 16, 15, 14, 13, 12, 10, 8 }, 8 },
    { "E2", { 1, 16, 15, 14, 13, 10, 8, 7 }, 8 },
    { "E3", { 1, 16, 15, 14, 12, 10, 8, 7 }, 8 },
    { "E4", { 1, 16, 15, 13, 12, 10, 8, 7 }, 8 },
    { "E5", { 1, 16, 14, 13, 12, 7, 8, 10 }, 8 },
    { "E6", { 1, 16, 14, 13, 12, 7, 8, 15 }, 8 },
    { "E7", { 1, 15, 14, 13, 12, 10, 8, 7 }, 8 },
    { "E8", { 1, 16, 15, 14, 13, 12, 10, 7 }, 8 },

    { "F1", { 6, 12, 13, 14 }, 4 },
    { "F2", { 6, 7, 13, 14 }, 4 },
    { "F3", { 6, 7, 12, 14 }, 4 },
    { "F4", { 6, 7, 12, 13 }, 4 },
};

const size_t NUM_SLOT_BINDINGS = sizeof(SLOT_BINDINGS) / sizeof(SLOT_BINDINGS[0]);
