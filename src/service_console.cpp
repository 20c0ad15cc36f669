#include "service_console.h"

#include <ctype.h>
#include <stdlib.h>
#include <sstream>

#include "config.h"
#include "logging.h"

static std::string trim(const std::string& text) {
    size_t first = 0;
    while (first < text.size() && isspace((unsigned char)text[first])) first++;
    size_t last = text.size();
    while (last > first && isspace((unsigned char)text[last - 1])) last--;
    return text.substr(first, last - first);
}

static std::string toUpper(std::string text) {
    for (char& c : text) c = (char)toupper((unsigned char)c);
    return text;
}

static std::string toLower(std::string text) {
    for (char& c : text) c = (char)tolower((unsigned char)c);
    return text;
}

ServiceConsole::ServiceConsole(const ActuatorMap& map, RelayDriver& relays,
                               DispenseController& dispenser, const OrderLedger& ledger)
    : m_map(map), m_relays(relays), m_dispenser(dispenser), m_ledger(ledger) {}

void ServiceConsole::printHelp() const {
    logInfo("=== Available Serial Commands ===");
    logInfo("slots                – list slots and their relays");
    logInfo("slot <label>         – run a dispense cycle for a slot");
    logInfo("relay <n> [n ...]    – pulse relays 1..%d for %lu ms", NUM_RELAY_CHANNELS,
            (unsigned long)MANUAL_RELAY_HOLD_MS);
    logInfo("off                  – force every relay idle");
    logInfo("ledger               – number of remembered order ids");
    logInfo("status               – network and memory status");
    logInfo("?                    – show this help list");
}

void ServiceConsole::listSlots() const {
    for (const std::string& slot : m_map.slots()) {
        std::vector<int> channels;
        m_map.lookup(slot, channels);
        std::string text;
        for (int channel : channels) {
            if (!text.empty()) text += ",";
            text += std::to_string(channel);
        }
        logInfo("%-3s -> %s", slot.c_str(), text.c_str());
    }
}

bool ServiceConsole::parseChannels(const std::string& args, std::vector<int>& channels) const {
    std::istringstream words(args);
    std::string word;
    while (words >> word) {
        char* end = nullptr;
        long channel = strtol(word.c_str(), &end, 10);
        if (end == word.c_str() || *end != '\0' || channel < 1 || channel > NUM_RELAY_CHANNELS ||
            !m_relays.hasChannel((int)channel)) {
            logWarn("Relay %s is out of range (1-%d)", word.c_str(), NUM_RELAY_CHANNELS);
            return false;
        }
        channels.push_back((int)channel);
    }
    return !channels.empty();
}

bool ServiceConsole::handleLine(const std::string& rawLine) {
    std::string line = trim(rawLine);
    if (line.empty()) return false;

    size_t space = line.find(' ');
    std::string command = toLower(line.substr(0, space));
    std::string args = space == std::string::npos ? "" : trim(line.substr(space + 1));

    if (command == "?") {
        printHelp();
        return true;
    }
    if (command == "slots") {
        listSlots();
        return true;
    }
    if (command == "slot") {
        std::string slot = toUpper(args);
        if (slot.empty()) {
            logWarn("Syntax: slot <label>");
            return false;
        }
        if (!m_map.contains(slot)) {
            logWarn("Invalid slot %s. Try one of the labels from 'slots'.", slot.c_str());
            return false;
        }
        return m_dispenser.dispense(slot);
    }
    if (command == "relay") {
        std::vector<int> channels;
        if (!parseChannels(args, channels)) {
            logWarn("Syntax: relay <n> [n ...]");
            return false;
        }
        return m_dispenser.pulse("manual relays", channels, MANUAL_RELAY_HOLD_MS);
    }
    if (command == "off") {
        m_relays.releaseAll();
        logInfo("All relays idle");
        return true;
    }
    if (command == "ledger") {
        logInfo("%u order ids remembered", (unsigned)m_ledger.size());
        return true;
    }
    if (command == "status") {
        if (m_statusReporter) m_statusReporter();
        return true;
    }

    logWarn("Unknown command '%s', type ? for help", line.c_str());
    return false;
}
