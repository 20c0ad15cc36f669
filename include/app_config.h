#pragma once

#include <stdint.h>
#include <string>

#include "config.h"

constexpr const char* CONFIG_PATH            = "/config.json";
constexpr const char* SQUARE_PRODUCTION_BASE = "https://connect.squareup.com";
constexpr const char* SQUARE_SANDBOX_BASE    = "https://connect.squareupsandbox.com";

struct AppConfig {
    std::string wifiSsid;
    std::string wifiPassword;
    std::string hostname          = "square-vend";

    std::string squareAccessToken;
    std::string squareApiBase     = SQUARE_PRODUCTION_BASE;
    std::string squareVersion     = "2025-07-16";
    std::string squareCaCertPath  = "/square_root_ca.pem";

    uint16_t httpPort          = HTTP_PORT;
    uint32_t dispenseDwellMs   = DISPENSE_DWELL_MS;
    uint32_t requestTimeoutMs  = SQUARE_REQUEST_BUDGET_MS;
    uint32_t ledgerRetentionMs = LEDGER_RETENTION_MS;
};

// Fills config from the JSON text of /config.json. Missing optional keys
// keep their defaults. On failure error names the offending key.
bool parseAppConfig(const std::string& json, AppConfig& config, std::string& error);
