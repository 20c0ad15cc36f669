#include "app_config.h"

#include <ArduinoJson.h>

#include "logging.h"

static const size_t CONFIG_DOC_CAPACITY = 2048;

static bool readText(JsonObject root, const char* key, std::string& out, std::string& error) {
    JsonVariant value = root[key];
    if (value.isNull()) return true;
    if (!value.is<const char*>()) {
        error = std::string(key) + " must be a string";
        return false;
    }
    out = value.as<const char*>();
    return true;
}

static bool readNumber(JsonObject root, const char* key, uint32_t minValue, uint32_t maxValue,
                       uint32_t& out, std::string& error) {
    JsonVariant value = root[key];
    if (value.isNull()) return true;
    if (!value.is<unsigned long>()) {
        error = std::string(key) + " must be a non-negative integer";
        return false;
    }
    unsigned long number = value.as<unsigned long>();
    if (number < minValue || number > maxValue) {
        error = std::string(key) + " out of range";
        return false;
    }
    out = (uint32_t)number;
    return true;
}

bool parseAppConfig(const std::string& json, AppConfig& config, std::string& error) {
    DynamicJsonDocument doc(CONFIG_DOC_CAPACITY);
    DeserializationError parseError = deserializeJson(doc, json);
    if (parseError) {
        error = std::string("invalid JSON: ") + parseError.c_str();
        return false;
    }
    if (!doc.is<JsonObject>()) {
        error = "config root must be an object";
        return false;
    }
    JsonObject root = doc.as<JsonObject>();

    std::string environment = "production";
    std::string apiBase;
    if (!readText(root, "wifi_ssid", config.wifiSsid, error) ||
        !readText(root, "wifi_password", config.wifiPassword, error) ||
        !readText(root, "hostname", config.hostname, error) ||
        !readText(root, "square_access_token", config.squareAccessToken, error) ||
        !readText(root, "square_environment", environment, error) ||
        !readText(root, "square_api_base", apiBase, error) ||
        !readText(root, "square_version", config.squareVersion, error) ||
        !readText(root, "square_ca_cert_path", config.squareCaCertPath, error)) {
        return false;
    }

    uint32_t port = config.httpPort;
    if (!readNumber(root, "http_port", 1, 65535, port, error) ||
        !readNumber(root, "dispense_dwell_ms", 1, MAX_DISPENSE_DWELL_MS, config.dispenseDwellMs, error) ||
        !readNumber(root, "request_timeout_ms", 1, MAX_REQUEST_BUDGET_MS, config.requestTimeoutMs, error) ||
        !readNumber(root, "ledger_retention_ms", 0, 0xFFFFFFFFUL, config.ledgerRetentionMs, error)) {
        return false;
    }
    config.httpPort = (uint16_t)port;

    if (environment == "production") {
        config.squareApiBase = SQUARE_PRODUCTION_BASE;
    } else if (environment == "sandbox") {
        config.squareApiBase = SQUARE_SANDBOX_BASE;
    } else {
        error = "square_environment must be production or sandbox";
        return false;
    }
    if (!apiBase.empty()) config.squareApiBase = apiBase;
    while (!config.squareApiBase.empty() && config.squareApiBase.back() == '/') {
        config.squareApiBase.pop_back();
    }

    if (config.wifiSsid.empty()) {
        error = "wifi_ssid is required";
        return false;
    }
    if (config.squareAccessToken.empty()) {
        error = "square_access_token is required";
        return false;
    }
    if (config.squareApiBase.compare(0, 8, "https://") != 0) {
        error = "square_api_base must use https";
        return false;
    }

    logInfo("[CONFIG] Square API %s, dwell %lu ms, request budget %lu ms",
            config.squareApiBase.c_str(), (unsigned long)config.dispenseDwellMs,
            (unsigned long)config.requestTimeoutMs);
    return true;
}
