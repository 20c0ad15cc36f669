#include "board.h"

#include <HTTPClient.h>
#include <LittleFS.h>
#include <WiFi.h>
#include <WiFiClientSecure.h>
#include <driver/gpio.h>
#include <memory>

#include "config.h"

bool GpioPin::configureAsOutput() {
    if (!GPIO_IS_VALID_OUTPUT_GPIO(m_gpio)) return false;
    // latch idle before the driver turns on so the relay never clicks
    digitalWrite(m_gpio, HIGH);
    pinMode(m_gpio, OUTPUT);
    return true;
}

FreeRtosTaskRunner::FreeRtosTaskRunner(uint32_t stackBytes, UBaseType_t priority, int maxRunning)
    : m_stackBytes(stackBytes), m_priority(priority), m_maxRunning(maxRunning), m_running(0) {}

bool FreeRtosTaskRunner::spawn(const char* name, std::function<void()> job) {
    if (++m_running > m_maxRunning) {
        m_running--;
        logWarn("[TASK] %s refused, %d tasks already running", name, m_maxRunning);
        return false;
    }

    Job* task = new Job{ this, std::move(job) };
    if (xTaskCreate(taskMain, name, m_stackBytes, task, m_priority, nullptr) != pdPASS) {
        delete task;
        m_running--;
        logError("[TASK] xTaskCreate failed for %s (free heap %u)", name, ESP.getFreeHeap());
        return false;
    }
    return true;
}

void FreeRtosTaskRunner::taskMain(void* arg) {
    std::unique_ptr<Job> task(static_cast<Job*>(arg));
    task->body();
    task->owner->m_running--;
    task.reset();
    vTaskDelete(nullptr);
}

HttpsTransport::HttpsTransport(const AppConfig& config, const std::string& caCert)
    : m_baseUrl(config.squareApiBase),
      m_authorization("Bearer " + config.squareAccessToken),
      m_version(config.squareVersion),
      m_caCert(caCert) {}

bool HttpsTransport::request(const char* method, const std::string& path, const std::string& body,
                             uint32_t timeoutMs, HttpResponse& response) {
    if (WiFi.status() != WL_CONNECTED) {
        logWarn("[HTTP] %s %s skipped: Wi-Fi down", method, path.c_str());
        return false;
    }

    WiFiClientSecure client;
    client.setCACert(m_caCert.c_str());

    HTTPClient http;
    http.setConnectTimeout((int32_t)timeoutMs);
    http.setTimeout((uint16_t)(timeoutMs > 0xFFFF ? 0xFFFF : timeoutMs));
    http.setReuse(false);

    String url = String(m_baseUrl.c_str()) + path.c_str();
    if (!http.begin(client, url)) {
        logWarn("[HTTP] Could not start request to %s", url.c_str());
        return false;
    }
    http.addHeader("Authorization", m_authorization.c_str());
    http.addHeader("Square-Version", m_version.c_str());
    http.addHeader("Content-Type", "application/json");
    http.addHeader("Accept", "application/json");

    int code = strcmp(method, "POST") == 0 ? http.POST(String(body.c_str())) : http.GET();
    if (code <= 0) {
        logWarn("[HTTP] %s %s: %s", method, path.c_str(), HTTPClient::errorToString(code).c_str());
        http.end();
        return false;
    }

    String payload = http.getString();
    response.status = code;
    response.body.assign(payload.c_str(), payload.length());
    http.end();
    return true;
}

uint32_t boardMillis() {
    return millis();
}

void boardSleep(uint32_t ms) {
    delay(ms);
}

void serialLogSink(LogLevel level, const char* line) {
    Serial.printf("[%10lu] %s\n", (unsigned long)millis(), line);
}

// Relays are already idle when this runs. The HTTP server is never started,
// so no payment is acknowledged that could not be dispensed.
void haltWithError(const char* message) {
    logError("FATAL: %s", message);
    logError("Check wiring and /config.json, then reset the board.");
    pinMode(STATUS_LED_PIN, OUTPUT);
    while (true) {
        digitalWrite(STATUS_LED_PIN, HIGH);
        delay(100);
        digitalWrite(STATUS_LED_PIN, LOW);
        delay(100);
    }
}

bool readTextFile(const char* path, std::string& text) {
    File file = LittleFS.open(path, "r");
    if (!file) {
        logError("[CONFIG] Failed to open %s for reading", path);
        return false;
    }

    text.clear();
    text.reserve(file.size());
    while (file.available()) {
        text.push_back((char)file.read());
    }
    file.close();
    return !text.empty();
}
