#pragma once

#include <Arduino.h>
#include <WebServer.h>
#include <atomic>
#include <string>

#include "app_config.h"
#include "logging.h"
#include "output_pin.h"
#include "scheduling.h"
#include "service_console.h"
#include "square_client.h"
#include "webhook_intake.h"

// Task sizing. TLS handshakes need the large stack.
constexpr uint32_t ORDER_TASK_STACK      = 12288;
constexpr uint32_t DISPENSE_TASK_STACK   = 4096;
constexpr int      MAX_ORDER_TASKS       = 3;
constexpr int      MAX_DISPENSE_TASKS    = 16;
constexpr uint32_t WIFI_CONNECT_TIMEOUT_MS = 20000;

// Relay output on one ESP32 GPIO
class GpioPin : public OutputPin {
public:
    explicit GpioPin(uint8_t gpio) : m_gpio(gpio) {}

    bool configureAsOutput() override;
    void setHigh() override { digitalWrite(m_gpio, HIGH); }
    void setLow() override { digitalWrite(m_gpio, LOW); }

private:
    uint8_t m_gpio;
};

// One FreeRTOS task per job, deleted when the job returns
class FreeRtosTaskRunner : public TaskRunner {
public:
    FreeRtosTaskRunner(uint32_t stackBytes, UBaseType_t priority, int maxRunning);

    bool spawn(const char* name, std::function<void()> job) override;
    int  running() const { return m_running.load(); }

private:
    struct Job {
        FreeRtosTaskRunner*   owner;
        std::function<void()> body;
    };
    static void taskMain(void* arg);

    uint32_t         m_stackBytes;
    UBaseType_t      m_priority;
    int              m_maxRunning;
    std::atomic<int> m_running;
};

// HTTPS to the Square API with bearer auth. One client per request.
class HttpsTransport : public HttpTransport {
public:
    HttpsTransport(const AppConfig& config, const std::string& caCert);

    bool request(const char* method, const std::string& path, const std::string& body,
                 uint32_t timeoutMs, HttpResponse& response) override;

private:
    std::string m_baseUrl;
    std::string m_authorization;
    std::string m_version;
    std::string m_caCert;
};

uint32_t boardMillis();
void     boardSleep(uint32_t ms);
void     serialLogSink(LogLevel level, const char* line);
void     haltWithError(const char* message);
bool     readTextFile(const char* path, std::string& text);

// Network functions
bool connectWiFi(const AppConfig& config);
void maintainWiFi();
void beginWebRoutes(WebServer& server, WebhookIntake& intake);

// Serial interface functions
void handleSerialCommands(ServiceConsole& console);
