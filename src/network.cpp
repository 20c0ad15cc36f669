#include "board.h"

#include <WiFi.h>

#include "config.h"

static WebServer*     webServer     = nullptr;
static WebhookIntake* webhookIntake = nullptr;

bool connectWiFi(const AppConfig& config) {
    WiFi.mode(WIFI_STA);
    WiFi.setHostname(config.hostname.c_str());
    WiFi.setAutoReconnect(true);
    WiFi.begin(config.wifiSsid.c_str(), config.wifiPassword.c_str());

    logInfo("[WIFI] Connecting to %s", config.wifiSsid.c_str());
    unsigned long t0 = millis();
    while (WiFi.status() != WL_CONNECTED) {
        if (millis() - t0 > WIFI_CONNECT_TIMEOUT_MS) {
            logWarn("[WIFI] Not connected after %lu ms, will keep retrying",
                    (unsigned long)WIFI_CONNECT_TIMEOUT_MS);
            return false;
        }
        delay(250);
    }

    logInfo("[WIFI] Connected, IP %s, MAC %s", WiFi.localIP().toString().c_str(),
            WiFi.macAddress().c_str());
    return true;
}

// Status LED mirrors the link
void maintainWiFi() {
    static bool          wasConnected = false;
    static unsigned long lastCheck    = 0;

    if (millis() - lastCheck < 1000) return;
    lastCheck = millis();

    bool connected = WiFi.status() == WL_CONNECTED;
    digitalWrite(STATUS_LED_PIN, connected ? HIGH : LOW);
    if (connected != wasConnected) {
        if (connected) {
            logInfo("[WIFI] Link up, IP %s", WiFi.localIP().toString().c_str());
        } else {
            logWarn("[WIFI] Link lost");
        }
        wasConnected = connected;
    }
}

static void sendJson(int status, const std::string& body) {
    webServer->send(status, "application/json", body.c_str());
}

static void handleRoot() {
    sendJson(200, healthResponseBody());
}

static void handleSquareWebhook() {
    String body = webServer->arg("plain");
    IntakeResult result = webhookIntake->handle(std::string(body.c_str(), body.length()));
    sendJson(intakeHttpStatus(result), intakeResponseBody(result));
}

static void handleNotFound() {
    sendJson(404, notFoundResponseBody());
}

void beginWebRoutes(WebServer& server, WebhookIntake& intake) {
    webServer     = &server;
    webhookIntake = &intake;

    server.on("/", HTTP_GET, handleRoot);
    server.on("/webhook/square", HTTP_POST, handleSquareWebhook);
    server.onNotFound(handleNotFound);
    server.begin();
    logInfo("[HTTP] Listening for webhooks on /webhook/square");
}
