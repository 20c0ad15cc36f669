#include <Arduino.h>
#include <LittleFS.h>
#include <WiFi.h>
#include <WebServer.h>
#include <memory>

#include "actuator_map.h"
#include "app_config.h"
#include "board.h"
#include "catalog_resolver.h"
#include "config.h"
#include "dispense_controller.h"
#include "order_ledger.h"
#include "order_processor.h"
#include "relay_driver.h"
#include "service_console.h"
#include "square_client.h"
#include "webhook_intake.h"

AppConfig   appConfig;
ActuatorMap actuatorMap;
RelayDriver relays;

FreeRtosTaskRunner orderRunner(ORDER_TASK_STACK, 2, MAX_ORDER_TASKS);
FreeRtosTaskRunner dispenseRunner(DISPENSE_TASK_STACK, 3, MAX_DISPENSE_TASKS);

std::unique_ptr<OrderLedger>        ledger;
std::unique_ptr<DispenseController> dispenser;
std::unique_ptr<HttpsTransport>     transport;
std::unique_ptr<SquareClient>       squareClient;
std::unique_ptr<CatalogResolver>    resolver;
std::unique_ptr<OrderProcessor>     processor;
std::unique_ptr<WebhookIntake>      intake;
std::unique_ptr<ServiceConsole>     console;
std::unique_ptr<WebServer>          server;

static void reportStatus() {
    logInfo("Wi-Fi: %s, IP %s", WiFi.status() == WL_CONNECTED ? "connected" : "down",
            WiFi.localIP().toString().c_str());
    logInfo("Free heap: %u bytes", ESP.getFreeHeap());
    logInfo("Orders in flight: %d, dispense cycles: %d", orderRunner.running(),
            dispenser->activeCycles());
    logInfo("Ledger: %u order ids", (unsigned)ledger->size());
}

void setup() {
    Serial.begin(115200);
    delay(2000);
    setLogSink(serialLogSink);
    logInfo("--- square-vend relay controller ---");

    pinMode(STATUS_LED_PIN, OUTPUT);
    digitalWrite(STATUS_LED_PIN, LOW);

    // Relays go idle before anything else can fail
    for (int i = 0; i < NUM_RELAY_CHANNELS; i++) {
        relays.attach(i + 1, std::unique_ptr<OutputPin>(new GpioPin(RELAY_PINS[i])));
    }
    if (!relays.configure()) haltWithError("cannot claim relay outputs");

    actuatorMap = ActuatorMap::fromTable(SLOT_BINDINGS, NUM_SLOT_BINDINGS);
    if (!actuatorMap.validate(relays)) haltWithError("slot table references unknown relays");
    logInfo("[CONFIG] %u slots mapped", (unsigned)actuatorMap.size());

    if (!LittleFS.begin()) haltWithError("could not mount LittleFS");

    std::string configText;
    std::string error;
    if (!readTextFile(CONFIG_PATH, configText)) haltWithError("missing /config.json");
    if (!parseAppConfig(configText, appConfig, error)) {
        haltWithError(("bad /config.json: " + error).c_str());
    }
    std::string caCert;
    if (!readTextFile(appConfig.squareCaCertPath.c_str(), caCert)) {
        haltWithError("missing Square root certificate");
    }

    ledger.reset(new OrderLedger(appConfig.ledgerRetentionMs, boardMillis));
    dispenser.reset(new DispenseController(actuatorMap, relays, dispenseRunner, boardSleep,
                                           appConfig.dispenseDwellMs));
    transport.reset(new HttpsTransport(appConfig, caCert));
    squareClient.reset(new SquareClient(*transport));
    resolver.reset(new CatalogResolver(*squareClient));
    processor.reset(new OrderProcessor(*ledger, *squareClient, *resolver, *dispenser, boardMillis,
                                       appConfig.requestTimeoutMs));
    intake.reset(new WebhookIntake(orderRunner, *processor));
    console.reset(new ServiceConsole(actuatorMap, relays, *dispenser, *ledger));
    console->setStatusReporter(reportStatus);

    connectWiFi(appConfig);

    server.reset(new WebServer(appConfig.httpPort));
    beginWebRoutes(*server, *intake);

    logInfo("Ready on port %u. Type ? for serial commands.", (unsigned)appConfig.httpPort);
}

void loop() {
    server->handleClient();
    handleSerialCommands(*console);
    maintainWiFi();
    delay(2);
}
