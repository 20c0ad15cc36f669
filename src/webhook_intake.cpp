#include "webhook_intake.h"

#include <ArduinoJson.h>

#include "logging.h"

static const size_t WEBHOOK_DOC_CAPACITY = 2048;

static const char* PAYMENT_UPDATED = "payment.updated";
static const char* COMPLETED       = "COMPLETED";

const char* intakeResultName(IntakeResult result) {
    switch (result) {
        case INTAKE_ACCEPTED:  return "accepted";
        case INTAKE_IGNORED:   return "ignored";
        case INTAKE_MALFORMED: return "malformed";
        case INTAKE_BUSY:      return "busy";
    }
    return "?";
}

int intakeHttpStatus(IntakeResult result) {
    switch (result) {
        case INTAKE_ACCEPTED:
        case INTAKE_IGNORED:   return 200;
        case INTAKE_MALFORMED: return 400;
        case INTAKE_BUSY:      return 503;
    }
    return 500;
}

static std::string jsonBody(const char* key, const char* text) {
    StaticJsonDocument<128> doc;
    doc[key] = text;
    std::string out;
    serializeJson(doc, out);
    return out;
}

std::string intakeResponseBody(IntakeResult result) {
    switch (result) {
        case INTAKE_ACCEPTED:
        case INTAKE_IGNORED:   return jsonBody("message", "Webhook received and processing started");
        case INTAKE_MALFORMED: return jsonBody("error", "Invalid payload");
        case INTAKE_BUSY:      return jsonBody("error", "Busy");
    }
    return jsonBody("error", "Internal error");
}

std::string healthResponseBody() {
    return jsonBody("message", "Hello World");
}

std::string notFoundResponseBody() {
    return jsonBody("error", "Not found");
}

// Copies a string field; absent or null leaves it empty. Any other JSON type
// makes the payload malformed.
static bool readString(JsonVariant value, std::string& out) {
    out.clear();
    if (value.isNull()) return true;
    if (!value.is<const char*>()) return false;
    out = value.as<const char*>();
    return true;
}

// The filter only keeps objects on the path to the payment. Any other value
// there leaves the key behind with a null value.
static bool droppedByFilter(JsonVariant parent, const char* key) {
    return parent[key].isNull() && parent.containsKey(key);
}

// A dropped key is either an explicit null or a value of the wrong type.
// Re-read only that key, whole, into a small document. Anything that does
// not come back as null (or does not fit) is the wrong type.
static bool explicitNullAt(const std::string& body, int depth) {
    StaticJsonDocument<128> filter;
    if (depth == 1) {
        filter["data"] = true;
    } else if (depth == 2) {
        filter["data"]["object"] = true;
    } else {
        filter["data"]["object"]["payment"] = true;
    }

    StaticJsonDocument<256> doc;
    if (deserializeJson(doc, body, DeserializationOption::Filter(filter))) return false;

    JsonVariantConst data = doc["data"];
    if (depth == 1) return data.isNull();
    JsonVariantConst object = data["object"];
    if (depth == 2) return object.isNull();
    return object["payment"].isNull();
}

bool parsePaymentEvent(const std::string& body, PaymentEvent& event) {
    if (body.empty() || body.size() > MAX_WEBHOOK_BODY) return false;

    StaticJsonDocument<256> filter;
    filter["type"]     = true;
    filter["event_id"] = true;
    filter["data"]["object"]["payment"]["status"]   = true;
    filter["data"]["object"]["payment"]["order_id"] = true;

    DynamicJsonDocument doc(WEBHOOK_DOC_CAPACITY);
    DeserializationError error = deserializeJson(doc, body, DeserializationOption::Filter(filter));
    if (error) {
        logWarn("[WEBHOOK] Invalid webhook payload: %s", error.c_str());
        return false;
    }
    if (!doc.is<JsonObject>()) return false;

    JsonVariant root    = doc.as<JsonVariant>();
    JsonVariant data    = root["data"];
    JsonVariant object  = data["object"];
    JsonVariant payment = object["payment"];
    int dropped = 0;
    if (droppedByFilter(root, "data")) {
        dropped = 1;
    } else if (droppedByFilter(data, "object")) {
        dropped = 2;
    } else if (droppedByFilter(object, "payment")) {
        dropped = 3;
    }
    if (dropped != 0 && !explicitNullAt(body, dropped)) return false;

    return readString(doc["type"], event.type) &&
           readString(doc["event_id"], event.eventId) &&
           readString(payment["status"], event.paymentStatus) &&
           readString(payment["order_id"], event.orderId);
}

bool isCompletedPayment(const PaymentEvent& event) {
    return event.type == PAYMENT_UPDATED && event.paymentStatus == COMPLETED &&
           !event.orderId.empty();
}

IntakeResult WebhookIntake::handle(const std::string& body) {
    PaymentEvent event;
    if (!parsePaymentEvent(body, event)) {
        logWarn("[WEBHOOK] Rejected payload (%u bytes)", (unsigned)body.size());
        return INTAKE_MALFORMED;
    }

    if (!isCompletedPayment(event)) {
        logInfo("[WEBHOOK] Ignoring event %s (type=%s status=%s)", event.eventId.c_str(),
                event.type.c_str(), event.paymentStatus.c_str());
        return INTAKE_IGNORED;
    }

    std::string orderId = event.orderId;
    OrderProcessor& processor = m_processor;
    bool started = m_runner.spawn("order", [&processor, orderId]() {
        processor.process(orderId);
    });
    if (!started) {
        logError("[WEBHOOK] No task available for order %s", orderId.c_str());
        return INTAKE_BUSY;
    }

    logInfo("[WEBHOOK] Payment completed for order %s, processing started", orderId.c_str());
    return INTAKE_ACCEPTED;
}
