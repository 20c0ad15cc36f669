#pragma once

#include <stddef.h>
#include <string>

#include "order_processor.h"
#include "scheduling.h"

constexpr size_t MAX_WEBHOOK_BODY = 16384;

struct PaymentEvent {
    std::string eventId;
    std::string type;
    std::string paymentStatus;
    std::string orderId;
};

enum IntakeResult {
    INTAKE_ACCEPTED,   // order handed to a background task
    INTAKE_IGNORED,    // well-formed but not a completed payment
    INTAKE_MALFORMED,  // rejected, no side effects
    INTAKE_BUSY        // no task could be started, provider should retry
};

const char* intakeResultName(IntakeResult result);
int         intakeHttpStatus(IntakeResult result);
std::string intakeResponseBody(IntakeResult result);
std::string healthResponseBody();
std::string notFoundResponseBody();

// false if the body is not a JSON object or a known field has the wrong type
bool parsePaymentEvent(const std::string& body, PaymentEvent& event);
bool isCompletedPayment(const PaymentEvent& event);

// Filters provider notifications and hands completed payments to the
// order pipeline without waiting for it.
class WebhookIntake {
public:
    WebhookIntake(TaskRunner& runner, OrderProcessor& processor)
        : m_runner(runner), m_processor(processor) {}

    IntakeResult handle(const std::string& body);

private:
    TaskRunner&     m_runner;
    OrderProcessor& m_processor;
};
