#pragma once

#include <stdint.h>
#include <string>

#include "catalog_resolver.h"
#include "dispense_controller.h"
#include "order_ledger.h"
#include "scheduling.h"
#include "square_client.h"

struct OrderOutcome {
    bool claimed    = false;  // false: duplicate delivery, nothing else ran
    bool fetched    = false;
    int  lineItems  = 0;
    int  dispensed  = 0;      // cycles launched
    int  skipped    = 0;
};

// One completed payment: claim the order id, fetch the order, resolve and
// dispense every line item. Failures stay with the line item they hit.
class OrderProcessor {
public:
    OrderProcessor(OrderLedger& ledger, SquareClient& client, CatalogResolver& resolver,
                   DispenseController& dispenser, ClockFn clock, uint32_t requestBudgetMs);

    OrderOutcome process(const std::string& orderId);

private:
    OrderLedger&        m_ledger;
    SquareClient&       m_client;
    CatalogResolver&    m_resolver;
    DispenseController& m_dispenser;
    ClockFn             m_clock;
    uint32_t            m_requestBudgetMs;
};
