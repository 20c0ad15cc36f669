#include "order_processor.h"

#include "logging.h"

OrderProcessor::OrderProcessor(OrderLedger& ledger, SquareClient& client,
                               CatalogResolver& resolver, DispenseController& dispenser,
                               ClockFn clock, uint32_t requestBudgetMs)
    : m_ledger(ledger), m_client(client), m_resolver(resolver), m_dispenser(dispenser),
      m_clock(clock), m_requestBudgetMs(requestBudgetMs) {}

OrderOutcome OrderProcessor::process(const std::string& orderId) {
    OrderOutcome outcome;

    if (!m_ledger.tryClaim(orderId)) {
        logInfo("[ORDER] Ignoring duplicate webhook for order %s", orderId.c_str());
        return outcome;
    }
    outcome.claimed = true;
    logInfo("[ORDER] Processing order %s", orderId.c_str());

    Deadline deadline(m_clock, m_requestBudgetMs);

    Order order;
    SquareStatus status = m_client.fetchOrder(orderId, deadline, order);
    if (status != SQUARE_OK) {
        logError("[ORDER] Could not fetch order %s: %s", orderId.c_str(), squareStatusName(status));
        return outcome;
    }
    outcome.fetched   = true;
    outcome.lineItems = (int)order.lineItems.size();
    logInfo("[ORDER] Order %s has %d line items", orderId.c_str(), outcome.lineItems);

    for (size_t i = 0; i < order.lineItems.size(); i++) {
        const LineItem& item = order.lineItems[i];

        std::string slot;
        ResolveStatus resolved = deadline.expired() ? RESOLVE_TIMEOUT
                                                    : m_resolver.resolveSlot(item, deadline, slot);
        if (resolved != RESOLVE_OK) {
            logWarn("[ORDER] %s item %u (%s): %s, skipped", orderId.c_str(), (unsigned)(i + 1),
                    item.catalogReference().c_str(), resolveStatusName(resolved));
            outcome.skipped++;
            continue;
        }

        if (m_dispenser.dispense(slot)) {
            outcome.dispensed++;
        } else {
            outcome.skipped++;
        }
    }

    logInfo("[ORDER] Order %s done: %d dispensed, %d skipped", orderId.c_str(), outcome.dispensed,
            outcome.skipped);
    return outcome;
}
