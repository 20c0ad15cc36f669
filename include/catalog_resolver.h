#pragma once

#include <string>

#include "scheduling.h"
#include "square_client.h"

enum ResolveStatus {
    RESOLVE_OK,
    RESOLVE_NO_REFERENCE,
    RESOLVE_OBJECT_UNAVAILABLE,
    RESOLVE_NO_ATTRIBUTES,
    RESOLVE_NO_SELECTION,
    RESOLVE_DEFINITION_UNAVAILABLE,
    RESOLVE_SELECTION_UNKNOWN,
    RESOLVE_TIMEOUT
};

const char* resolveStatusName(ResolveStatus status);

// Line item -> catalog object -> custom attribute value -> attribute
// definition -> allowed selection name, which is the slot label.
//
// Fails closed: any missing link returns a status other than RESOLVE_OK and
// leaves slot empty. When an object carries several custom attributes the
// one with the lowest key wins.
class CatalogResolver {
public:
    explicit CatalogResolver(SquareClient& client) : m_client(client) {}

    ResolveStatus resolveSlot(const LineItem& item, const Deadline& deadline, std::string& slot);

private:
    SquareClient& m_client;
};
