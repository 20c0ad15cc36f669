#pragma once

#include <stdint.h>
#include <string>
#include <vector>

#include "scheduling.h"

struct HttpResponse {
    int         status = 0;
    std::string body;
};

// Authenticated transport to the provider's REST API. Paths are relative to
// the API base ("/v2/orders/..."); credentials and version headers are the
// transport's concern.
class HttpTransport {
public:
    virtual ~HttpTransport() {}

    // false on a transport failure (DNS, TLS, socket timeout)
    virtual bool request(const char* method, const std::string& path, const std::string& body,
                         uint32_t timeoutMs, HttpResponse& response) = 0;
};

struct LineItem {
    std::string uid;
    std::string catalogObjectId;
    std::string name;

    // catalog object id, falling back to the line item's own uid
    const std::string& catalogReference() const {
        return catalogObjectId.empty() ? uid : catalogObjectId;
    }
};

struct Order {
    std::string           id;
    std::vector<LineItem> lineItems;
};

struct CustomAttributeValue {
    std::string              key;
    std::string              definitionId;
    std::vector<std::string> selectionUids;
};

struct CatalogObject {
    std::string id;
    std::string type;
    std::vector<CustomAttributeValue> customAttributes;  // sorted by key
};

struct AllowedSelection {
    std::string uid;
    std::string name;
};

struct AttributeDefinition {
    std::string id;
    std::vector<AllowedSelection> allowedSelections;
};

enum SquareStatus {
    SQUARE_OK,
    SQUARE_NOT_FOUND,
    SQUARE_INVALID_ID,
    SQUARE_TIMEOUT,
    SQUARE_TRANSPORT_ERROR,
    SQUARE_HTTP_ERROR,
    SQUARE_BAD_RESPONSE
};

const char* squareStatusName(SquareStatus status);

// Typed access to the three read-only calls the pipeline needs.
class SquareClient {
public:
    explicit SquareClient(HttpTransport& transport) : m_transport(transport) {}

    SquareStatus fetchOrder(const std::string& orderId, const Deadline& deadline, Order& order);
    SquareStatus fetchCatalogObject(const std::string& objectId, const Deadline& deadline,
                                    CatalogObject& object);
    SquareStatus fetchAttributeDefinition(const std::string& definitionId,
                                          const Deadline& deadline,
                                          AttributeDefinition& definition);

    static bool isValidId(const std::string& id);

private:
    SquareStatus send(const char* method, const std::string& path, const std::string& body,
                      const Deadline& deadline, HttpResponse& response);
    SquareStatus batchRetrieve(const std::string& objectId, const Deadline& deadline,
                               std::string& responseBody);

    HttpTransport& m_transport;
};
