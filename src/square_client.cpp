#include "square_client.h"

#include <ArduinoJson.h>
#include <string.h>
#include <algorithm>

#include "logging.h"

static const size_t RESPONSE_DOC_CAPACITY = 16384;
static const size_t ERROR_DOC_CAPACITY    = 2048;
static const size_t MAX_ID_LENGTH         = 192;

const char* squareStatusName(SquareStatus status) {
    switch (status) {
        case SQUARE_OK:              return "ok";
        case SQUARE_NOT_FOUND:       return "not found";
        case SQUARE_INVALID_ID:      return "invalid id";
        case SQUARE_TIMEOUT:         return "timeout";
        case SQUARE_TRANSPORT_ERROR: return "transport error";
        case SQUARE_HTTP_ERROR:      return "http error";
        case SQUARE_BAD_RESPONSE:    return "bad response";
    }
    return "?";
}

// Provider ids are opaque but only ever use these characters. Anything else
// must not reach a request path ('#' would start a fragment, '/' or '?' would
// change the resource).
bool SquareClient::isValidId(const std::string& id) {
    if (id.empty() || id.size() > MAX_ID_LENGTH) return false;
    for (char c : id) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-' || c == ':';
        if (!ok) return false;
    }
    return true;
}

static void logProviderError(const std::string& path, const HttpResponse& response) {
    StaticJsonDocument<128> filter;
    filter["errors"][0]["code"]   = true;
    filter["errors"][0]["detail"] = true;

    DynamicJsonDocument doc(ERROR_DOC_CAPACITY);
    DeserializationError error =
        deserializeJson(doc, response.body, DeserializationOption::Filter(filter));
    JsonObject first = doc["errors"][0].as<JsonObject>();
    if (!error && !first.isNull()) {
        logWarn("[SQUARE] %s -> HTTP %d %s: %s", path.c_str(), response.status,
                first["code"] | "", first["detail"] | "");
        return;
    }
    logWarn("[SQUARE] %s -> HTTP %d", path.c_str(), response.status);
}

SquareStatus SquareClient::send(const char* method, const std::string& path,
                                const std::string& body, const Deadline& deadline,
                                HttpResponse& response) {
    uint32_t remaining = deadline.remainingMs();
    if (remaining == 0) return SQUARE_TIMEOUT;

    if (!m_transport.request(method, path, body, remaining, response)) {
        if (deadline.expired()) return SQUARE_TIMEOUT;
        logWarn("[SQUARE] %s %s failed before a response", method, path.c_str());
        return SQUARE_TRANSPORT_ERROR;
    }

    if (response.status == 200) return SQUARE_OK;
    logProviderError(path, response);
    return response.status == 404 ? SQUARE_NOT_FOUND : SQUARE_HTTP_ERROR;
}

SquareStatus SquareClient::fetchOrder(const std::string& orderId, const Deadline& deadline,
                                      Order& order) {
    if (!isValidId(orderId)) {
        logWarn("[SQUARE] Refusing order id '%s'", orderId.c_str());
        return SQUARE_INVALID_ID;
    }

    HttpResponse response;
    SquareStatus status = send("GET", "/v2/orders/" + orderId, "", deadline, response);
    if (status != SQUARE_OK) return status;

    StaticJsonDocument<256> filter;
    filter["order"]["id"] = true;
    filter["order"]["line_items"][0]["uid"]               = true;
    filter["order"]["line_items"][0]["catalog_object_id"] = true;
    filter["order"]["line_items"][0]["name"]              = true;

    DynamicJsonDocument doc(RESPONSE_DOC_CAPACITY);
    DeserializationError error =
        deserializeJson(doc, response.body, DeserializationOption::Filter(filter));
    if (error) {
        logWarn("[SQUARE] Order %s: unreadable response (%s)", orderId.c_str(), error.c_str());
        return SQUARE_BAD_RESPONSE;
    }

    JsonObject orderJson = doc["order"].as<JsonObject>();
    if (orderJson.isNull()) return SQUARE_NOT_FOUND;

    order.id = orderJson["id"] | orderId.c_str();
    order.lineItems.clear();
    for (JsonObject itemJson : orderJson["line_items"].as<JsonArray>()) {
        LineItem item;
        item.uid             = itemJson["uid"] | "";
        item.catalogObjectId = itemJson["catalog_object_id"] | "";
        item.name            = itemJson["name"] | "";
        order.lineItems.push_back(item);
    }
    return SQUARE_OK;
}

SquareStatus SquareClient::batchRetrieve(const std::string& objectId, const Deadline& deadline,
                                         std::string& responseBody) {
    if (!isValidId(objectId)) {
        logWarn("[SQUARE] Refusing catalog id '%s'", objectId.c_str());
        return SQUARE_INVALID_ID;
    }

    StaticJsonDocument<256> request;
    JsonArray ids = request.createNestedArray("object_ids");
    ids.add(objectId.c_str());
    request["include_related_objects"] = false;

    std::string body;
    serializeJson(request, body);

    HttpResponse response;
    SquareStatus status = send("POST", "/v2/catalog/batch-retrieve", body, deadline, response);
    if (status != SQUARE_OK) return status;
    responseBody.swap(response.body);
    return SQUARE_OK;
}

SquareStatus SquareClient::fetchCatalogObject(const std::string& objectId,
                                              const Deadline& deadline,
                                              CatalogObject& object) {
    std::string body;
    SquareStatus status = batchRetrieve(objectId, deadline, body);
    if (status != SQUARE_OK) return status;

    StaticJsonDocument<256> filter;
    filter["objects"][0]["id"]                      = true;
    filter["objects"][0]["type"]                    = true;
    filter["objects"][0]["custom_attribute_values"] = true;

    DynamicJsonDocument doc(RESPONSE_DOC_CAPACITY);
    DeserializationError error = deserializeJson(doc, body, DeserializationOption::Filter(filter));
    if (error) {
        logWarn("[SQUARE] Catalog %s: unreadable response (%s)", objectId.c_str(), error.c_str());
        return SQUARE_BAD_RESPONSE;
    }

    JsonObject objectJson = doc["objects"][0].as<JsonObject>();
    if (objectJson.isNull()) return SQUARE_NOT_FOUND;

    object.id   = objectJson["id"] | objectId.c_str();
    object.type = objectJson["type"] | "";
    object.customAttributes.clear();

    for (JsonPair kv : objectJson["custom_attribute_values"].as<JsonObject>()) {
        JsonObject valueJson = kv.value().as<JsonObject>();
        if (valueJson.isNull()) continue;

        CustomAttributeValue value;
        value.key          = kv.key().c_str();
        value.definitionId = valueJson["custom_attribute_definition_id"] | "";
        for (JsonVariant uid : valueJson["selection_uid_values"].as<JsonArray>()) {
            const char* text = uid.as<const char*>();
            if (text != nullptr && *text != '\0') value.selectionUids.push_back(text);
        }
        object.customAttributes.push_back(value);
    }

    std::sort(object.customAttributes.begin(), object.customAttributes.end(),
              [](const CustomAttributeValue& a, const CustomAttributeValue& b) {
                  return a.key < b.key;
              });
    return SQUARE_OK;
}

SquareStatus SquareClient::fetchAttributeDefinition(const std::string& definitionId,
                                                    const Deadline& deadline,
                                                    AttributeDefinition& definition) {
    std::string body;
    SquareStatus status = batchRetrieve(definitionId, deadline, body);
    if (status != SQUARE_OK) return status;

    StaticJsonDocument<384> filter;
    filter["objects"][0]["id"]   = true;
    filter["objects"][0]["type"] = true;
    filter["objects"][0]["custom_attribute_definition_data"]["selection_config"]
          ["allowed_selections"][0]["uid"] = true;
    filter["objects"][0]["custom_attribute_definition_data"]["selection_config"]
          ["allowed_selections"][0]["name"] = true;

    DynamicJsonDocument doc(RESPONSE_DOC_CAPACITY);
    DeserializationError error = deserializeJson(doc, body, DeserializationOption::Filter(filter));
    if (error) {
        logWarn("[SQUARE] Definition %s: unreadable response (%s)", definitionId.c_str(),
                error.c_str());
        return SQUARE_BAD_RESPONSE;
    }

    JsonObject objectJson = doc["objects"][0].as<JsonObject>();
    if (objectJson.isNull()) return SQUARE_NOT_FOUND;

    const char* type = objectJson["type"] | "";
    if (strcmp(type, "CUSTOM_ATTRIBUTE_DEFINITION") != 0) {
        logWarn("[SQUARE] %s is a %s, not an attribute definition", definitionId.c_str(), type);
        return SQUARE_NOT_FOUND;
    }

    definition.id = objectJson["id"] | definitionId.c_str();
    definition.allowedSelections.clear();
    JsonArray selections = objectJson["custom_attribute_definition_data"]["selection_config"]
                                     ["allowed_selections"].as<JsonArray>();
    for (JsonObject selectionJson : selections) {
        AllowedSelection selection;
        selection.uid  = selectionJson["uid"] | "";
        selection.name = selectionJson["name"] | "";
        definition.allowedSelections.push_back(selection);
    }
    return SQUARE_OK;
}
