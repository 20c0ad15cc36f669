#include "catalog_resolver.h"

#include "logging.h"

const char* resolveStatusName(ResolveStatus status) {
    switch (status) {
        case RESOLVE_OK:                     return "ok";
        case RESOLVE_NO_REFERENCE:           return "no catalog reference";
        case RESOLVE_OBJECT_UNAVAILABLE:     return "catalog object unavailable";
        case RESOLVE_NO_ATTRIBUTES:          return "no custom attributes";
        case RESOLVE_NO_SELECTION:           return "no selection value";
        case RESOLVE_DEFINITION_UNAVAILABLE: return "definition unavailable";
        case RESOLVE_SELECTION_UNKNOWN:      return "selection not in definition";
        case RESOLVE_TIMEOUT:                return "timeout";
    }
    return "?";
}

static bool isSellable(const std::string& type) {
    return type == "ITEM" || type == "ITEM_VARIATION";
}

ResolveStatus CatalogResolver::resolveSlot(const LineItem& item, const Deadline& deadline,
                                           std::string& slot) {
    slot.clear();

    const std::string& reference = item.catalogReference();
    if (reference.empty()) return RESOLVE_NO_REFERENCE;

    CatalogObject object;
    SquareStatus status = m_client.fetchCatalogObject(reference, deadline, object);
    if (status == SQUARE_TIMEOUT) return RESOLVE_TIMEOUT;
    if (status != SQUARE_OK) {
        logWarn("[CATALOG] Object %s: %s", reference.c_str(), squareStatusName(status));
        return RESOLVE_OBJECT_UNAVAILABLE;
    }

    if (!isSellable(object.type)) {
        logWarn("[CATALOG] Object %s has type '%s'", reference.c_str(), object.type.c_str());
        return RESOLVE_NO_ATTRIBUTES;
    }
    if (object.customAttributes.empty()) return RESOLVE_NO_ATTRIBUTES;
    if (object.customAttributes.size() > 1) {
        logInfo("[CATALOG] Object %s has %u custom attributes, using '%s'", reference.c_str(),
                (unsigned)object.customAttributes.size(), object.customAttributes[0].key.c_str());
    }

    const CustomAttributeValue& attribute = object.customAttributes[0];
    if (attribute.selectionUids.empty() || attribute.definitionId.empty()) {
        return RESOLVE_NO_SELECTION;
    }
    const std::string& selectionUid = attribute.selectionUids[0];

    AttributeDefinition definition;
    status = m_client.fetchAttributeDefinition(attribute.definitionId, deadline, definition);
    if (status == SQUARE_TIMEOUT) return RESOLVE_TIMEOUT;
    if (status != SQUARE_OK) {
        logWarn("[CATALOG] Definition %s: %s", attribute.definitionId.c_str(),
                squareStatusName(status));
        return RESOLVE_DEFINITION_UNAVAILABLE;
    }

    for (const AllowedSelection& selection : definition.allowedSelections) {
        if (selection.uid == selectionUid && !selection.name.empty()) {
            slot = selection.name;
            logInfo("[CATALOG] %s -> slot %s", reference.c_str(), slot.c_str());
            return RESOLVE_OK;
        }
    }
    return RESOLVE_SELECTION_UNKNOWN;
}
