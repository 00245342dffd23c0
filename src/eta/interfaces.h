#pragma once

#include <optional>

#include "common/types.h"

namespace KitchenEta {

/**
 * Slow but always correct count of active orders, backed by the durable
 * order store. Throws StoreUnavailableError when that store is unreachable.
 */
class ActiveOrderSource {
public:
    virtual ~ActiveOrderSource() = default;

    virtual int64_t CountActive(LocationId location) = 0;
};

/**
 * Offering lookup used to price and validate line items
 */
class OfferingCatalog {
public:
    virtual ~OfferingCatalog() = default;

    virtual std::optional<Offering> FindOffering(OfferingId id) const = 0;
    virtual std::optional<Offering> FindOfferingForMenuItem(LocationId location,
                                                            MenuItemId menu_item) const = 0;
};

} // namespace KitchenEta
