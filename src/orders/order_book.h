#ifndef KITCHEN_ETA_ORDER_BOOK_H_
#define KITCHEN_ETA_ORDER_BOOK_H_

#include <optional>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "common/types.h"
#include "eta/interfaces.h"

namespace KitchenEta {

// Status before and after one change to an order
struct StatusChange {
	LocationId location_id;
	std::optional<OrderStatus> old_status;
	std::optional<OrderStatus> new_status;
};

/**
 * In-memory durable store of locations, menu items, offerings and orders.
 *
 * It is the ground truth behind the load counters: CountActive scans the
 * orders themselves. Every mutation of an order returns the exact status
 * pair it applied, read and written under one lock.
 */
class OrderBook : public ActiveOrderSource, public OfferingCatalog {
	public:
		OrderBook() = default;
		OrderBook(const OrderBook&) = delete;
		OrderBook& operator=(const OrderBook&) = delete;

		// Catalog
		LocationId AddLocation(CompanyId company, const std::string& name);
		MenuItemId AddMenuItem(CompanyId company, const std::string& name, int64_t base_prep_seconds);

		/**
		 * Make a menu item orderable at a location
		 *
		 * @return offering id, or nullopt if the location or menu item is
		 *         unknown, they belong to different companies, or the menu
		 *         item is already offered there
		 */
		std::optional<OfferingId> AddOffering(LocationId location, MenuItemId menu_item, bool available = true);
		bool SetOfferingAvailable(OfferingId offering, bool available);

		std::optional<Location> FindLocation(LocationId id) const;
		// A company's locations and menu items, sorted by id
		std::vector<Location> ListLocations(CompanyId company) const;
		std::vector<MenuItem> ListMenuItems(CompanyId company) const;
		std::vector<Offering> ListAvailableOfferings(LocationId location) const;

		// OfferingCatalog
		std::optional<Offering> FindOffering(OfferingId id) const override;
		std::optional<Offering> FindOfferingForMenuItem(LocationId location,
				MenuItemId menu_item) const override;

		// ActiveOrderSource
		int64_t CountActive(LocationId location) override;

		// Orders
		OrderId InsertOrder(Order order);
		std::optional<Order> GetOrder(OrderId id) const;

		// nullopt if the order is unknown or deleted
		std::optional<StatusChange> UpdateStatus(OrderId id, OrderStatus status);
		// nullopt if the order is unknown or already deleted
		std::optional<StatusChange> SoftDelete(OrderId id);
		// nullopt if the order is unknown or not deleted
		std::optional<StatusChange> Restore(OrderId id);

	private:
		mutable absl::Mutex mutex_;
		absl::flat_hash_map<LocationId, Location> locations_ ABSL_GUARDED_BY(mutex_);
		absl::flat_hash_map<MenuItemId, MenuItem> menu_items_ ABSL_GUARDED_BY(mutex_);
		absl::flat_hash_map<OfferingId, Offering> offerings_ ABSL_GUARDED_BY(mutex_);
		absl::flat_hash_map<OrderId, Order> orders_ ABSL_GUARDED_BY(mutex_);
		int64_t next_id_ ABSL_GUARDED_BY(mutex_) = 1;
};

} // namespace KitchenEta

#endif // KITCHEN_ETA_ORDER_BOOK_H_
