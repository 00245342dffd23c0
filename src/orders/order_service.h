#ifndef KITCHEN_ETA_ORDER_SERVICE_H_
#define KITCHEN_ETA_ORDER_SERVICE_H_

#include <optional>
#include <vector>

#include "common/types.h"
#include "eta/order_events.h"
#include "eta/prep_time_estimator.h"
#include "order_book.h"

namespace KitchenEta {

struct CreatedOrder {
	Order order;
	LoadInfo load_info;
};

/**
 * Order write and read paths on top of the estimator.
 *
 * Every committed change to an order is published on the event bus after
 * the order book has applied it.
 */
class OrderService {
	public:
		OrderService(OrderBook& book, PrepTimeEstimator& estimator, OrderEventBus& events)
			: book_(book), estimator_(estimator), events_(events) {}

		/**
		 * Validate, estimate and persist a new order in status received.
		 * The estimated ready time is fixed here and never recomputed.
		 *
		 * @throws ValidationError for an unknown location or invalid line items
		 */
		CreatedOrder CreateOrder(LocationId location, OrderSource source,
				const std::vector<LineItem>& items);

		// nullopt if the order is unknown or deleted
		std::optional<Order> UpdateStatus(OrderId id, OrderStatus status);

		bool DeleteOrder(OrderId id);
		bool RestoreOrder(OrderId id);

		std::optional<Order> GetOrder(OrderId id) const { return book_.GetOrder(id); }

		// Estimate without placing an order
		ReadyEstimate EstimateReadyAt(LocationId location, const std::vector<LineItem>& items);

		/**
		 * Estimate for menu items, each resolved to its offering at location
		 *
		 * @throws ValidationError if a menu item is not offered there
		 */
		ReadyEstimate EstimateForMenuItems(LocationId location, const std::vector<MenuItemLine>& items);

		LoadInfo GetLoadInfo(LocationId location) { return estimator_.GetLoadInfo(location); }

		std::vector<Offering> ListAvailableOfferings(LocationId location) const {
			return book_.ListAvailableOfferings(location);
		}

		std::vector<Location> ListLocations(CompanyId company) const {
			return book_.ListLocations(company);
		}

		std::vector<MenuItem> ListMenuItems(CompanyId company) const {
			return book_.ListMenuItems(company);
		}

	private:
		void RequireLocation(LocationId location) const;
		void Publish(OrderEventKind kind, OrderId id, const StatusChange& change);

		OrderBook& book_;
		PrepTimeEstimator& estimator_;
		OrderEventBus& events_;
};

} // namespace KitchenEta

#endif // KITCHEN_ETA_ORDER_SERVICE_H_
