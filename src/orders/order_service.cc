#include "order_service.h"

#include <glog/logging.h>

namespace KitchenEta {

void OrderService::RequireLocation(LocationId location) const {
	if (!book_.FindLocation(location).has_value()) {
		throw ValidationError("Unknown location " + std::to_string(location));
	}
}

void OrderService::Publish(OrderEventKind kind, OrderId id, const StatusChange& change) {
	events_.Publish(OrderTransitionEvent{kind, id, change.location_id, change.old_status, change.new_status});
}

CreatedOrder OrderService::CreateOrder(LocationId location, OrderSource source,
		const std::vector<LineItem>& items) {
	RequireLocation(location);
	ReadyEstimate estimate = estimator_.Estimate(location, items);

	Order order{0, location, source, OrderStatus::RECEIVED, estimate.ready_at, items, false};
	OrderId id = book_.InsertOrder(order);
	order.id = id;
	VLOG(1) << "Order " << id << " created at location " << location << " via " << ToString(source)
		<< ", ready in " << estimate.prep_duration.count() << "ms";

	Publish(OrderEventKind::CREATED, id, StatusChange{location, std::nullopt, OrderStatus::RECEIVED});
	return CreatedOrder{order, estimator_.GetLoadInfo(location)};
}

std::optional<Order> OrderService::UpdateStatus(OrderId id, OrderStatus status) {
	std::optional<StatusChange> change = book_.UpdateStatus(id, status);
	if (!change.has_value()) {
		VLOG(1) << "Status update for unknown order " << id;
		return std::nullopt;
	}
	if (change->old_status != change->new_status) {
		Publish(OrderEventKind::STATUS_UPDATED, id, *change);
	}
	return book_.GetOrder(id);
}

bool OrderService::DeleteOrder(OrderId id) {
	std::optional<StatusChange> change = book_.SoftDelete(id);
	if (!change.has_value()) {
		return false;
	}
	Publish(OrderEventKind::DELETED, id, *change);
	return true;
}

bool OrderService::RestoreOrder(OrderId id) {
	std::optional<StatusChange> change = book_.Restore(id);
	if (!change.has_value()) {
		return false;
	}
	Publish(OrderEventKind::RESTORED, id, *change);
	return true;
}

ReadyEstimate OrderService::EstimateReadyAt(LocationId location, const std::vector<LineItem>& items) {
	RequireLocation(location);
	return estimator_.Estimate(location, items);
}

ReadyEstimate OrderService::EstimateForMenuItems(LocationId location,
		const std::vector<MenuItemLine>& items) {
	RequireLocation(location);
	std::vector<LineItem> resolved;
	resolved.reserve(items.size());
	for (const auto& item : items) {
		std::optional<Offering> offering = book_.FindOfferingForMenuItem(location, item.menu_item_id);
		if (!offering.has_value()) {
			throw ValidationError("Menu item " + std::to_string(item.menu_item_id) +
					" is not offered at location " + std::to_string(location));
		}
		resolved.push_back(LineItem{offering->id, item.quantity});
	}
	return estimator_.Estimate(location, resolved);
}

} // namespace KitchenEta
