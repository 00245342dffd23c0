#include "lifecycle_bridge.h"

#include <glog/logging.h>

namespace KitchenEta {

namespace {

const char* StatusName(const std::optional<OrderStatus>& status) {
	return status.has_value() ? ToString(*status) : "none";
}

} // namespace

void LifecycleBridge::Attach(OrderEventBus& bus) {
	bus.Subscribe([this](const OrderTransitionEvent& event) {
			OnTransition(event);
			});
}

void LifecycleBridge::OnTransition(const OrderTransitionEvent& event) {
	bool was_active = IsActive(event.old_status);
	bool is_active = IsActive(event.new_status);

	if (!was_active && is_active) {
		int64_t count = cache_.Increment(event.location_id);
		LOG(INFO) << "Order " << event.order_id << " became active ("
			<< StatusName(event.old_status) << " -> " << StatusName(event.new_status) << ", "
			<< ToString(event.kind) << "), location " << event.location_id << " now at " << count;
	} else if (was_active && !is_active) {
		int64_t count = cache_.Decrement(event.location_id);
		LOG(INFO) << "Order " << event.order_id << " became inactive ("
			<< StatusName(event.old_status) << " -> " << StatusName(event.new_status) << ", "
			<< ToString(event.kind) << "), location " << event.location_id << " now at " << count;
	} else {
		VLOG(2) << "Order " << event.order_id << " " << ToString(event.kind)
			<< " without active-set change";
	}
}

} // namespace KitchenEta
