#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "common/types.h"

namespace KitchenEta {

enum class OrderEventKind {
	CREATED,
	STATUS_UPDATED,
	DELETED,
	RESTORED
};

const char* ToString(OrderEventKind kind);

/**
 * One order lifecycle transition. old_status is empty for a created or
 * restored order, new_status is empty for a deleted one.
 */
struct OrderTransitionEvent {
	OrderEventKind kind;
	OrderId order_id;
	LocationId location_id;
	std::optional<OrderStatus> old_status;
	std::optional<OrderStatus> new_status;
};

/**
 * Publish-subscribe of order transitions.
 *
 * Handlers run synchronously on the publishing thread, in subscription order.
 * Publish does not hold the bus lock while handlers run, so a handler may
 * publish or subscribe.
 */
class OrderEventBus {
public:
	using Handler = std::function<void(const OrderTransitionEvent&)>;

	OrderEventBus() = default;
	OrderEventBus(const OrderEventBus&) = delete;
	OrderEventBus& operator=(const OrderEventBus&) = delete;

	void Subscribe(Handler handler) {
		absl::MutexLock lock(&mutex_);
		handlers_.push_back(std::move(handler));
	}

	void Publish(const OrderTransitionEvent& event) {
		std::vector<Handler> handlers;
		{
			absl::MutexLock lock(&mutex_);
			handlers = handlers_;
		}
		for (const auto& handler : handlers) {
			handler(event);
		}
	}

	size_t NumSubscribers() const {
		absl::MutexLock lock(&mutex_);
		return handlers_.size();
	}

private:
	mutable absl::Mutex mutex_;
	std::vector<Handler> handlers_ ABSL_GUARDED_BY(mutex_);
};

} // namespace KitchenEta
