#ifndef KITCHEN_ETA_LIFECYCLE_BRIDGE_H_
#define KITCHEN_ETA_LIFECYCLE_BRIDGE_H_

#include "load_counter_cache.h"
#include "order_events.h"

namespace KitchenEta {

/**
 * Keeps the load counters in step with order transitions.
 *
 * Entering the active set increments the location's counter, leaving it
 * decrements; any other transition leaves the cache alone. This is the only
 * component that moves the counters.
 */
class LifecycleBridge {
	public:
		explicit LifecycleBridge(LoadCounterCache& cache) : cache_(cache) {}

		// Route every event published on bus to OnTransition
		void Attach(OrderEventBus& bus);

		void OnTransition(const OrderTransitionEvent& event);

	private:
		LoadCounterCache& cache_;
};

} // namespace KitchenEta

#endif // KITCHEN_ETA_LIFECYCLE_BRIDGE_H_
