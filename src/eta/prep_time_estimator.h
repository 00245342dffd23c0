#ifndef KITCHEN_ETA_PREP_TIME_ESTIMATOR_H_
#define KITCHEN_ETA_PREP_TIME_ESTIMATOR_H_

#include <chrono>
#include <functional>
#include <vector>

#include "common/types.h"
#include "interfaces.h"
#include "load_counter_cache.h"
#include "load_policy.h"

namespace KitchenEta {

struct KitchenEtaConfig;

/**
 * Order-ready estimation.
 *
 * 1. Sum base prep time * quantity over all line items
 * 2. Scale by the location's current load multiplier
 * 3. Never promise less than the minimum ready time
 *
 * Reads the LoadCounterCache but never writes it.
 */
class PrepTimeEstimator {
	public:
		using NowFn = std::function<SystemTime()>;

		static constexpr std::chrono::seconds kDefaultMinimumReadyTime{600};

		PrepTimeEstimator(const OfferingCatalog& catalog, LoadCounterCache& cache,
				LoadPolicy policy = LoadPolicy(),
				std::chrono::seconds minimum_ready_time = kDefaultMinimumReadyTime,
				NowFn now = []() { return std::chrono::system_clock::now(); });

		static PrepTimeEstimator FromConfig(const OfferingCatalog& catalog, LoadCounterCache& cache,
				const KitchenEtaConfig& config);

		/**
		 * Estimate when an order with these line items would be ready
		 *
		 * @param location Location the order is placed at
		 * @param items Offerings and quantities
		 * @return ready time, the scaled prep duration and the load it was based on
		 * @throws ValidationError if ValidateOfferings(items, location) fails, or the
		 *         prep time would overflow or push ready_at past SystemTime::max()
		 */
		ReadyEstimate Estimate(LocationId location, const std::vector<LineItem>& items);

		// Current load at location, independent of any order
		LoadInfo GetLoadInfo(LocationId location);

		/**
		 * True only if items is non-empty, every quantity is positive and every
		 * offering exists, belongs to location and is available.
		 */
		bool ValidateOfferings(const std::vector<LineItem>& items, LocationId location) const;

		const LoadPolicy& policy() const { return policy_; }
		std::chrono::seconds minimum_ready_time() const { return minimum_ready_time_; }

	private:
		LoadInfo MakeLoadInfo(int64_t active_orders) const;

		const OfferingCatalog& catalog_;
		LoadCounterCache& cache_;
		LoadPolicy policy_;
		std::chrono::seconds minimum_ready_time_;
		NowFn now_;
};

} // namespace KitchenEta

#endif // KITCHEN_ETA_PREP_TIME_ESTIMATOR_H_
