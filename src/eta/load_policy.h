#ifndef KITCHEN_ETA_LOAD_POLICY_H_
#define KITCHEN_ETA_LOAD_POLICY_H_

#include <cstdint>

namespace KitchenEta {

struct KitchenEtaConfig;

/**
 * Kitchen load scaling.
 *
 * multiplier(n) = min(1.0 + floor(n / threshold) * (step - 1.0), max)
 *
 * With the defaults: 0-4 active orders 1.0x, 5-9 1.2x, 10-14 1.4x, ...,
 * capped at 3.0x.
 */
struct LoadPolicy {
	static constexpr int64_t kDefaultThreshold = 5;
	static constexpr double kDefaultStep = 1.2;
	static constexpr double kDefaultMaxMultiplier = 3.0;
	static constexpr double kDefaultHighLoadMultiplier = 2.0;

	// Values below 1 behave as 1
	int64_t threshold = kDefaultThreshold;
	double step = kDefaultStep;
	double max_multiplier = kDefaultMaxMultiplier;
	// Strictly above this multiplier a location is under high load
	double high_load_multiplier = kDefaultHighLoadMultiplier;

	static LoadPolicy FromConfig(const KitchenEtaConfig& config);

	double Multiplier(int64_t active_orders) const;
	bool IsHighLoad(double multiplier) const;
};

// Rounded to 2 decimals for reporting
double RoundMultiplier(double multiplier);

} // namespace KitchenEta

#endif // KITCHEN_ETA_LOAD_POLICY_H_
