#include "load_policy.h"

#include <algorithm>
#include <cmath>

#include "common/configuration.h"

namespace KitchenEta {

LoadPolicy LoadPolicy::FromConfig(const KitchenEtaConfig& config) {
	LoadPolicy policy;
	policy.threshold = config.estimator.load_threshold.get();
	policy.step = config.estimator.load_step.get();
	policy.max_multiplier = config.estimator.max_multiplier.get();
	policy.high_load_multiplier = config.estimator.high_load_multiplier.get();
	return policy;
}

double LoadPolicy::Multiplier(int64_t active_orders) const {
	if (active_orders < 0) {
		active_orders = 0;
	}
	// A non-positive threshold steps on every order
	int64_t increments = active_orders / std::max<int64_t>(threshold, 1);
	double multiplier = 1.0 + static_cast<double>(increments) * (step - 1.0);
	return std::min(multiplier, max_multiplier);
}

bool LoadPolicy::IsHighLoad(double multiplier) const {
	return multiplier > high_load_multiplier;
}

double RoundMultiplier(double multiplier) {
	return std::round(multiplier * 100.0) / 100.0;
}

} // namespace KitchenEta
