#include "prep_time_estimator.h"

#include <algorithm>
#include <cmath>

#include <glog/logging.h>

#include "common/configuration.h"

namespace KitchenEta {

PrepTimeEstimator::PrepTimeEstimator(const OfferingCatalog& catalog, LoadCounterCache& cache,
		LoadPolicy policy, std::chrono::seconds minimum_ready_time, NowFn now)
	: catalog_(catalog),
	cache_(cache),
	policy_(policy),
	minimum_ready_time_(minimum_ready_time),
	now_(std::move(now)) {}

PrepTimeEstimator PrepTimeEstimator::FromConfig(const OfferingCatalog& catalog,
		LoadCounterCache& cache, const KitchenEtaConfig& config) {
	return PrepTimeEstimator(catalog, cache, LoadPolicy::FromConfig(config),
			std::chrono::seconds(config.estimator.minimum_ready_seconds.get()));
}

bool PrepTimeEstimator::ValidateOfferings(const std::vector<LineItem>& items,
		LocationId location) const {
	if (items.empty()) {
		return false;
	}
	for (const auto& item : items) {
		if (item.quantity <= 0) {
			return false;
		}
		std::optional<Offering> offering = catalog_.FindOffering(item.offering_id);
		if (!offering.has_value() || offering->location_id != location || !offering->available) {
			return false;
		}
	}
	return true;
}

ReadyEstimate PrepTimeEstimator::Estimate(LocationId location, const std::vector<LineItem>& items) {
	if (!ValidateOfferings(items, location)) {
		throw ValidationError("One or more products are not available at location " +
				std::to_string(location));
	}

	int64_t base_total_seconds = 0;
	for (const auto& item : items) {
		// Validated above
		Offering offering = *catalog_.FindOffering(item.offering_id);
		int64_t line_seconds = 0;
		if (__builtin_mul_overflow(offering.base_prep_seconds, item.quantity, &line_seconds) ||
				__builtin_add_overflow(base_total_seconds, line_seconds, &base_total_seconds)) {
			throw ValidationError("Prep time of order at location " + std::to_string(location) +
					" is out of range");
		}
	}

	int64_t active_orders = cache_.Get(location);
	double multiplier = policy_.Multiplier(active_orders);

	// ready_at must stay representable as a SystemTime
	SystemTime now = now_();
	auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(SystemTime::max() - now);
	double scaled_ms = static_cast<double>(base_total_seconds) * multiplier * 1000.0;
	if (!std::isfinite(scaled_ms) || scaled_ms >= static_cast<double>(headroom.count())) {
		throw ValidationError("Prep time of order at location " + std::to_string(location) +
				" is out of range");
	}
	auto adjusted = std::chrono::milliseconds(std::llround(scaled_ms));
	auto prep_duration = std::max<std::chrono::milliseconds>(adjusted, minimum_ready_time_);
	if (prep_duration > headroom) {
		throw ValidationError("Prep time of order at location " + std::to_string(location) +
				" is out of range");
	}

	VLOG(2) << "Estimate for location " << location << ": base " << base_total_seconds
		<< "s x" << multiplier << " (" << active_orders << " active) -> "
		<< prep_duration.count() << "ms";

	return ReadyEstimate{now + prep_duration, prep_duration, MakeLoadInfo(active_orders)};
}

LoadInfo PrepTimeEstimator::GetLoadInfo(LocationId location) {
	return MakeLoadInfo(cache_.Get(location));
}

LoadInfo PrepTimeEstimator::MakeLoadInfo(int64_t active_orders) const {
	double multiplier = policy_.Multiplier(active_orders);
	return LoadInfo{active_orders, RoundMultiplier(multiplier), policy_.IsHighLoad(multiplier)};
}

} // namespace KitchenEta
