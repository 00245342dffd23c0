#ifndef KITCHEN_ETA_COUNTER_STORE_H_
#define KITCHEN_ETA_COUNTER_STORE_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/types.h"

namespace KitchenEta {

struct DecrementResult {
	int64_t value;
	// The decrement would have gone below zero; the stored value is 0.
	bool clamped;
};

/**
 * Keyed integer store shared by every worker computing estimates.
 *
 * Every entry carries an absolute expiry; an expired entry behaves as absent.
 * Each method is a single atomic operation against the store. Implementations
 * throw StoreUnavailableError when the store cannot be reached.
 */
class CounterStore {
	public:
		virtual ~CounterStore() = default;

		virtual std::optional<int64_t> Get(const std::string& key) = 0;

		// Like Get, but a hit also pushes the expiry out to now + ttl
		virtual std::optional<int64_t> GetAndExpire(const std::string& key,
				std::chrono::seconds ttl) = 0;

		virtual void SetWithExpiry(const std::string& key, int64_t value,
				std::chrono::seconds ttl) = 0;

		// Returns true iff the key was absent and now holds value
		virtual bool SetIfAbsent(const std::string& key, int64_t value,
				std::chrono::seconds ttl) = 0;

		virtual bool Delete(const std::string& key) = 0;

		// Missing key counts as 0
		virtual int64_t IncrementWithExpiry(const std::string& key,
				std::chrono::seconds ttl) = 0;

		// Missing key counts as 0; never stores a negative value
		virtual DecrementResult DecrementClampedWithExpiry(const std::string& key,
				std::chrono::seconds ttl) = 0;

		// Live entries whose key starts with prefix
		virtual std::vector<std::pair<std::string, int64_t>> ScanPrefix(
				const std::string& prefix) = 0;
};

} // namespace KitchenEta

#endif // KITCHEN_ETA_COUNTER_STORE_H_
