#ifndef KITCHEN_ETA_LOAD_COUNTER_CACHE_H_
#define KITCHEN_ETA_LOAD_COUNTER_CACHE_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "common/types.h"
#include "counter_store/counter_store.h"
#include "interfaces.h"

namespace KitchenEta {

struct KitchenEtaConfig;

struct LoadCacheOptions {
	std::string key_prefix = "location_load:";
	std::chrono::seconds ttl{3600};
	std::chrono::seconds lock_ttl{10};

	static LoadCacheOptions FromConfig(const KitchenEtaConfig& config);
};

struct LoadCacheStats {
	size_t cached_locations = 0;
	int64_t total_cached_orders = 0;
	bool healthy = true;
};

/**
 * Active-order count per location, kept in a shared CounterStore.
 *
 * Store failures never leave this class: reads fall back to the
 * ActiveOrderSource and writes fall back to Resync(). Every method returns
 * a best-effort count.
 */
class LoadCounterCache {
	public:
		LoadCounterCache(CounterStore& store, ActiveOrderSource& source,
				LoadCacheOptions options = LoadCacheOptions());

		/**
		 * Active orders at location
		 *
		 * A hit refreshes the entry's expiry. A miss is resolved by at most one
		 * caller at a time per location (the one holding the miss lock); callers
		 * that lose the lock read the ActiveOrderSource directly without caching.
		 */
		int64_t Get(LocationId location);

		// Overwrite the cached count; failures are logged and dropped
		void Set(LocationId location, int64_t count);

		/**
		 * Atomically add one and refresh the expiry
		 *
		 * @return the new count
		 */
		int64_t Increment(LocationId location);

		/**
		 * Atomically subtract one, clamped at zero, and refresh the expiry.
		 * A clamp means the cache had drifted from the order store, so the
		 * entry is resynced.
		 *
		 * @return the new count
		 */
		int64_t Decrement(LocationId location);

		// Drop the cached count so the next Get repopulates it
		void Invalidate(LocationId location);

		/**
		 * Recompute from the ActiveOrderSource and overwrite the entry
		 *
		 * @return the recomputed count, or nullopt if the source failed
		 */
		std::optional<int64_t> Resync(LocationId location);

		LoadCacheStats GetStats();

		std::string CountKey(LocationId location) const;
		std::string LockKey(LocationId location) const;

	private:
		// nullopt when the ActiveOrderSource is unavailable
		std::optional<int64_t> CountFromSource(LocationId location);

		// Miss path, entered holding the miss lock
		int64_t PopulateLocked(LocationId location, const std::string& key);

		void ReleaseLock(const std::string& lock_key);

		CounterStore& store_;
		ActiveOrderSource& source_;
		LoadCacheOptions options_;
};

} // namespace KitchenEta

#endif // KITCHEN_ETA_LOAD_COUNTER_CACHE_H_
