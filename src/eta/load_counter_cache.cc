#include "load_counter_cache.h"

#include <glog/logging.h>

#include "common/configuration.h"
#include "common/scoped_cleanup.h"

namespace KitchenEta {

namespace {
constexpr char kLockSuffix[] = ":lock";
}

LoadCacheOptions LoadCacheOptions::FromConfig(const KitchenEtaConfig& config) {
	LoadCacheOptions options;
	options.key_prefix = config.cache.key_prefix.get();
	options.ttl = std::chrono::seconds(config.cache.ttl_seconds.get());
	options.lock_ttl = std::chrono::seconds(config.cache.lock_ttl_seconds.get());
	return options;
}

LoadCounterCache::LoadCounterCache(CounterStore& store, ActiveOrderSource& source,
		LoadCacheOptions options)
	: store_(store), source_(source), options_(std::move(options)) {}

std::string LoadCounterCache::CountKey(LocationId location) const {
	return options_.key_prefix + std::to_string(location);
}

std::string LoadCounterCache::LockKey(LocationId location) const {
	return CountKey(location) + kLockSuffix;
}

std::optional<int64_t> LoadCounterCache::CountFromSource(LocationId location) {
	try {
		return source_.CountActive(location);
	} catch (const StoreUnavailableError& e) {
		LOG(ERROR) << "Order store unavailable while counting active orders for location "
			<< location << ": " << e.what();
		return std::nullopt;
	}
}

int64_t LoadCounterCache::Get(LocationId location) {
	const std::string key = CountKey(location);

	try {
		std::optional<int64_t> cached = store_.GetAndExpire(key, options_.ttl);
		if (cached.has_value()) {
			VLOG(2) << "Cache hit for location " << location << ": " << *cached << " active orders";
			return *cached;
		}

		// Single-flight: only the lock holder recomputes and writes the entry
		const std::string lock_key = LockKey(location);
		if (!store_.SetIfAbsent(lock_key, 1, options_.lock_ttl)) {
			VLOG(2) << "Could not acquire cache lock for location " << location
				<< ", falling back to order store";
			return CountFromSource(location).value_or(0);
		}

		ScopedCleanup release([this, &lock_key]() { ReleaseLock(lock_key); });
		return PopulateLocked(location, key);
	} catch (const StoreUnavailableError& e) {
		LOG(WARNING) << "Counter store unavailable, falling back to order store for location "
			<< location << ": " << e.what();
		return CountFromSource(location).value_or(0);
	}
}

int64_t LoadCounterCache::PopulateLocked(LocationId location, const std::string& key) {
	// Another caller may have populated the entry before we took the lock
	std::optional<int64_t> cached = store_.Get(key);
	if (cached.has_value()) {
		VLOG(2) << "Cache hit after lock for location " << location << ": " << *cached << " active orders";
		return *cached;
	}

	std::optional<int64_t> actual = CountFromSource(location);
	if (!actual.has_value()) {
		return 0;
	}
	try {
		store_.SetWithExpiry(key, *actual, options_.ttl);
	} catch (const StoreUnavailableError& e) {
		LOG(WARNING) << "Failed to cache order store result for location " << location << ": " << e.what();
		return *actual;
	}
	LOG(INFO) << "Cache miss for location " << location << ", cached order store result: "
		<< *actual << " active orders";
	return *actual;
}

void LoadCounterCache::ReleaseLock(const std::string& lock_key) {
	try {
		store_.Delete(lock_key);
	} catch (const StoreUnavailableError& e) {
		// The lock expires on its own
		LOG(WARNING) << "Failed to release " << lock_key << ": " << e.what();
	}
}

void LoadCounterCache::Set(LocationId location, int64_t count) {
	if (count < 0) {
		count = 0;
	}
	try {
		store_.SetWithExpiry(CountKey(location), count, options_.ttl);
		VLOG(2) << "Set cache for location " << location << ": " << count << " active orders";
	} catch (const StoreUnavailableError& e) {
		LOG(WARNING) << "Failed to set cache for location " << location << ": " << e.what();
	}
}

int64_t LoadCounterCache::Increment(LocationId location) {
	try {
		int64_t count = store_.IncrementWithExpiry(CountKey(location), options_.ttl);
		VLOG(2) << "Incremented active orders for location " << location << " to " << count;
		return count;
	} catch (const StoreUnavailableError& e) {
		LOG(WARNING) << "Failed to increment cache for location " << location << ": " << e.what();
		return Resync(location).value_or(0);
	}
}

int64_t LoadCounterCache::Decrement(LocationId location) {
	DecrementResult result;
	try {
		result = store_.DecrementClampedWithExpiry(CountKey(location), options_.ttl);
	} catch (const StoreUnavailableError& e) {
		LOG(WARNING) << "Failed to decrement cache for location " << location << ": " << e.what();
		return Resync(location).value_or(0);
	}

	if (result.clamped) {
		LOG(WARNING) << "Active order count for location " << location
			<< " would have gone negative, resyncing from order store";
		return Resync(location).value_or(0);
	}
	VLOG(2) << "Decremented active orders for location " << location << " to " << result.value;
	return result.value;
}

void LoadCounterCache::Invalidate(LocationId location) {
	try {
		store_.Delete(CountKey(location));
		VLOG(2) << "Cleared cache for location " << location;
	} catch (const StoreUnavailableError& e) {
		LOG(WARNING) << "Failed to clear cache for location " << location << ": " << e.what();
	}
}

std::optional<int64_t> LoadCounterCache::Resync(LocationId location) {
	std::optional<int64_t> actual = CountFromSource(location);
	if (!actual.has_value()) {
		LOG(ERROR) << "Failed to resync cache for location " << location;
		return std::nullopt;
	}
	Set(location, *actual);
	LOG(INFO) << "Synced cache from order store for location " << location << ": "
		<< *actual << " active orders";
	return actual;
}

LoadCacheStats LoadCounterCache::GetStats() {
	LoadCacheStats stats;
	try {
		for (const auto& [key, value] : store_.ScanPrefix(options_.key_prefix)) {
			if (key.size() >= sizeof(kLockSuffix) - 1 &&
					key.compare(key.size() - (sizeof(kLockSuffix) - 1), std::string::npos, kLockSuffix) == 0) {
				continue;
			}
			++stats.cached_locations;
			stats.total_cached_orders += value;
		}
	} catch (const StoreUnavailableError& e) {
		LOG(WARNING) << "Counter store unavailable while collecting stats: " << e.what();
		return LoadCacheStats{0, 0, false};
	}
	return stats;
}

} // namespace KitchenEta
