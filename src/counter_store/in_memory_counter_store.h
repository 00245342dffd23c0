#ifndef KITCHEN_ETA_IN_MEMORY_COUNTER_STORE_H_
#define KITCHEN_ETA_IN_MEMORY_COUNTER_STORE_H_

#include <array>
#include <chrono>
#include <functional>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "counter_store.h"

namespace KitchenEta {

/**
 * Sharded in-process CounterStore.
 *
 * A key maps to one shard; every operation holds that shard's lock for its
 * whole read-modify-write, which makes each method atomic with respect to
 * every other caller. Expired entries are dropped lazily on access or by
 * EvictExpired().
 */
class InMemoryCounterStore : public CounterStore {
	public:
		using Clock = std::function<std::chrono::steady_clock::time_point()>;

		InMemoryCounterStore();
		explicit InMemoryCounterStore(Clock clock);

		// Prevent copying and moving
		InMemoryCounterStore(const InMemoryCounterStore&) = delete;
		InMemoryCounterStore& operator=(const InMemoryCounterStore&) = delete;

		std::optional<int64_t> Get(const std::string& key) override;
		std::optional<int64_t> GetAndExpire(const std::string& key,
				std::chrono::seconds ttl) override;
		void SetWithExpiry(const std::string& key, int64_t value,
				std::chrono::seconds ttl) override;
		bool SetIfAbsent(const std::string& key, int64_t value,
				std::chrono::seconds ttl) override;
		bool Delete(const std::string& key) override;
		int64_t IncrementWithExpiry(const std::string& key,
				std::chrono::seconds ttl) override;
		DecrementResult DecrementClampedWithExpiry(const std::string& key,
				std::chrono::seconds ttl) override;
		std::vector<std::pair<std::string, int64_t>> ScanPrefix(
				const std::string& prefix) override;

		/**
		 * Remove every expired entry
		 *
		 * @return number of entries removed
		 */
		size_t EvictExpired();

		// Live entries across all shards
		size_t Size();

	private:
		// Number of shards - use power of 2 for efficient modulo with bit masking
		static constexpr size_t NUM_SHARDS = 64;

		struct Entry {
			int64_t value;
			std::chrono::steady_clock::time_point expires_at;
		};

		struct Shard {
			absl::Mutex mutex;
			absl::flat_hash_map<std::string, Entry> data ABSL_GUARDED_BY(mutex);
		};

		inline size_t GetShardIndex(const std::string& key) const {
			return std::hash<std::string>{}(key) & (NUM_SHARDS - 1);
		}

		// Returns the live entry for key, erasing it first if it has expired
		Entry* FindLive(Shard& shard, const std::string& key,
				std::chrono::steady_clock::time_point now);

		Clock clock_;
		std::array<Shard, NUM_SHARDS> shards_;
};

} // namespace KitchenEta

#endif // KITCHEN_ETA_IN_MEMORY_COUNTER_STORE_H_
