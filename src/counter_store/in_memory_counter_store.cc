#include "in_memory_counter_store.h"

#include <glog/logging.h>

namespace KitchenEta {

InMemoryCounterStore::InMemoryCounterStore()
	: InMemoryCounterStore([]() { return std::chrono::steady_clock::now(); }) {}

InMemoryCounterStore::InMemoryCounterStore(Clock clock) : clock_(std::move(clock)) {}

InMemoryCounterStore::Entry* InMemoryCounterStore::FindLive(Shard& shard,
		const std::string& key, std::chrono::steady_clock::time_point now) {
	auto it = shard.data.find(key);
	if (it == shard.data.end()) {
		return nullptr;
	}
	if (it->second.expires_at <= now) {
		shard.data.erase(it);
		return nullptr;
	}
	return &it->second;
}

std::optional<int64_t> InMemoryCounterStore::Get(const std::string& key) {
	Shard& shard = shards_[GetShardIndex(key)];
	absl::MutexLock lock(&shard.mutex);
	Entry* entry = FindLive(shard, key, clock_());
	if (entry == nullptr) {
		return std::nullopt;
	}
	return entry->value;
}

std::optional<int64_t> InMemoryCounterStore::GetAndExpire(const std::string& key,
		std::chrono::seconds ttl) {
	Shard& shard = shards_[GetShardIndex(key)];
	absl::MutexLock lock(&shard.mutex);
	auto now = clock_();
	Entry* entry = FindLive(shard, key, now);
	if (entry == nullptr) {
		return std::nullopt;
	}
	entry->expires_at = now + ttl;
	return entry->value;
}

void InMemoryCounterStore::SetWithExpiry(const std::string& key, int64_t value,
		std::chrono::seconds ttl) {
	Shard& shard = shards_[GetShardIndex(key)];
	absl::MutexLock lock(&shard.mutex);
	shard.data[key] = Entry{value, clock_() + ttl};
}

bool InMemoryCounterStore::SetIfAbsent(const std::string& key, int64_t value,
		std::chrono::seconds ttl) {
	Shard& shard = shards_[GetShardIndex(key)];
	absl::MutexLock lock(&shard.mutex);
	auto now = clock_();
	if (FindLive(shard, key, now) != nullptr) {
		return false;
	}
	shard.data[key] = Entry{value, now + ttl};
	return true;
}

bool InMemoryCounterStore::Delete(const std::string& key) {
	Shard& shard = shards_[GetShardIndex(key)];
	absl::MutexLock lock(&shard.mutex);
	bool live = FindLive(shard, key, clock_()) != nullptr;
	shard.data.erase(key);
	return live;
}

int64_t InMemoryCounterStore::IncrementWithExpiry(const std::string& key,
		std::chrono::seconds ttl) {
	Shard& shard = shards_[GetShardIndex(key)];
	absl::MutexLock lock(&shard.mutex);
	auto now = clock_();
	Entry* entry = FindLive(shard, key, now);
	if (entry == nullptr) {
		shard.data[key] = Entry{1, now + ttl};
		return 1;
	}
	entry->value += 1;
	entry->expires_at = now + ttl;
	return entry->value;
}

DecrementResult InMemoryCounterStore::DecrementClampedWithExpiry(const std::string& key,
		std::chrono::seconds ttl) {
	Shard& shard = shards_[GetShardIndex(key)];
	absl::MutexLock lock(&shard.mutex);
	auto now = clock_();
	Entry* entry = FindLive(shard, key, now);
	int64_t next = (entry == nullptr ? 0 : entry->value) - 1;
	bool clamped = false;
	if (next < 0) {
		next = 0;
		clamped = true;
	}
	shard.data[key] = Entry{next, now + ttl};
	return DecrementResult{next, clamped};
}

std::vector<std::pair<std::string, int64_t>> InMemoryCounterStore::ScanPrefix(
		const std::string& prefix) {
	std::vector<std::pair<std::string, int64_t>> result;
	auto now = clock_();
	for (auto& shard : shards_) {
		absl::MutexLock lock(&shard.mutex);
		for (const auto& [key, entry] : shard.data) {
			if (entry.expires_at > now && key.compare(0, prefix.size(), prefix) == 0) {
				result.emplace_back(key, entry.value);
			}
		}
	}
	return result;
}

size_t InMemoryCounterStore::EvictExpired() {
	size_t evicted = 0;
	auto now = clock_();
	for (auto& shard : shards_) {
		absl::MutexLock lock(&shard.mutex);
		for (auto it = shard.data.begin(); it != shard.data.end();) {
			if (it->second.expires_at <= now) {
				shard.data.erase(it++);
				++evicted;
			} else {
				++it;
			}
		}
	}
	VLOG(2) << "[InMemoryCounterStore] evicted " << evicted << " expired entries";
	return evicted;
}

size_t InMemoryCounterStore::Size() {
	size_t total = 0;
	auto now = clock_();
	for (auto& shard : shards_) {
		absl::MutexLock lock(&shard.mutex);
		for (const auto& [key, entry] : shard.data) {
			if (entry.expires_at > now) {
				++total;
			}
		}
	}
	return total;
}

} // namespace KitchenEta
