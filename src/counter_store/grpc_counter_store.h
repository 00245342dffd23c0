#ifndef KITCHEN_ETA_GRPC_COUNTER_STORE_H_
#define KITCHEN_ETA_GRPC_COUNTER_STORE_H_

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <counter_store.grpc.pb.h>

#include "counter_store.h"

namespace KitchenEta {

/**
 * CounterStore client for a remote CounterStoreServer.
 *
 * Every call carries a deadline of rpc_timeout. A failed or timed out call
 * raises StoreUnavailableError and is not retried here; the caller owns the
 * fallback.
 */
class GrpcCounterStore : public CounterStore {
	public:
		GrpcCounterStore(std::shared_ptr<grpc::Channel> channel,
				std::chrono::milliseconds rpc_timeout);

		// Connects with insecure credentials to host:port
		GrpcCounterStore(const std::string& address, std::chrono::milliseconds rpc_timeout);

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

	private:
		std::optional<int64_t> GetInternal(const std::string& key, int64_t refresh_ttl_seconds);
		void PrepareContext(grpc::ClientContext& context) const;
		void CheckStatus(const grpc::Status& status, const char* op, const std::string& key) const;

		std::unique_ptr<kitchen_eta::counter_store::CounterStore::Stub> stub_;
		std::chrono::milliseconds rpc_timeout_;
};

} // namespace KitchenEta

#endif // KITCHEN_ETA_GRPC_COUNTER_STORE_H_
