#ifndef KITCHEN_ETA_COUNTER_STORE_SERVICE_H_
#define KITCHEN_ETA_COUNTER_STORE_SERVICE_H_

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <glog/logging.h>
#include "absl/synchronization/mutex.h"
#include <grpcpp/grpcpp.h>
#include <counter_store.grpc.pb.h>

#include "in_memory_counter_store.h"

namespace KitchenEta {

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;

namespace rpc = kitchen_eta::counter_store;

/**
 * gRPC front of an InMemoryCounterStore so that every worker process shares
 * one set of counters. Each RPC maps to exactly one atomic store operation.
 */
class CounterStoreServiceImpl final : public rpc::CounterStore::Service {
	public:
		explicit CounterStoreServiceImpl(InMemoryCounterStore& store) : store_(store) {}

		Status Get(ServerContext* context, const rpc::GetRequest* request,
				rpc::GetResponse* reply) override;
		Status SetWithExpiry(ServerContext* context, const rpc::SetRequest* request,
				rpc::SetResponse* reply) override;
		Status SetIfAbsent(ServerContext* context, const rpc::SetRequest* request,
				rpc::SetResponse* reply) override;
		Status Delete(ServerContext* context, const rpc::KeyRequest* request,
				rpc::DeleteResponse* reply) override;
		Status Increment(ServerContext* context, const rpc::CounterRequest* request,
				rpc::CounterResponse* reply) override;
		Status DecrementClamped(ServerContext* context, const rpc::CounterRequest* request,
				rpc::CounterResponse* reply) override;
		Status Scan(ServerContext* context, const rpc::ScanRequest* request,
				rpc::ScanResponse* reply) override;

	private:
		InMemoryCounterStore& store_;
};

/**
 * Owns the store, the gRPC server and the thread that evicts expired entries.
 */
class CounterStoreServer {
	public:
		/**
		 * @param listen_address host:port to bind
		 * @param eviction_interval how often expired entries are swept
		 */
		CounterStoreServer(const std::string& listen_address,
				std::chrono::seconds eviction_interval);
		~CounterStoreServer();

		CounterStoreServer(const CounterStoreServer&) = delete;
		CounterStoreServer& operator=(const CounterStoreServer&) = delete;

		// False when the listening port could not be bound
		bool IsRunning() const { return server_ != nullptr; }

		// Port actually bound; differs from the requested one when it was 0
		int SelectedPort() const { return selected_port_; }

		InMemoryCounterStore& store() { return store_; }

		void Shutdown();

	private:
		void EvictionLoop();

		InMemoryCounterStore store_;
		CounterStoreServiceImpl service_;
		std::unique_ptr<Server> server_;
		int selected_port_ = 0;
		std::chrono::seconds eviction_interval_;

		absl::Mutex mutex_;
		absl::CondVar shutdown_cv_;
		bool shutdown_ ABSL_GUARDED_BY(mutex_) = false;
		std::thread eviction_thread_;
};

} // namespace KitchenEta

#endif // KITCHEN_ETA_COUNTER_STORE_SERVICE_H_
