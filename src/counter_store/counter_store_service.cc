#include "counter_store_service.h"

namespace KitchenEta {

namespace {

Status CheckKey(const std::string& key) {
	if (key.empty()) {
		return Status(grpc::StatusCode::INVALID_ARGUMENT, "key must not be empty");
	}
	return Status::OK;
}

Status CheckTtl(int64_t ttl_seconds) {
	if (ttl_seconds <= 0) {
		return Status(grpc::StatusCode::INVALID_ARGUMENT, "ttl_seconds must be positive");
	}
	return Status::OK;
}

} // namespace

Status CounterStoreServiceImpl::Get(ServerContext* context, const rpc::GetRequest* request,
		rpc::GetResponse* reply) {
	Status status = CheckKey(request->key());
	if (!status.ok()) return status;
	if (request->refresh_ttl_seconds() < 0) {
		return Status(grpc::StatusCode::INVALID_ARGUMENT, "refresh_ttl_seconds cannot be negative");
	}

	std::optional<int64_t> value;
	if (request->refresh_ttl_seconds() > 0) {
		value = store_.GetAndExpire(request->key(), std::chrono::seconds(request->refresh_ttl_seconds()));
	} else {
		value = store_.Get(request->key());
	}
	reply->set_found(value.has_value());
	reply->set_value(value.value_or(0));
	return Status::OK;
}

Status CounterStoreServiceImpl::SetWithExpiry(ServerContext* context, const rpc::SetRequest* request,
		rpc::SetResponse* reply) {
	Status status = CheckKey(request->key());
	if (!status.ok()) return status;
	status = CheckTtl(request->ttl_seconds());
	if (!status.ok()) return status;

	store_.SetWithExpiry(request->key(), request->value(), std::chrono::seconds(request->ttl_seconds()));
	reply->set_applied(true);
	return Status::OK;
}

Status CounterStoreServiceImpl::SetIfAbsent(ServerContext* context, const rpc::SetRequest* request,
		rpc::SetResponse* reply) {
	Status status = CheckKey(request->key());
	if (!status.ok()) return status;
	status = CheckTtl(request->ttl_seconds());
	if (!status.ok()) return status;

	reply->set_applied(store_.SetIfAbsent(request->key(), request->value(),
				std::chrono::seconds(request->ttl_seconds())));
	return Status::OK;
}

Status CounterStoreServiceImpl::Delete(ServerContext* context, const rpc::KeyRequest* request,
		rpc::DeleteResponse* reply) {
	Status status = CheckKey(request->key());
	if (!status.ok()) return status;

	reply->set_deleted(store_.Delete(request->key()));
	return Status::OK;
}

Status CounterStoreServiceImpl::Increment(ServerContext* context, const rpc::CounterRequest* request,
		rpc::CounterResponse* reply) {
	Status status = CheckKey(request->key());
	if (!status.ok()) return status;
	status = CheckTtl(request->ttl_seconds());
	if (!status.ok()) return status;

	reply->set_value(store_.IncrementWithExpiry(request->key(), std::chrono::seconds(request->ttl_seconds())));
	reply->set_clamped(false);
	return Status::OK;
}

Status CounterStoreServiceImpl::DecrementClamped(ServerContext* context, const rpc::CounterRequest* request,
		rpc::CounterResponse* reply) {
	Status status = CheckKey(request->key());
	if (!status.ok()) return status;
	status = CheckTtl(request->ttl_seconds());
	if (!status.ok()) return status;

	DecrementResult result = store_.DecrementClampedWithExpiry(request->key(),
			std::chrono::seconds(request->ttl_seconds()));
	reply->set_value(result.value);
	reply->set_clamped(result.clamped);
	return Status::OK;
}

Status CounterStoreServiceImpl::Scan(ServerContext* context, const rpc::ScanRequest* request,
		rpc::ScanResponse* reply) {
	for (const auto& [key, value] : store_.ScanPrefix(request->prefix())) {
		rpc::ScanEntry* entry = reply->add_entries();
		entry->set_key(key);
		entry->set_value(value);
	}
	return Status::OK;
}

CounterStoreServer::CounterStoreServer(const std::string& listen_address,
		std::chrono::seconds eviction_interval)
	: service_(store_), eviction_interval_(eviction_interval) {
	ServerBuilder builder;
	builder.AddListeningPort(listen_address, grpc::InsecureServerCredentials(), &selected_port_);
	builder.RegisterService(&service_);
	server_ = builder.BuildAndStart();
	if (!server_) {
		LOG(ERROR) << "[CounterStoreServer] Failed to listen on " << listen_address;
		return;
	}
	LOG(INFO) << "[CounterStoreServer] Listening on " << listen_address
		<< " (port " << selected_port_ << ")";
	eviction_thread_ = std::thread([this]() {
			this->EvictionLoop();
			});
}

CounterStoreServer::~CounterStoreServer() {
	Shutdown();
	VLOG(3) << "[CounterStoreServer] Destructed";
}

void CounterStoreServer::Shutdown() {
	{
		absl::MutexLock lock(&mutex_);
		if (shutdown_) {
			return;
		}
		shutdown_ = true;
		shutdown_cv_.SignalAll();
	}
	if (server_) {
		server_->Shutdown();
	}
	if (eviction_thread_.joinable()) {
		eviction_thread_.join();
	}
}

void CounterStoreServer::EvictionLoop() {
	absl::MutexLock lock(&mutex_);
	while (!shutdown_) {
		shutdown_cv_.WaitWithTimeout(&mutex_, absl::Seconds(eviction_interval_.count()));
		if (shutdown_) {
			break;
		}
		size_t evicted = store_.EvictExpired();
		if (evicted > 0) {
			VLOG(1) << "[CounterStoreServer] Evicted " << evicted << " expired keys";
		}
	}
}

} // namespace KitchenEta
