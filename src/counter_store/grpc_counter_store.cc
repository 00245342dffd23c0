#include "grpc_counter_store.h"

#include <glog/logging.h>

namespace KitchenEta {

namespace rpc = kitchen_eta::counter_store;

GrpcCounterStore::GrpcCounterStore(std::shared_ptr<grpc::Channel> channel,
		std::chrono::milliseconds rpc_timeout)
	: stub_(rpc::CounterStore::NewStub(channel)), rpc_timeout_(rpc_timeout) {}

GrpcCounterStore::GrpcCounterStore(const std::string& address,
		std::chrono::milliseconds rpc_timeout)
	: GrpcCounterStore(grpc::CreateChannel(address, grpc::InsecureChannelCredentials()),
			rpc_timeout) {
	VLOG(1) << "[GrpcCounterStore] Using counter store at " << address;
}

void GrpcCounterStore::PrepareContext(grpc::ClientContext& context) const {
	context.set_deadline(std::chrono::system_clock::now() + rpc_timeout_);
}

void GrpcCounterStore::CheckStatus(const grpc::Status& status, const char* op,
		const std::string& key) const {
	if (!status.ok()) {
		throw StoreUnavailableError(std::string(op) + "(" + key + ") failed: [" +
				std::to_string(status.error_code()) + "] " + status.error_message());
	}
}

std::optional<int64_t> GrpcCounterStore::GetInternal(const std::string& key,
		int64_t refresh_ttl_seconds) {
	rpc::GetRequest request;
	request.set_key(key);
	request.set_refresh_ttl_seconds(refresh_ttl_seconds);
	rpc::GetResponse reply;
	grpc::ClientContext context;
	PrepareContext(context);

	CheckStatus(stub_->Get(&context, request, &reply), "Get", key);
	if (!reply.found()) {
		return std::nullopt;
	}
	return reply.value();
}

std::optional<int64_t> GrpcCounterStore::Get(const std::string& key) {
	return GetInternal(key, 0);
}

std::optional<int64_t> GrpcCounterStore::GetAndExpire(const std::string& key,
		std::chrono::seconds ttl) {
	return GetInternal(key, ttl.count());
}

void GrpcCounterStore::SetWithExpiry(const std::string& key, int64_t value,
		std::chrono::seconds ttl) {
	rpc::SetRequest request;
	request.set_key(key);
	request.set_value(value);
	request.set_ttl_seconds(ttl.count());
	rpc::SetResponse reply;
	grpc::ClientContext context;
	PrepareContext(context);

	CheckStatus(stub_->SetWithExpiry(&context, request, &reply), "SetWithExpiry", key);
}

bool GrpcCounterStore::SetIfAbsent(const std::string& key, int64_t value,
		std::chrono::seconds ttl) {
	rpc::SetRequest request;
	request.set_key(key);
	request.set_value(value);
	request.set_ttl_seconds(ttl.count());
	rpc::SetResponse reply;
	grpc::ClientContext context;
	PrepareContext(context);

	CheckStatus(stub_->SetIfAbsent(&context, request, &reply), "SetIfAbsent", key);
	return reply.applied();
}

bool GrpcCounterStore::Delete(const std::string& key) {
	rpc::KeyRequest request;
	request.set_key(key);
	rpc::DeleteResponse reply;
	grpc::ClientContext context;
	PrepareContext(context);

	CheckStatus(stub_->Delete(&context, request, &reply), "Delete", key);
	return reply.deleted();
}

int64_t GrpcCounterStore::IncrementWithExpiry(const std::string& key,
		std::chrono::seconds ttl) {
	rpc::CounterRequest request;
	request.set_key(key);
	request.set_ttl_seconds(ttl.count());
	rpc::CounterResponse reply;
	grpc::ClientContext context;
	PrepareContext(context);

	CheckStatus(stub_->Increment(&context, request, &reply), "Increment", key);
	return reply.value();
}

DecrementResult GrpcCounterStore::DecrementClampedWithExpiry(const std::string& key,
		std::chrono::seconds ttl) {
	rpc::CounterRequest request;
	request.set_key(key);
	request.set_ttl_seconds(ttl.count());
	rpc::CounterResponse reply;
	grpc::ClientContext context;
	PrepareContext(context);

	CheckStatus(stub_->DecrementClamped(&context, request, &reply), "DecrementClamped", key);
	return DecrementResult{reply.value(), reply.clamped()};
}

std::vector<std::pair<std::string, int64_t>> GrpcCounterStore::ScanPrefix(
		const std::string& prefix) {
	rpc::ScanRequest request;
	request.set_prefix(prefix);
	rpc::ScanResponse reply;
	grpc::ClientContext context;
	PrepareContext(context);

	CheckStatus(stub_->Scan(&context, request, &reply), "Scan", prefix);
	std::vector<std::pair<std::string, int64_t>> result;
	result.reserve(reply.entries_size());
	for (const auto& entry : reply.entries()) {
		result.emplace_back(entry.key(), entry.value());
	}
	return result;
}

} // namespace KitchenEta
