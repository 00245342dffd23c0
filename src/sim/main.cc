// Drives concurrent order traffic at one location through the full estimate
// path and checks that the cached load matches the order book at the end.

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <thread>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "counter_store/grpc_counter_store.h"
#include "counter_store/in_memory_counter_store.h"
#include "eta/lifecycle_bridge.h"
#include "eta/load_counter_cache.h"
#include "eta/order_events.h"
#include "eta/prep_time_estimator.h"
#include "orders/order_book.h"
#include "orders/order_service.h"

using namespace KitchenEta;

namespace {

struct SimStats {
	std::atomic<size_t> created{0};
	std::atomic<size_t> completed{0};
	std::atomic<size_t> deleted{0};
	std::atomic<size_t> restored{0};
	std::atomic<size_t> rejected{0};
};

// One worker: place orders, walk some of them through the kitchen
void RunWorker(OrderService& service, LocationId location, const std::vector<LineItem>& menu,
		size_t num_orders, unsigned seed, SimStats& stats) {
	std::mt19937 rng(seed);
	std::uniform_int_distribution<size_t> pick_item(0, menu.size() - 1);
	std::uniform_int_distribution<int> pick_quantity(1, 3);
	std::uniform_int_distribution<int> pick_fate(0, 9);

	for (size_t i = 0; i < num_orders; ++i) {
		std::vector<LineItem> items{{menu[pick_item(rng)].offering_id, pick_quantity(rng)}};
		CreatedOrder created;
		try {
			created = service.CreateOrder(location, OrderSource::ONLINE, items);
		} catch (const ValidationError& e) {
			LOG(WARNING) << "Order rejected: " << e.what();
			stats.rejected++;
			continue;
		}
		stats.created++;
		OrderId id = created.order.id;

		int fate = pick_fate(rng);
		if (fate < 5) {
			service.UpdateStatus(id, OrderStatus::PREPARING);
			service.UpdateStatus(id, OrderStatus::READY);
			service.UpdateStatus(id, OrderStatus::COMPLETED);
			stats.completed++;
		} else if (fate < 7) {
			service.UpdateStatus(id, OrderStatus::PREPARING);
		} else if (fate < 8) {
			service.DeleteOrder(id);
			stats.deleted++;
			if (pick_fate(rng) < 5 && service.RestoreOrder(id)) {
				stats.restored++;
			}
		}
	}
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files

	cxxopts::Options options("kitchen_eta_sim", "Concurrent order traffic against the load-aware ETA engine");
	options.add_options()
		("f,config", "YAML configuration file", cxxopts::value<std::string>())
		("store", "Counter store host:port; in-process store when empty", cxxopts::value<std::string>())
		("key_prefix", "Cache key prefix (use a distinct one per simulator sharing a store)",
		 cxxopts::value<std::string>())
		("t,threads", "Worker threads", cxxopts::value<size_t>()->default_value("8"))
		("n,orders_per_thread", "Orders placed by each worker", cxxopts::value<size_t>()->default_value("200"))
		("l,log_level", "Log level", cxxopts::value<int>())
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	Configuration& configuration = Configuration::getInstance();
	if (arguments.count("config") && !configuration.loadFromFile(arguments["config"].as<std::string>())) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration: " << error;
		}
		return EXIT_FAILURE;
	}
	auto& config = configuration.config();
	if (arguments.count("store")) {
		config.store.address.set(arguments["store"].as<std::string>());
	}
	if (arguments.count("key_prefix")) {
		config.cache.key_prefix.set(arguments["key_prefix"].as<std::string>());
	}
	if (arguments.count("log_level")) {
		config.logging.verbosity.set(arguments["log_level"].as<int>());
	}
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration: " << error;
		}
		return EXIT_FAILURE;
	}
	FLAGS_v = config.logging.verbosity.get();

	size_t num_threads = arguments["threads"].as<size_t>();
	size_t orders_per_thread = arguments["orders_per_thread"].as<size_t>();
	if (num_threads == 0) {
		LOG(ERROR) << "At least one worker thread is required";
		return EXIT_FAILURE;
	}

	// *************** Counter store **********************
	std::unique_ptr<CounterStore> store;
	const std::string store_address = config.store.address.get();
	if (store_address.empty()) {
		LOG(INFO) << "Using in-process counter store";
		store = std::make_unique<InMemoryCounterStore>();
	} else {
		LOG(INFO) << "Using counter store at " << store_address;
		store = std::make_unique<GrpcCounterStore>(store_address,
				std::chrono::milliseconds(config.store.rpc_timeout_ms.get()));
	}

	// *************** Menu **********************
	OrderBook book;
	CompanyId company = 1;
	LocationId location = book.AddLocation(company, "Sim Kitchen");
	std::vector<LineItem> menu;
	for (const auto& [name, seconds] : std::vector<std::pair<std::string, int64_t>>{
			{"Espresso", 120}, {"Burger", 540}, {"Pizza", 900}, {"Salad", 300}}) {
		MenuItemId item = book.AddMenuItem(company, name, seconds);
		std::optional<OfferingId> offering = book.AddOffering(location, item);
		if (!offering.has_value()) {
			LOG(ERROR) << "Failed to offer " << name;
			return EXIT_FAILURE;
		}
		menu.push_back(LineItem{*offering, 1});
	}

	// *************** Engine **********************
	LoadCounterCache cache(*store, book, LoadCacheOptions::FromConfig(config));
	PrepTimeEstimator estimator = PrepTimeEstimator::FromConfig(book, cache, config);
	OrderEventBus events;
	LifecycleBridge bridge(cache);
	bridge.Attach(events);
	OrderService service(book, estimator, events);

	// Start from ground truth so that every later change is a delta on it
	cache.Resync(location);

	SimStats stats;
	auto start = std::chrono::steady_clock::now();
	std::vector<std::thread> workers;
	workers.reserve(num_threads);
	for (size_t t = 0; t < num_threads; ++t) {
		workers.emplace_back(RunWorker, std::ref(service), location, std::cref(menu),
				orders_per_thread, static_cast<unsigned>(t + 1), std::ref(stats));
	}
	for (auto& worker : workers) {
		worker.join();
	}
	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - start);

	LoadInfo load = service.GetLoadInfo(location);
	int64_t authoritative = book.CountActive(location);
	LoadCacheStats cache_stats = cache.GetStats();

	LOG(INFO) << "Simulated " << stats.created << " orders in " << elapsed.count() << "ms ("
		<< stats.completed << " completed, " << stats.deleted << " deleted, "
		<< stats.restored << " restored, " << stats.rejected << " rejected)";
	LOG(INFO) << "Load: " << load.active_orders << " active, x" << load.multiplier
		<< (load.is_high_load ? " (high load)" : "");
	LOG(INFO) << "Cache: " << cache_stats.cached_locations << " locations, "
		<< cache_stats.total_cached_orders << " orders, "
		<< (cache_stats.healthy ? "healthy" : "unavailable");

	if (load.active_orders != authoritative) {
		LOG(ERROR) << "Cached load " << load.active_orders << " diverged from order book "
			<< authoritative;
		return EXIT_FAILURE;
	}
	LOG(INFO) << "Cached load matches order book (" << authoritative << " active)";
	return EXIT_SUCCESS;
}
