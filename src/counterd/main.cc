#include <csignal>
#include <pthread.h>
#include <cstdlib>
#include <iostream>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "counter_store/counter_store_service.h"

namespace {

// Block SIGINT/SIGTERM in every thread; they are consumed with sigwait.
sigset_t BlockShutdownSignals() {
	sigset_t signals;
	sigemptyset(&signals);
	sigaddset(&signals, SIGINT);
	sigaddset(&signals, SIGTERM);
	pthread_sigmask(SIG_BLOCK, &signals, nullptr);
	return signals;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files

	cxxopts::Options options("kitchen_eta_counterd", "Shared active-order counter store");
	options.add_options()
		("f,config", "YAML configuration file", cxxopts::value<std::string>())
		("listen", "Listen address host:port", cxxopts::value<std::string>())
		("eviction_interval", "Seconds between expired-key sweeps", cxxopts::value<int>())
		("l,log_level", "Log level", cxxopts::value<int>())
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	KitchenEta::Configuration& configuration = KitchenEta::Configuration::getInstance();
	if (arguments.count("config") && !configuration.loadFromFile(arguments["config"].as<std::string>())) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration: " << error;
		}
		return EXIT_FAILURE;
	}
	auto& config = configuration.config();
	if (arguments.count("listen")) {
		config.store.listen_address.set(arguments["listen"].as<std::string>());
	}
	if (arguments.count("eviction_interval")) {
		config.store.eviction_interval_seconds.set(arguments["eviction_interval"].as<int>());
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

	sigset_t signals = BlockShutdownSignals();
	KitchenEta::CounterStoreServer server(config.store.listen_address.get(),
			std::chrono::seconds(config.store.eviction_interval_seconds.get()));
	if (!server.IsRunning()) {
		return EXIT_FAILURE;
	}
	// Serve until SIGINT or SIGTERM
	int received = 0;
	sigwait(&signals, &received);
	LOG(INFO) << "Received signal " << received << ", shutting down";
	server.Shutdown();
	LOG(INFO) << "kitchen_eta_counterd stopped";
	return EXIT_SUCCESS;
}
