#ifndef KITCHEN_ETA_SRC_COMMON_TYPES_H_
#define KITCHEN_ETA_SRC_COMMON_TYPES_H_

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "order_status.h"

namespace KitchenEta {

using LocationId = int64_t;
using CompanyId = int64_t;
using MenuItemId = int64_t;
using OfferingId = int64_t;
using OrderId = int64_t;

using SystemTime = std::chrono::system_clock::time_point;

struct Location {
	LocationId id;
	CompanyId company_id;
	std::string name;
};

// Global catalog entry
struct MenuItem {
	MenuItemId id;
	CompanyId company_id;
	std::string name;
	int64_t base_prep_seconds;
};

// A menu item made available at one location
struct Offering {
	OfferingId id;
	LocationId location_id;
	MenuItemId menu_item_id;
	bool available;
	int64_t base_prep_seconds;
};

struct LineItem {
	OfferingId offering_id;
	int64_t quantity;
};

struct MenuItemLine {
	MenuItemId menu_item_id;
	int64_t quantity;
};

struct LoadInfo {
	int64_t active_orders;
	double multiplier;   // rounded to 2 decimals
	bool is_high_load;
};

struct ReadyEstimate {
	SystemTime ready_at;
	std::chrono::milliseconds prep_duration;
	LoadInfo load;
};

struct Order {
	OrderId id;
	LocationId location_id;
	OrderSource source;
	OrderStatus status;
	SystemTime estimated_ready_at;
	std::vector<LineItem> items;
	bool deleted = false;
};

/**
 * Offering missing, at another location or unavailable, empty line items,
 * non-positive quantity. Nothing was mutated when this is thrown.
 */
class ValidationError : public std::invalid_argument {
public:
	explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * Cache store or authoritative store could not be reached.
 */
class StoreUnavailableError : public std::runtime_error {
public:
	explicit StoreUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace KitchenEta

#endif // KITCHEN_ETA_SRC_COMMON_TYPES_H_
