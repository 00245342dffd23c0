#include "order_book.h"

#include <algorithm>

#include <glog/logging.h>

namespace KitchenEta {

LocationId OrderBook::AddLocation(CompanyId company, const std::string& name) {
	absl::MutexLock lock(&mutex_);
	LocationId id = next_id_++;
	locations_[id] = Location{id, company, name};
	return id;
}

MenuItemId OrderBook::AddMenuItem(CompanyId company, const std::string& name,
		int64_t base_prep_seconds) {
	absl::MutexLock lock(&mutex_);
	MenuItemId id = next_id_++;
	menu_items_[id] = MenuItem{id, company, name, base_prep_seconds};
	return id;
}

std::optional<OfferingId> OrderBook::AddOffering(LocationId location, MenuItemId menu_item,
		bool available) {
	absl::MutexLock lock(&mutex_);
	auto loc_it = locations_.find(location);
	auto item_it = menu_items_.find(menu_item);
	if (loc_it == locations_.end() || item_it == menu_items_.end()) {
		return std::nullopt;
	}
	if (loc_it->second.company_id != item_it->second.company_id) {
		LOG(WARNING) << "Menu item " << menu_item << " does not belong to the company of location " << location;
		return std::nullopt;
	}
	for (const auto& [existing_id, existing] : offerings_) {
		if (existing.location_id == location && existing.menu_item_id == menu_item) {
			LOG(WARNING) << "Menu item " << menu_item << " is already offered at location " << location
				<< " as offering " << existing_id;
			return std::nullopt;
		}
	}
	OfferingId id = next_id_++;
	offerings_[id] = Offering{id, location, menu_item, available, item_it->second.base_prep_seconds};
	return id;
}

bool OrderBook::SetOfferingAvailable(OfferingId offering, bool available) {
	absl::MutexLock lock(&mutex_);
	auto it = offerings_.find(offering);
	if (it == offerings_.end()) {
		return false;
	}
	it->second.available = available;
	return true;
}

std::optional<Location> OrderBook::FindLocation(LocationId id) const {
	absl::MutexLock lock(&mutex_);
	auto it = locations_.find(id);
	if (it == locations_.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::vector<Location> OrderBook::ListLocations(CompanyId company) const {
	std::vector<Location> result;
	{
		absl::MutexLock lock(&mutex_);
		for (const auto& [id, location] : locations_) {
			if (location.company_id == company) {
				result.push_back(location);
			}
		}
	}
	std::sort(result.begin(), result.end(), [](const Location& a, const Location& b) {
			return a.id < b.id;
			});
	return result;
}

std::vector<MenuItem> OrderBook::ListMenuItems(CompanyId company) const {
	std::vector<MenuItem> result;
	{
		absl::MutexLock lock(&mutex_);
		for (const auto& [id, item] : menu_items_) {
			if (item.company_id == company) {
				result.push_back(item);
			}
		}
	}
	std::sort(result.begin(), result.end(), [](const MenuItem& a, const MenuItem& b) {
			return a.id < b.id;
			});
	return result;
}

std::vector<Offering> OrderBook::ListAvailableOfferings(LocationId location) const {
	std::vector<Offering> result;
	{
		absl::MutexLock lock(&mutex_);
		for (const auto& [id, offering] : offerings_) {
			if (offering.location_id == location && offering.available) {
				result.push_back(offering);
			}
		}
	}
	std::sort(result.begin(), result.end(), [](const Offering& a, const Offering& b) {
			return a.id < b.id;
			});
	return result;
}

std::optional<Offering> OrderBook::FindOffering(OfferingId id) const {
	absl::MutexLock lock(&mutex_);
	auto it = offerings_.find(id);
	if (it == offerings_.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::optional<Offering> OrderBook::FindOfferingForMenuItem(LocationId location,
		MenuItemId menu_item) const {
	absl::MutexLock lock(&mutex_);
	for (const auto& [id, offering] : offerings_) {
		if (offering.location_id == location && offering.menu_item_id == menu_item) {
			return offering;
		}
	}
	return std::nullopt;
}

int64_t OrderBook::CountActive(LocationId location) {
	absl::MutexLock lock(&mutex_);
	int64_t count = 0;
	for (const auto& [id, order] : orders_) {
		if (order.location_id == location && !order.deleted && IsActive(order.status)) {
			++count;
		}
	}
	return count;
}

OrderId OrderBook::InsertOrder(Order order) {
	absl::MutexLock lock(&mutex_);
	order.id = next_id_++;
	order.deleted = false;
	OrderId id = order.id;
	orders_[id] = std::move(order);
	return id;
}

std::optional<Order> OrderBook::GetOrder(OrderId id) const {
	absl::MutexLock lock(&mutex_);
	auto it = orders_.find(id);
	if (it == orders_.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::optional<StatusChange> OrderBook::UpdateStatus(OrderId id, OrderStatus status) {
	absl::MutexLock lock(&mutex_);
	auto it = orders_.find(id);
	if (it == orders_.end() || it->second.deleted) {
		return std::nullopt;
	}
	StatusChange change{it->second.location_id, it->second.status, status};
	it->second.status = status;
	return change;
}

std::optional<StatusChange> OrderBook::SoftDelete(OrderId id) {
	absl::MutexLock lock(&mutex_);
	auto it = orders_.find(id);
	if (it == orders_.end() || it->second.deleted) {
		return std::nullopt;
	}
	it->second.deleted = true;
	return StatusChange{it->second.location_id, it->second.status, std::nullopt};
}

std::optional<StatusChange> OrderBook::Restore(OrderId id) {
	absl::MutexLock lock(&mutex_);
	auto it = orders_.find(id);
	if (it == orders_.end() || !it->second.deleted) {
		return std::nullopt;
	}
	it->second.deleted = false;
	return StatusChange{it->second.location_id, std::nullopt, it->second.status};
}

} // namespace KitchenEta
