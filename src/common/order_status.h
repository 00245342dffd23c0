#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace KitchenEta {

enum class OrderStatus {
	RECEIVED,
	PREPARING,
	READY,
	COMPLETED
};

enum class OrderSource {
	ONLINE,
	POS
};

/**
 * An order contributes to kitchen load while it is received, preparing or ready.
 * COMPLETED is the only inactive state.
 */
inline bool IsActive(OrderStatus status) {
	switch (status) {
		case OrderStatus::RECEIVED:
		case OrderStatus::PREPARING:
		case OrderStatus::READY:
			return true;
		case OrderStatus::COMPLETED:
			return false;
	}
	return false;
}

// No status (a new, deleted or not yet restored order) is never active.
inline bool IsActive(const std::optional<OrderStatus>& status) {
	return status.has_value() && IsActive(*status);
}

const char* ToString(OrderStatus status);
const char* ToString(OrderSource source);

std::optional<OrderStatus> ParseOrderStatus(std::string_view value);
std::optional<OrderSource> ParseOrderSource(std::string_view value);

} // namespace KitchenEta
