#include "order_status.h"

namespace KitchenEta {

const char* ToString(OrderStatus status) {
	switch (status) {
		case OrderStatus::RECEIVED:  return "received";
		case OrderStatus::PREPARING: return "preparing";
		case OrderStatus::READY:     return "ready";
		case OrderStatus::COMPLETED: return "completed";
	}
	return "unknown";
}

const char* ToString(OrderSource source) {
	switch (source) {
		case OrderSource::ONLINE: return "online";
		case OrderSource::POS:    return "pos";
	}
	return "unknown";
}

std::optional<OrderStatus> ParseOrderStatus(std::string_view value) {
	if (value == "received") return OrderStatus::RECEIVED;
	if (value == "preparing") return OrderStatus::PREPARING;
	if (value == "ready") return OrderStatus::READY;
	if (value == "completed") return OrderStatus::COMPLETED;
	return std::nullopt;
}

std::optional<OrderSource> ParseOrderSource(std::string_view value) {
	if (value == "online") return OrderSource::ONLINE;
	if (value == "pos") return OrderSource::POS;
	return std::nullopt;
}

} // namespace KitchenEta
