#include "order_events.h"

namespace KitchenEta {

const char* ToString(OrderEventKind kind) {
	switch (kind) {
		case OrderEventKind::CREATED:        return "created";
		case OrderEventKind::STATUS_UPDATED: return "status_updated";
		case OrderEventKind::DELETED:        return "deleted";
		case OrderEventKind::RESTORED:       return "restored";
	}
	return "unknown";
}

} // namespace KitchenEta
