// Runs a cleanup callback on scope exit, including when the scope is left by
// an exception.
#ifndef KITCHEN_ETA_SRC_COMMON_SCOPED_CLEANUP_H_
#define KITCHEN_ETA_SRC_COMMON_SCOPED_CLEANUP_H_

#include <functional>
#include <utility>

namespace KitchenEta {

class ScopedCleanup {
public:
    explicit ScopedCleanup(std::function<void()> cleanup) : cleanup_(std::move(cleanup)) {}
    ~ScopedCleanup() { if (cleanup_) cleanup_(); }

    ScopedCleanup(const ScopedCleanup&) = delete;
    ScopedCleanup& operator=(const ScopedCleanup&) = delete;

private:
    std::function<void()> cleanup_;
};

} // namespace KitchenEta

#endif  // KITCHEN_ETA_SRC_COMMON_SCOPED_CLEANUP_H_
