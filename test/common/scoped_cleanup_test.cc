#include <gtest/gtest.h>
#include "common/scoped_cleanup.h"

#include <stdexcept>

using namespace KitchenEta;

TEST(ScopedCleanupTest, RunsOnScopeExit) {
    int runs = 0;
    {
        ScopedCleanup cleanup([&runs]() { runs++; });
        EXPECT_EQ(runs, 0);
    }
    EXPECT_EQ(runs, 1);
}

TEST(ScopedCleanupTest, RunsWhenScopeThrows) {
    int runs = 0;
    EXPECT_THROW({
        ScopedCleanup cleanup([&runs]() { runs++; });
        throw std::runtime_error("store down");
    }, std::runtime_error);
    EXPECT_EQ(runs, 1);
}
