#include <gtest/gtest.h>
#include "common/order_status.h"

using namespace KitchenEta;

TEST(OrderStatusTest, OnlyCompletedIsInactive) {
    EXPECT_TRUE(IsActive(OrderStatus::RECEIVED));
    EXPECT_TRUE(IsActive(OrderStatus::PREPARING));
    EXPECT_TRUE(IsActive(OrderStatus::READY));
    EXPECT_FALSE(IsActive(OrderStatus::COMPLETED));
}

TEST(OrderStatusTest, NoStatusIsInactive) {
    EXPECT_FALSE(IsActive(std::optional<OrderStatus>()));
    EXPECT_TRUE(IsActive(std::optional<OrderStatus>(OrderStatus::READY)));
}

TEST(OrderStatusTest, NamesParseBack) {
    for (OrderStatus status : {OrderStatus::RECEIVED, OrderStatus::PREPARING,
            OrderStatus::READY, OrderStatus::COMPLETED}) {
        EXPECT_EQ(ParseOrderStatus(ToString(status)), status);
    }
    EXPECT_EQ(ParseOrderSource("online"), OrderSource::ONLINE);
    EXPECT_EQ(ParseOrderSource("pos"), OrderSource::POS);
    EXPECT_STREQ(ToString(OrderSource::POS), "pos");
}

TEST(OrderStatusTest, UnknownNamesAreRejected) {
    EXPECT_FALSE(ParseOrderStatus("cancelled").has_value());
    EXPECT_FALSE(ParseOrderStatus("Received").has_value());
    EXPECT_FALSE(ParseOrderSource("").has_value());
}
