#include <gtest/gtest.h>

#include "callbridge/Cancellation.hpp"

using namespace callbridge;

TEST(CancellationTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.can_be_cancelled());
    EXPECT_FALSE(token.cancelled());

    bool ran = false;
    CancellationRegistration reg = token.on_cancel([&]() { ran = true; });
    EXPECT_FALSE(ran);
}

TEST(CancellationTest, CancelRunsCallbacksOnce) {
    CancellationSource source;
    CancellationToken token = source.token();
    EXPECT_TRUE(token.can_be_cancelled());

    int runs = 0;
    CancellationRegistration reg = token.on_cancel([&]() { ++runs; });

    source.cancel();
    source.cancel();
    EXPECT_EQ(runs, 1);
    EXPECT_TRUE(token.cancelled());
    EXPECT_TRUE(source.cancelled());
}

TEST(CancellationTest, RegisteringAfterCancelRunsImmediately) {
    CancellationSource source;
    source.cancel();

    bool ran = false;
    CancellationRegistration reg = source.token().on_cancel([&]() { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(CancellationTest, ResetRegistrationUnsubscribes) {
    CancellationSource source;
    int runs = 0;
    {
        CancellationRegistration reg = source.token().on_cancel([&]() { ++runs; });
    }
    CancellationRegistration kept = source.token().on_cancel([&]() { runs += 10; });
    CancellationRegistration dropped = source.token().on_cancel([&]() { runs += 100; });
    dropped.reset();

    source.cancel();
    EXPECT_EQ(runs, 10);
}

TEST(CancellationTest, MovedRegistrationStaysSubscribed) {
    CancellationSource source;
    int runs = 0;

    CancellationRegistration outer;
    {
        CancellationRegistration inner = source.token().on_cancel([&]() { ++runs; });
        outer = std::move(inner);
    }
    source.cancel();
    EXPECT_EQ(runs, 1);
}
