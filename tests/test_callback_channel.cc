#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "callbridge/CallbackChannel.hpp"

using namespace callbridge;

static CallbackMessage message(uint32_t id) {
    CallbackMessage msg;
    msg.call_id = id;
    return msg;
}

TEST(CallbackChannelTest, DeliversInPostOrder) {
    std::vector<uint32_t> seen;
    CallbackChannel channel([&](CallbackMessage& m) { seen.push_back(m.call_id); });
    channel.start();

    for (uint32_t i = 1; i <= 100; ++i) {
        EXPECT_TRUE(channel.post(message(i)));
    }
    channel.stop();

    ASSERT_EQ(seen.size(), 100u);
    for (uint32_t i = 0; i < 100; ++i) {
        EXPECT_EQ(seen[i], i + 1);
    }
    EXPECT_EQ(channel.delivered(), 100u);
}

TEST(CallbackChannelTest, ConsumerRunsOnDispatchThread) {
    std::thread::id consumer_thread;
    bool flagged = false;
    CallbackChannel* self = nullptr;
    CallbackChannel channel([&](CallbackMessage&) {
        consumer_thread = std::this_thread::get_id();
        flagged = self->on_dispatch_thread();
    });
    self = &channel;
    channel.start();

    channel.post(message(1));
    channel.stop();

    EXPECT_NE(consumer_thread, std::this_thread::get_id());
    EXPECT_TRUE(flagged);
}

TEST(CallbackChannelTest, PostAfterStopIsRejected) {
    int count = 0;
    CallbackChannel channel([&](CallbackMessage&) { ++count; });
    channel.start();
    channel.stop();

    EXPECT_FALSE(channel.post(message(1)));
    EXPECT_EQ(count, 0);
}

TEST(CallbackChannelTest, StopIsIdempotent) {
    CallbackChannel channel([](CallbackMessage&) {});
    channel.start();
    channel.stop();
    EXPECT_NO_THROW(channel.stop());
}

TEST(CallbackChannelTest, NeverStartedChannelDrainsOnStop) {
    std::vector<uint32_t> seen;
    CallbackChannel channel([&](CallbackMessage& m) { seen.push_back(m.call_id); });

    channel.post(message(7));
    channel.post(message(8));
    channel.stop();

    EXPECT_EQ(seen, (std::vector<uint32_t>{7, 8}));
}

TEST(CallbackChannelTest, ThrowingConsumerDoesNotStopDelivery) {
    std::vector<uint32_t> seen;
    CallbackChannel channel([&](CallbackMessage& m) {
        if (m.call_id == 2) throw std::runtime_error("bad message");
        seen.push_back(m.call_id);
    });
    channel.start();

    channel.post(message(1));
    channel.post(message(2));
    channel.post(message(3));
    channel.stop();

    EXPECT_EQ(seen, (std::vector<uint32_t>{1, 3}));
    EXPECT_EQ(channel.delivered(), 3u);
}

TEST(CallbackChannelTest, ManyProducersAllDelivered) {
    std::mutex mu;
    std::vector<uint32_t> seen;
    CallbackChannel channel([&](CallbackMessage& m) {
        std::lock_guard<std::mutex> lock(mu);
        seen.push_back(m.call_id);
    });
    channel.start();

    const int producers = 4;
    const int per_producer = 250;
    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&, p]() {
            for (int i = 0; i < per_producer; ++i) {
                channel.post(message(static_cast<uint32_t>(p * per_producer + i + 1)));
            }
        });
    }
    for (auto& t : threads) t.join();
    channel.stop();

    EXPECT_EQ(seen.size(), static_cast<size_t>(producers * per_producer));

    // Per producer, order is preserved.
    for (int p = 0; p < producers; ++p) {
        uint32_t last = 0;
        for (uint32_t id : seen) {
            if (id > static_cast<uint32_t>(p * per_producer) && id <= static_cast<uint32_t>((p + 1) * per_producer)) {
                EXPECT_GT(id, last);
                last = id;
            }
        }
    }
}

TEST(CallbackChannelTest, StopFromConsumerFinishesDrainAndJoinsLater) {
    std::vector<uint32_t> seen;
    CallbackChannel* self = nullptr;
    CallbackChannel channel([&](CallbackMessage& m) {
        seen.push_back(m.call_id);
        if (m.call_id == 1) self->stop();
    });
    self = &channel;

    channel.post(message(1));
    channel.post(message(2));
    channel.start();

    // Messages queued before the stop request still arrive.
    channel.stop();
    EXPECT_EQ(seen, (std::vector<uint32_t>{1, 2}));
    EXPECT_FALSE(channel.post(message(3)));
}

TEST(CallbackChannelTest, DestroyedFromItsOwnConsumer) {
    std::atomic<int> consumed{0};
    std::promise<void> destroyed;
    CallbackChannel* channel = nullptr;
    channel = new CallbackChannel([&](CallbackMessage&) {
        if (consumed.fetch_add(1) == 0) {
            delete channel;
            destroyed.set_value();
        }
    });

    channel->post(message(1));
    channel->post(message(2));
    channel->post(message(3));
    channel->start();

    ASSERT_EQ(destroyed.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(consumed.load(), 1);
}
