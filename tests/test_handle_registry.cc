#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <thread>
#include <vector>

#include "callbridge/BridgeError.hpp"
#include "callbridge/HandleRegistry.hpp"

using namespace callbridge;

TEST(HandleRegistryTest, RegisterAndResolve) {
    HandleRegistry reg;
    Handle h = reg.register_object(CALLBRIDGE_OBJECT_COLLECTOR, 0x1000, 7);

    EXPECT_NE(h, 0u);
    RawObjectRef ref = reg.resolve(h);
    EXPECT_EQ(ref.kind, CALLBRIDGE_OBJECT_COLLECTOR);
    EXPECT_EQ(ref.pointer, 0x1000u);

    auto e = reg.entry(h);
    ASSERT_TRUE(e.has_value());
    EXPECT_TRUE(e->live);
    EXPECT_EQ(e->creation_call_id, 7u);
}

TEST(HandleRegistryTest, HandlesAreArenaIndices) {
    HandleRegistry reg;
    EXPECT_EQ(reg.register_object(CALLBRIDGE_OBJECT_COLLECTOR, 0x10), 1u);
    EXPECT_EQ(reg.register_object(CALLBRIDGE_OBJECT_TYPE_BUILDER, 0x20), 2u);
    EXPECT_EQ(reg.register_object(CALLBRIDGE_OBJECT_CLASS_BUILDER, 0x30), 3u);
}

TEST(HandleRegistryTest, ResolveUnknownHandleFails) {
    HandleRegistry reg;
    EXPECT_THROW(reg.resolve(0), BridgeError);
    EXPECT_THROW(reg.resolve(12345), BridgeError);
}

TEST(HandleRegistryTest, InvalidateIsIdempotent) {
    HandleRegistry reg;
    Handle h = reg.register_object(CALLBRIDGE_OBJECT_COLLECTOR, 0x1000);

    auto first = reg.invalidate(h);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->pointer, 0x1000u);

    EXPECT_FALSE(reg.invalidate(h).has_value());
    EXPECT_FALSE(reg.is_live(h));

    try {
        reg.resolve(h);
        FAIL() << "resolve of a disposed handle must fail";
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidHandle);
        EXPECT_EQ(e.handle(), h);
        EXPECT_EQ(e.object_kind(), CALLBRIDGE_OBJECT_COLLECTOR);
        EXPECT_NE(std::string(e.what()).find("Collector"), std::string::npos);
    }
}

TEST(HandleRegistryTest, HandlesAreNeverReused) {
    HandleRegistry reg;
    Handle first = reg.register_object(CALLBRIDGE_OBJECT_COLLECTOR, 0x1000);
    reg.invalidate(first);

    // Same pointer handed out again by the native allocator.
    Handle second = reg.register_object(CALLBRIDGE_OBJECT_COLLECTOR, 0x1000);
    EXPECT_NE(first, second);
    EXPECT_FALSE(reg.is_live(first));
    EXPECT_TRUE(reg.is_live(second));
    EXPECT_THROW(reg.resolve(first), BridgeError);
}

TEST(HandleRegistryTest, DisposedSlotsAreRecycledUnderNewHandles) {
    HandleRegistry reg;
    std::set<Handle> issued;
    Handle previous = 0;
    for (int i = 0; i < 1000; ++i) {
        Handle h = reg.register_object(CALLBRIDGE_OBJECT_FUNCTION_LOG, 0x5000);
        EXPECT_TRUE(issued.insert(h).second) << "handle " << h << " issued twice";
        if (previous != 0) {
            EXPECT_FALSE(reg.is_live(previous));
            EXPECT_FALSE(reg.entry(previous).has_value());
            try {
                reg.resolve(previous);
                FAIL() << "resolve of a recycled handle must fail";
            } catch (const BridgeError& e) {
                EXPECT_EQ(e.kind(), ErrorKind::InvalidHandle);
                EXPECT_NE(e.diagnostic().find("disposed"), std::string::npos);
            }
        }
        ASSERT_TRUE(reg.invalidate(h).has_value());
        previous = h;
    }
    EXPECT_EQ(reg.slot_count(), 1u);
    EXPECT_EQ(reg.live_count(), 0u);
}

TEST(HandleRegistryTest, LivePointerIsDuplicate) {
    HandleRegistry reg;
    Handle h = reg.register_object(CALLBRIDGE_OBJECT_COLLECTOR, 0x1000);

    try {
        reg.register_object(CALLBRIDGE_OBJECT_COLLECTOR, 0x1000);
        FAIL() << "expected DuplicateHandle";
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DuplicateHandle);
        EXPECT_EQ(e.handle(), h);
    }
    EXPECT_EQ(reg.live_count(), 1u);
}

TEST(HandleRegistryTest, ResolveChecksExpectedKind) {
    HandleRegistry reg;
    Handle h = reg.register_object(CALLBRIDGE_OBJECT_TYPE_BUILDER, 0x2000);

    EXPECT_NO_THROW(reg.resolve(h, CALLBRIDGE_OBJECT_TYPE_BUILDER));
    try {
        reg.resolve(h, CALLBRIDGE_OBJECT_COLLECTOR);
        FAIL() << "expected InvalidHandle";
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidHandle);
    }
}

TEST(HandleRegistryTest, AdoptReturnsExistingLiveHandle) {
    HandleRegistry reg;
    Handle h = reg.register_object(CALLBRIDGE_OBJECT_FUNCTION_LOG, 0x3000);
    EXPECT_EQ(reg.adopt(CALLBRIDGE_OBJECT_FUNCTION_LOG, 0x3000), h);

    Handle fresh = reg.adopt(CALLBRIDGE_OBJECT_FUNCTION_LOG, 0x4000, 9);
    EXPECT_NE(fresh, h);
    EXPECT_EQ(reg.entry(fresh)->creation_call_id, 9u);

    EXPECT_THROW(reg.adopt(CALLBRIDGE_OBJECT_COLLECTOR, 0x3000), BridgeError);
}

TEST(HandleRegistryTest, RejectsUnknownKind) {
    HandleRegistry reg;
    EXPECT_THROW(reg.register_object(CALLBRIDGE_OBJECT_INVALID, 0x1), BridgeError);
}

TEST(HandleRegistryTest, LiveHandlesTracksDisposal) {
    HandleRegistry reg;
    Handle a = reg.register_object(CALLBRIDGE_OBJECT_COLLECTOR, 1);
    Handle b = reg.register_object(CALLBRIDGE_OBJECT_COLLECTOR, 2);
    Handle c = reg.register_object(CALLBRIDGE_OBJECT_COLLECTOR, 3);
    reg.invalidate(b);

    auto live = reg.live_handles();
    EXPECT_EQ(live, (std::vector<Handle>{a, c}));
    EXPECT_EQ(reg.live_count(), 2u);
    EXPECT_FALSE(reg.find_live(2).has_value());
    ASSERT_TRUE(reg.find_live(3).has_value());
    EXPECT_EQ(*reg.find_live(3), c);
}

TEST(HandleRegistryTest, ConcurrentRegistrationYieldsDistinctHandles) {
    HandleRegistry reg;
    const int threads = 8;
    const int per_thread = 200;
    std::vector<std::vector<Handle>> results(threads);

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < per_thread; ++i) {
                uint64_t pointer = static_cast<uint64_t>(t) * 100000 + i + 1;
                Handle h = reg.register_object(CALLBRIDGE_OBJECT_COLLECTOR, pointer);
                results[t].push_back(h);
                if (i % 2 == 0) reg.invalidate(h);
            }
        });
    }
    for (auto& w : workers) w.join();

    std::set<Handle> all;
    for (const auto& r : results) all.insert(r.begin(), r.end());
    EXPECT_EQ(all.size(), static_cast<size_t>(threads * per_thread));
    EXPECT_EQ(reg.live_count(), static_cast<size_t>(threads * per_thread / 2));
}
