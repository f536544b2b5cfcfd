#include "ingest/events/components.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ingest::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    std::string received;
    bus.subscribe<UploadAttemptStartedEvent>([&](const UploadAttemptStartedEvent& e) {
        received = e.import_id;
    });

    bus.emit(UploadAttemptStartedEvent{"import-1", 0, 3});

    EXPECT_EQ(received, "import-1");
}

TEST(EventBus, DeliversOnlyMatchingType) {
    EventBus bus;

    int parts = 0;
    int completions = 0;
    bus.subscribe<PartUploadedEvent>([&](const PartUploadedEvent&) { parts++; });
    bus.subscribe<UploadCompletedEvent>([&](const UploadCompletedEvent&) { completions++; });

    bus.emit(PartUploadedEvent{"import-1", "/data/a.bin", 1, 4, 8, false});
    bus.emit(PartUploadedEvent{"import-1", "/data/a.bin", 2, 8, 8, true});
    bus.emit(UploadCompletedEvent{"import-1", 0, 2});

    EXPECT_EQ(parts, 2);
    EXPECT_EQ(completions, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<UploadFailedEvent>([&](const UploadFailedEvent&) { count++; });

    bus.emit(UploadFailedEvent{"import-1", 0, 403, "forbidden"});
    bus.unsubscribe(id);
    bus.emit(UploadFailedEvent{"import-1", 0, 403, "forbidden"});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int count = 0;
    bus.subscribe<UploadRetryScheduledEvent>([](const UploadRetryScheduledEvent&) {
        throw std::runtime_error("handler failure");
    });
    bus.subscribe<UploadRetryScheduledEvent>([&](const UploadRetryScheduledEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(UploadRetryScheduledEvent{"import-1", 1, std::chrono::milliseconds(500), "429"}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<PartUploadedEvent>([&bytes](const PartUploadedEvent& e) { bytes += e.bytes_sent; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&bus]() {
            for (int j = 0; j < 25; ++j) {
                bus.emit(PartUploadedEvent{"import-1", "/data/a.bin", 1, 2, 8, false});
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes.load(), 16u * 25u * 2u);
}

TEST(LoggerComponent, SubscribesForItsLifetime) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<UploadAttemptStartedEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<PartUploadedEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<UploadRetryScheduledEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<UploadCompletedEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 1u);
        EXPECT_NO_THROW(bus.emit(UploadCompletedEvent{"import-1", 0, 4}));
    }
    EXPECT_EQ(bus.subscriber_count<UploadCompletedEvent>(), 0u);
}
