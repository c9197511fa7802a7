#include <catch2/catch_test_macros.hpp>
#include "core/bounded_channel.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace hookrelay;

TEST_CASE("BoundedChannel: FIFO within capacity", "[channel]") {
    BoundedChannel<int> ch(3);
    CHECK(ch.capacity() == 3);
    CHECK(ch.free_slots() == 3);

    REQUIRE(ch.try_push(1));
    REQUIRE(ch.try_push(2));
    REQUIRE(ch.try_push(3));
    CHECK_FALSE(ch.try_push(4));
    CHECK(ch.free_slots() == 0);

    CHECK(*ch.pop() == 1);
    CHECK(*ch.pop() == 2);
    CHECK(ch.size() == 1);
}

TEST_CASE("BoundedChannel: close wakes consumers and keeps leftovers for drain", "[channel]") {
    BoundedChannel<int> ch(4);
    REQUIRE(ch.try_push(7));
    REQUIRE(ch.try_push(8));

    ch.close();
    CHECK_FALSE(ch.pop().has_value());
    CHECK_FALSE(ch.push(9));
    CHECK_FALSE(ch.try_push(9));

    const auto rest = ch.drain();
    REQUIRE(rest.size() == 2);
    CHECK(rest[0] == 7);
    CHECK(rest[1] == 8);
    CHECK(ch.size() == 0);
}

TEST_CASE("BoundedChannel: blocked consumer is released by close", "[channel]") {
    BoundedChannel<int> ch(1);
    std::atomic<bool> returned{false};

    std::thread consumer([&] {
        auto v = ch.pop();
        CHECK_FALSE(v.has_value());
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
    consumer.join();
    CHECK(returned.load());
}

TEST_CASE("BoundedChannel: producers and consumers hand off every item", "[channel][concurrency]") {
    BoundedChannel<int> ch(2);
    constexpr int kItems = 1000;
    std::atomic<int> sum{0};
    std::atomic<int> received{0};

    std::vector<std::thread> consumers;
    for (int i = 0; i < 3; ++i) {
        consumers.emplace_back([&] {
            while (received.load() < kItems) {
                auto v = ch.pop();
                if (!v) return;
                sum += *v;
                if (++received == kItems) ch.close();
            }
        });
    }

    std::thread producer([&] {
        for (int i = 1; i <= kItems; ++i) {
            if (!ch.push(i)) break;
        }
    });

    producer.join();
    for (auto& c : consumers) c.join();

    CHECK(received.load() == kItems);
    CHECK(sum.load() == kItems * (kItems + 1) / 2);
}
