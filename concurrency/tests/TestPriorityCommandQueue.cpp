/**
 * @file TestPriorityCommandQueue.cpp
 * @brief Unit tests for concurrency::PriorityCommandQueue.
 */

#include <catch2/catch_test_macros.hpp>

#include <zyppy/concurrency/PriorityCommandQueue.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <limits>
#include <string>
#include <thread>
#include <vector>

namespace zyppy::concurrency {

using namespace std::chrono_literals;

namespace {

constexpr core::i32 kKeyboard = 0;
constexpr core::i32 kVoice    = 1;
constexpr core::i32 kSystem   = std::numeric_limits<core::i32>::max();

} // namespace

TEST_CASE("PriorityCommandQueue serves voice before earlier keyboard input", "[concurrency][queue]")
{
    PriorityCommandQueue queue{8};

    REQUIRE(queue.enqueue("look", CommandSource::kKeyboard, kKeyboard).value() == 0);
    REQUIRE(queue.enqueue("inventory", CommandSource::kVoice, kVoice).value() == 1);
    REQUIRE(queue.size() == 2);

    auto first = queue.dequeueBlocking();
    REQUIRE(first.has_value());
    REQUIRE(first->text() == "inventory");
    REQUIRE(first->source() == CommandSource::kVoice);

    auto second = queue.dequeueBlocking();
    REQUIRE(second->text() == "look");
    REQUIRE(queue.size() == 0);
}

TEST_CASE("PriorityCommandQueue blocks producers at capacity", "[concurrency][queue]")
{
    PriorityCommandQueue queue{2};

    REQUIRE(queue.enqueue("a", CommandSource::kKeyboard, kKeyboard));
    REQUIRE(queue.enqueue("b", CommandSource::kKeyboard, kKeyboard));

    std::atomic<bool> admitted{false};
    auto producer = std::async(std::launch::async, [&] {
        auto seq = queue.enqueue("c", CommandSource::kKeyboard, kKeyboard);
        admitted = true;
        return seq;
    });

    std::this_thread::sleep_for(50ms);
    REQUIRE_FALSE(admitted.load());
    REQUIRE(queue.size() == 2);

    REQUIRE(queue.dequeueBlocking()->text() == "a");

    auto seq = producer.get();
    REQUIRE(seq.has_value());
    REQUIRE(*seq == 2);
    REQUIRE(admitted.load());
    REQUIRE(queue.size() == 2);
    REQUIRE(queue.dequeueBlocking()->text() == "b");
    REQUIRE(queue.dequeueBlocking()->text() == "c");
}

TEST_CASE("PriorityCommandQueue reject policy fails fast when full", "[concurrency][queue]")
{
    PriorityCommandQueue queue{1, OverflowPolicy::kReject};

    REQUIRE(queue.enqueue("a", CommandSource::kKeyboard, kKeyboard));
    auto rejected = queue.enqueue("b", CommandSource::kKeyboard, kKeyboard);
    REQUIRE_FALSE(rejected.has_value());
    REQUIRE(rejected.error().code() == core::ErrorCode::kQueueFull);

    REQUIRE(queue.tryEnqueue("c", CommandSource::kVoice, kVoice).error().code() == core::ErrorCode::kQueueFull);
    REQUIRE(queue.size() == 1);
}

TEST_CASE("PriorityCommandQueue enqueueFor times out", "[concurrency][queue]")
{
    PriorityCommandQueue queue{1};
    REQUIRE(queue.enqueue("a", CommandSource::kKeyboard, kKeyboard));

    auto late = queue.enqueueFor(":quit", CommandSource::kSystem, kSystem, 20ms);
    REQUIRE(late.error().code() == core::ErrorCode::kTimeout);
}

TEST_CASE("PriorityCommandQueue rejects malformed UTF-8", "[concurrency][queue]")
{
    PriorityCommandQueue queue{4};

    auto bad = queue.enqueue("go \xC3(", CommandSource::kVoice, kVoice);
    REQUIRE(bad.error().code() == core::ErrorCode::kInvalidEncoding);
    REQUIRE(queue.size() == 0);

    // The next valid line still gets the first sequence number.
    REQUIRE(queue.enqueue("go north", CommandSource::kVoice, kVoice).value() == 0);
}

TEST_CASE("PriorityCommandQueue close discards pending commands", "[concurrency][queue]")
{
    PriorityCommandQueue queue{4};
    REQUIRE(queue.enqueue("a", CommandSource::kKeyboard, kKeyboard));
    REQUIRE(queue.enqueue("b", CommandSource::kKeyboard, kKeyboard));

    REQUIRE(queue.close() == 2);
    REQUIRE(queue.close() == 0);
    REQUIRE(queue.isClosed());

    REQUIRE(queue.enqueue("c", CommandSource::kKeyboard, kKeyboard).error().code() == core::ErrorCode::kQueueClosed);
    REQUIRE(queue.dequeueBlocking().error().code() == core::ErrorCode::kQueueClosed);
    REQUIRE_FALSE(queue.tryDequeue().has_value());
}

TEST_CASE("PriorityCommandQueue close releases a blocked producer", "[concurrency][queue]")
{
    PriorityCommandQueue queue{1};
    REQUIRE(queue.enqueue("a", CommandSource::kKeyboard, kKeyboard));

    auto producer = std::async(std::launch::async, [&] {
        return queue.enqueue("b", CommandSource::kKeyboard, kKeyboard);
    });

    std::this_thread::sleep_for(20ms);
    queue.close();

    REQUIRE(producer.get().error().code() == core::ErrorCode::kQueueClosed);
}

TEST_CASE("PriorityCommandQueue consumer wake-ups", "[concurrency][queue]")
{
    PriorityCommandQueue queue{4};

    SECTION("wakeConsumer interrupts a blocked dequeue once")
    {
        auto consumer = std::async(std::launch::async, [&] { return queue.dequeueBlocking(); });
        std::this_thread::sleep_for(20ms);
        queue.wakeConsumer();

        REQUIRE(consumer.get().error().code() == core::ErrorCode::kInterrupted);

        REQUIRE(queue.enqueue("look", CommandSource::kKeyboard, kKeyboard));
        REQUIRE(queue.dequeueBlocking()->text() == "look");
    }

    SECTION("a wake requested before the wait is not lost")
    {
        queue.wakeConsumer();
        REQUIRE(queue.dequeueBlocking().error().code() == core::ErrorCode::kInterrupted);
    }

    SECTION("a stop request cancels the wait")
    {
        std::stop_source stop;
        auto consumer = std::async(std::launch::async, [&] { return queue.dequeueBlocking(stop.get_token()); });
        std::this_thread::sleep_for(20ms);
        stop.request_stop();

        REQUIRE(consumer.get().error().code() == core::ErrorCode::kCancelled);
    }

    SECTION("close wakes a blocked consumer")
    {
        auto consumer = std::async(std::launch::async, [&] { return queue.dequeueBlocking(); });
        std::this_thread::sleep_for(20ms);
        queue.close();

        REQUIRE(consumer.get().error().code() == core::ErrorCode::kQueueClosed);
    }
}

TEST_CASE("PriorityCommandQueue keeps per-producer order under contention", "[concurrency][queue]")
{
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 250;

    PriorityCommandQueue queue{16};
    std::atomic<int>     failures{0};

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p)
    {
        producers.emplace_back([&queue, &failures, p] {
            for (int i = 0; i < kPerProducer; ++i)
            {
                auto seq = queue.enqueue(std::to_string(p) + ":" + std::to_string(i),
                                         CommandSource::kKeyboard, kKeyboard);
                if (!seq)
                    ++failures;
            }
        });
    }

    std::vector<int> lastSeen(kProducers, -1);
    core::u64        lastSequence = 0;
    bool             first = true;
    for (int n = 0; n < kProducers * kPerProducer; ++n)
    {
        auto command = queue.dequeueBlocking();
        REQUIRE(command.has_value());

        const auto& text = command->text();
        const auto colon = text.find(':');
        const int producer = std::stoi(text.substr(0, colon));
        const int index = std::stoi(text.substr(colon + 1));

        REQUIRE(index == lastSeen[static_cast<std::size_t>(producer)] + 1);
        lastSeen[static_cast<std::size_t>(producer)] = index;

        if (!first)
            REQUIRE(command->sequence() > lastSequence);
        lastSequence = command->sequence();
        first = false;
    }

    for (auto& t : producers)
        t.join();
    REQUIRE(failures.load() == 0);
    REQUIRE(queue.size() == 0);
}

TEST_CASE("PriorityCommandQueue orders mixed priorities filled concurrently", "[concurrency][queue]")
{
    constexpr int kProducers = 6;
    constexpr int kPerProducer = 100;
    constexpr core::i32 kPriorities[] = {kKeyboard, kVoice, kSystem};

    PriorityCommandQueue queue{kProducers * kPerProducer};
    std::atomic<int>     failures{0};

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p)
    {
        producers.emplace_back([&queue, &failures, &kPriorities, p] {
            for (int i = 0; i < kPerProducer; ++i)
            {
                const core::i32 priority = kPriorities[(p + i) % 3];
                const auto source = priority == kSystem ? CommandSource::kSystem
                                  : priority == kVoice  ? CommandSource::kVoice
                                                        : CommandSource::kKeyboard;
                if (!queue.enqueue(std::to_string(p) + ":" + std::to_string(i), source, priority))
                    ++failures;
            }
        });
    }
    for (auto& t : producers)
        t.join();

    REQUIRE(failures.load() == 0);
    REQUIRE(queue.size() == static_cast<core::usize>(kProducers * kPerProducer));

    std::vector<Command> drained;
    while (auto command = queue.tryDequeue())
        drained.push_back(std::move(*command));

    REQUIRE(drained.size() == static_cast<std::size_t>(kProducers * kPerProducer));
    for (std::size_t n = 1; n < drained.size(); ++n)
    {
        REQUIRE(servedBefore(drained[n - 1], drained[n]));
        REQUIRE_FALSE(servedBefore(drained[n], drained[n - 1]));
    }
    REQUIRE(drained.front().priority() == kSystem);
    REQUIRE(drained.back().priority() == kKeyboard);
}

} // namespace zyppy::concurrency
