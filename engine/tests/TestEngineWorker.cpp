/**
 * @file TestEngineWorker.cpp
 * @brief Unit tests for engine::EngineWorker.
 */

#include <catch2/catch_test_macros.hpp>

#include "FakeInterpreters.hpp"

#include <zyppy/engine/EngineWorker.hpp>

#include <chrono>
#include <limits>
#include <memory>

namespace zyppy::engine {

using namespace std::chrono_literals;
using namespace engine::test;
using concurrency::CommandSource;

namespace {

constexpr core::i32 kSystem = std::numeric_limits<core::i32>::max();

template <typename State>
struct Rig
{
    concurrency::PriorityCommandQueue       commands{8};
    concurrency::OutputChannel              output{16};
    concurrency::IntrospectionBridge<State> bridge;
};

} // namespace

TEST_CASE("EngineWorker stops on the quit directive and drops later input", "[engine][worker]")
{
    Rig<EchoState> rig;
    EngineWorker<EchoState> worker{std::make_unique<EchoInterpreter>(), EchoState{},
                                   rig.commands, rig.output, rig.bridge, ":quit"};

    // The directive outranks keyboard lines queued before and after it.
    REQUIRE(rig.commands.enqueue("look", CommandSource::kKeyboard, 0));
    REQUIRE(rig.commands.enqueue(":quit", CommandSource::kSystem, kSystem));
    REQUIRE(rig.commands.enqueue("inventory", CommandSource::kKeyboard, 0));

    REQUIRE(worker.state() == WorkerState::kStarting);
    REQUIRE(worker.start());
    REQUIRE(worker.waitUntilRunning(1s));
    REQUIRE(worker.start().error().code() == core::ErrorCode::kInvalidState);

    auto chunks = readUntilEnd(rig.output);
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks[0].bytes == "> ");

    REQUIRE(worker.waitUntilStopped(1s));
    worker.join();

    REQUIRE(worker.state() == WorkerState::kStopped);
    REQUIRE(worker.stopReason() == StopReason::kQuitDirective);
    REQUIRE_FALSE(worker.fatalError().has_value());
    REQUIRE(worker.stats().commandsConsumed == 1);
    REQUIRE(rig.commands.isClosed());
    REQUIRE(rig.commands.size() == 0);
    REQUIRE(rig.commands.enqueue("late", CommandSource::kKeyboard, 0).error().code() == core::ErrorCode::kQueueClosed);
}

TEST_CASE("EngineWorker treats a typed quit directive as ordinary input", "[engine][worker]")
{
    Rig<EchoState> rig;
    EngineWorker<EchoState> worker{std::make_unique<EchoInterpreter>(), EchoState{},
                                   rig.commands, rig.output, rig.bridge, ":quit"};

    REQUIRE(rig.commands.enqueue(":quit", CommandSource::kKeyboard, 0));
    REQUIRE(rig.commands.enqueue("bye", CommandSource::kKeyboard, 0));
    REQUIRE(worker.start());

    auto chunks = readUntilEnd(rig.output);
    REQUIRE(worker.waitUntilStopped(1s));

    REQUIRE(chunks.size() >= 2);
    REQUIRE(chunks[1].bytes == "heard :quit\n");
    REQUIRE(chunks.back().bytes == "bye!\n");
    REQUIRE(worker.stopReason() == StopReason::kInterpreterQuit);
}

TEST_CASE("EngineWorker services introspection while waiting for input", "[engine][worker]")
{
    Rig<EchoState> rig;
    EngineWorker<EchoState> worker{std::make_unique<EchoInterpreter>(), EchoState{},
                                   rig.commands, rig.output, rig.bridge, ":quit"};
    REQUIRE(worker.start());
    REQUIRE(readUntilText(rig.output, "> "));

    auto waiting = rig.bridge.call([](const EchoState& s) { return s.wantInput; });
    REQUIRE(waiting.value());

    REQUIRE(rig.commands.enqueue("north", CommandSource::kVoice, 1));
    REQUIRE(readUntilText(rig.output, "heard north\n"));

    auto turns = rig.bridge.call([](const EchoState& s) { return s.turns; });
    REQUIRE(turns.value() == 1);

    worker.requestStop();
    REQUIRE(worker.waitUntilStopped(1s));
    REQUIRE(worker.stopReason() == StopReason::kStopRequested);
    REQUIRE(worker.stats().introspectionsServiced == 2);
    REQUIRE(worker.stats().commandsConsumed == 1);
}

TEST_CASE("EngineWorker snapshots never observe a half-finished step", "[engine][worker]")
{
    Rig<PairState> rig;
    EngineWorker<PairState> worker{std::make_unique<BusyInterpreter>(), PairState{},
                                   rig.commands, rig.output, rig.bridge, ":quit"};
    REQUIRE(worker.start());

    core::u64 lastSeen = 0;
    for (int i = 0; i < 200; ++i)
    {
        auto pair = rig.bridge.call([](const PairState& s) { return s; });
        REQUIRE(pair.has_value());
        REQUIRE(pair->a == pair->b);
        REQUIRE(pair->a >= lastSeen);
        lastSeen = pair->a;
    }

    worker.requestStop();
    REQUIRE(worker.waitUntilStopped(1s));
    REQUIRE(rig.output.readBlocking().isEndOfStream());
    REQUIRE(rig.bridge.call([](const PairState& s) { return s.a; }).error().code()
            == core::ErrorCode::kWorkerStopped);
}

TEST_CASE("EngineWorker reports a throwing step as a fatal chunk", "[engine][worker]")
{
    Rig<EchoState> rig;
    EngineWorker<EchoState> worker{std::make_unique<CrashingInterpreter>(), EchoState{},
                                   rig.commands, rig.output, rig.bridge, ":quit"};
    REQUIRE(worker.start());

    auto chunks = readUntilEnd(rig.output);
    REQUIRE(worker.waitUntilStopped(1s));

    REQUIRE(chunks.size() == 2);
    REQUIRE(chunks[0].bytes == "banner\n");
    REQUIRE(chunks[1].isFatal());
    REQUIRE(chunks[1].bytes.find("ENGINE_FATAL") == 0);
    REQUIRE(chunks[1].bytes.find("corrupt story file") != std::string::npos);

    REQUIRE(worker.stopReason() == StopReason::kEngineFatal);
    REQUIRE(worker.fatalError()->code() == core::ErrorCode::kEngineFatal);
    REQUIRE(rig.commands.isClosed());
}

TEST_CASE("EngineWorker treats a failing feedLine as fatal", "[engine][worker]")
{
    Rig<EchoState> rig;
    EngineWorker<EchoState> worker{std::make_unique<EchoInterpreter>(), EchoState{},
                                   rig.commands, rig.output, rig.bridge, ":quit"};
    REQUIRE(rig.commands.enqueue("explode", CommandSource::kKeyboard, 0));
    REQUIRE(worker.start());

    auto chunks = readUntilEnd(rig.output);
    REQUIRE(worker.waitUntilStopped(1s));

    REQUIRE_FALSE(chunks.empty());
    REQUIRE(chunks.back().isFatal());
    REQUIRE(chunks.back().bytes.find("cannot parse 'explode'") != std::string::npos);
    REQUIRE(worker.stopReason() == StopReason::kEngineFatal);
}

TEST_CASE("EngineWorker turns a non-standard exception into a fatal chunk", "[engine][worker]")
{
    SECTION("thrown from step")
    {
        Rig<EchoState> rig;
        EngineWorker<EchoState> worker{std::make_unique<IntThrowingInterpreter>(false), EchoState{},
                                       rig.commands, rig.output, rig.bridge, ":quit"};
        REQUIRE(worker.start());

        auto chunks = readUntilEnd(rig.output);
        REQUIRE(worker.waitUntilStopped(1s));

        REQUIRE(chunks.size() == 1);
        REQUIRE(chunks[0].isFatal());
        REQUIRE(chunks[0].bytes.find("step failed") != std::string::npos);
        REQUIRE(chunks[0].bytes.find("unknown exception") != std::string::npos);
        REQUIRE(rig.output.readBlocking().isEndOfStream());
        REQUIRE(worker.stopReason() == StopReason::kEngineFatal);
    }

    SECTION("thrown from feedLine")
    {
        Rig<EchoState> rig;
        EngineWorker<EchoState> worker{std::make_unique<IntThrowingInterpreter>(true), EchoState{},
                                       rig.commands, rig.output, rig.bridge, ":quit"};
        REQUIRE(rig.commands.enqueue("look", CommandSource::kKeyboard, 0));
        REQUIRE(worker.start());

        auto chunks = readUntilEnd(rig.output);
        REQUIRE(worker.waitUntilStopped(1s));

        REQUIRE_FALSE(chunks.empty());
        REQUIRE(chunks.back().isFatal());
        REQUIRE(chunks.back().bytes.find("feedLine failed") != std::string::npos);
        REQUIRE(chunks.back().bytes.find("unknown exception") != std::string::npos);
        REQUIRE(rig.output.readBlocking().isEndOfStream());
        REQUIRE(worker.stopReason() == StopReason::kEngineFatal);
        REQUIRE(worker.fatalError()->code() == core::ErrorCode::kEngineFatal);
    }
}

TEST_CASE("EngineWorker stops when its command queue is closed", "[engine][worker]")
{
    Rig<EchoState> rig;
    EngineWorker<EchoState> worker{std::make_unique<EchoInterpreter>(), EchoState{},
                                   rig.commands, rig.output, rig.bridge, ":quit"};
    REQUIRE(worker.start());
    REQUIRE(readUntilText(rig.output, "> "));

    rig.commands.close();
    REQUIRE(worker.waitUntilStopped(1s));
    REQUIRE(worker.stopReason() == StopReason::kChannelClosed);
    REQUIRE(rig.output.readBlocking().isEndOfStream());
}

TEST_CASE("EngineWorker destructor stops a running worker", "[engine][worker]")
{
    Rig<PairState> rig;
    {
        EngineWorker<PairState> worker{std::make_unique<BusyInterpreter>(true), PairState{},
                                       rig.commands, rig.output, rig.bridge, ":quit"};
        REQUIRE(worker.start());
        REQUIRE(worker.waitUntilRunning(1s));
        // Nobody reads: the worker ends up blocked on the full output channel.
    }

    REQUIRE(rig.output.isClosed());
    REQUIRE(rig.bridge.isClosed());
}

} // namespace zyppy::engine
