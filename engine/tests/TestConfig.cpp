/**
 * @file TestConfig.cpp
 * @brief Unit tests for engine::Config::Builder.
 */

#include <catch2/catch_test_macros.hpp>

#include <zyppy/engine/Config.hpp>

#include <chrono>
#include <limits>

namespace zyppy::engine {

using namespace std::chrono_literals;
using concurrency::CommandSource;

TEST_CASE("Config defaults", "[engine][config]")
{
    auto config = Config::Builder{}.build();
    REQUIRE(config.has_value());

    REQUIRE(config->commandCapacity() == 2048);
    REQUIRE(config->outputCapacity() == 2048);
    REQUIRE(config->overflowPolicy() == concurrency::OverflowPolicy::kBlock);
    REQUIRE(config->quitDirective() == ":quit");
    REQUIRE(config->shutdownTimeout() == 2000ms);

    REQUIRE(config->priorityFor(CommandSource::kKeyboard) == 0);
    REQUIRE(config->priorityFor(CommandSource::kVoice) == 1);
    REQUIRE(config->priorityFor(CommandSource::kSystem) == std::numeric_limits<core::i32>::max());

    REQUIRE(config->isControlDirective(":undo"));
    REQUIRE(config->isControlDirective(":cancel"));
    REQUIRE_FALSE(config->isControlDirective(":quit"));
    REQUIRE_FALSE(config->isControlDirective(":undo "));
    REQUIRE_FALSE(config->isControlDirective("undo"));
}

TEST_CASE("Config builder applies overrides", "[engine][config]")
{
    auto config = Config::Builder{}
                      .commandCapacity(2)
                      .outputCapacity(3)
                      .overflowPolicy(concurrency::OverflowPolicy::kReject)
                      .keyboardPriority(5)
                      .voicePriority(3)
                      .systemPriority(100)
                      .quitDirective(":exit")
                      .startupTimeout(10ms)
                      .shutdownTimeout(20ms)
                      .build();

    REQUIRE(config.has_value());
    REQUIRE(config->commandCapacity() == 2);
    REQUIRE(config->outputCapacity() == 3);
    REQUIRE(config->overflowPolicy() == concurrency::OverflowPolicy::kReject);
    REQUIRE(config->priorityFor(CommandSource::kKeyboard) == 5);
    REQUIRE(config->priorityFor(CommandSource::kVoice) == 3);
    REQUIRE(config->quitDirective() == ":exit");
    REQUIRE(config->startupTimeout() == 10ms);
}

TEST_CASE("Config builder replaces the control directives", "[engine][config]")
{
    auto config = Config::Builder{}.controlDirectives({"!back"}).build();
    REQUIRE(config.has_value());
    REQUIRE(config->isControlDirective("!back"));
    REQUIRE_FALSE(config->isControlDirective(":undo"));
}

TEST_CASE("Config builder rejects invalid settings", "[engine][config]")
{
    auto expectInvalid = [](const Config::Builder& builder) {
        auto config = builder.build();
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kInvalidArgument);
    };

    expectInvalid(Config::Builder{}.commandCapacity(0));
    expectInvalid(Config::Builder{}.outputCapacity(0));
    expectInvalid(Config::Builder{}.quitDirective(""));
    expectInvalid(Config::Builder{}.shutdownTimeout(0ms));
    expectInvalid(Config::Builder{}.startupTimeout(-5ms));
    expectInvalid(Config::Builder{}.controlDirectives({""}));
    expectInvalid(Config::Builder{}.controlDirectives({":quit"}));
    expectInvalid(Config::Builder{}.systemPriority(1));
    expectInvalid(Config::Builder{}.keyboardPriority(50).systemPriority(50));
}

} // namespace zyppy::engine
