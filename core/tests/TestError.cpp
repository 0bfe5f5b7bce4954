/**
 * @file TestError.cpp
 * @brief Unit tests for core::Error, Expected propagation and Log.
 */

#include <catch2/catch_test_macros.hpp>

#include <zyppy/core/Expected.hpp>
#include <zyppy/core/Log.hpp>

#include <string>
#include <vector>

namespace zyppy::core {

namespace {

Expected<int> half(int value)
{
    if (value % 2 != 0)
    {
        return makeError(ErrorCode::kInvalidArgument, "odd value");
    }
    return value / 2;
}

Expected<int> quarter(int value)
{
    const int h = ZYPPY_TRY(half(value));
    return ZYPPY_TRY(half(h));
}

ExpectedVoid requireEven(int value)
{
    ZYPPY_TRY_VOID(half(value).transform([](int) {}));
    return {};
}

struct CapturingLogger final : ILogger
{
    struct Entry
    {
        LogLevel    level;
        std::string tag;
        std::string message;
    };

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;
};

} // namespace

TEST_CASE("Error describe prefixes the code name", "[core][error]")
{
    Error error{ErrorCode::kQueueClosed, "command queue closed"};
    REQUIRE(error.code() == ErrorCode::kQueueClosed);
    REQUIRE(error.message() == "command queue closed");
    REQUIRE(error.describe() == "QUEUE_CLOSED: command queue closed");
    REQUIRE(errorCodeName(ErrorCode::kEngineFatal) == std::string_view{"ENGINE_FATAL"});
}

TEST_CASE("ZYPPY_TRY propagates the first failure", "[core][error]")
{
    auto ok = quarter(8);
    REQUIRE(ok.has_value());
    REQUIRE(*ok == 2);

    auto failed = quarter(6);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code() == ErrorCode::kInvalidArgument);

    REQUIRE(requireEven(4).has_value());
    REQUIRE(requireEven(3).error().message() == "odd value");
}

TEST_CASE("parseLogLevel maps names and rejects unknown ones", "[core][log]")
{
    REQUIRE(parseLogLevel("debug").value() == LogLevel::kDebug);
    REQUIRE(parseLogLevel("error").value() == LogLevel::kError);
    REQUIRE(parseLogLevel("loud").error().code() == ErrorCode::kInvalidArgument);
}

TEST_CASE("Log filters below the minimum level", "[core][log]")
{
    CapturingLogger capture;
    const LogLevel previous = Log::minLevel();
    Log::setLogger(&capture);
    Log::setMinLevel(LogLevel::kWarn);

    Log::info("queue", "dropped");
    Log::warn("queue", "kept");
    Log::error("kept too");

    Log::setLogger(nullptr);
    Log::setMinLevel(previous);

    REQUIRE(capture.entries.size() == 2);
    REQUIRE(capture.entries[0].tag == "queue");
    REQUIRE(capture.entries[0].message == "kept");
    REQUIRE(capture.entries[1].level == LogLevel::kError);
    REQUIRE(capture.entries[1].tag == "zyppy");
}

} // namespace zyppy::core
