/**
 * @file main.cpp
 * @brief zyppy console front-end: TinyAdventure behind the concurrency
 *        bridge, stdin as the keyboard producer, stdout as the transcript.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/core/Constants.hpp>
#include <zyppy/core/Log.hpp>
#include <zyppy/demo/TinyAdventure.hpp>
#include <zyppy/engine/Config.hpp>
#include <zyppy/engine/LifecycleController.hpp>
#include <zyppy/frontend/ConsoleProducer.hpp>
#include <zyppy/frontend/ScriptedProducer.hpp>
#include <zyppy/frontend/StatusPanel.hpp>
#include <zyppy/frontend/Transcript.hpp>

#include <unistd.h>

#include <charconv>
#include <cstdio>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace zyppy;

namespace {

// ─── Command line ─────────────────────────────────────────────

struct Options
{
    std::optional<std::string> script;
    core::usize                commandCapacity{core::kDefaultCommandCapacity};
    core::usize                outputCapacity{core::kDefaultOutputCapacity};
    std::chrono::milliseconds  shutdownTimeout{core::kDefaultShutdownTimeout};
    core::LogLevel             logLevel{core::LogLevel::kWarn};
    bool                       status{false};
    bool                       help{false};
};

constexpr std::string_view kUsage =
    "usage: zyppy [options]\n"
    "  --script <file>            submit the file's lines as voice commands\n"
    "  --command-capacity <n>     command queue capacity (default 2048)\n"
    "  --output-capacity <n>      output channel capacity (default 2048)\n"
    "  --shutdown-timeout-ms <n>  graceful shutdown budget (default 2000)\n"
    "  --log-level <level>        debug|info|warn|error (default warn)\n"
    "  --status                   print the status panel after each turn\n"
    "  --help                     show this message\n"
    "while playing, !! repeats the last command and !-N the N-th last\n";

core::Expected<core::usize> parseCount(std::string_view flag, std::string_view text)
{
    core::usize value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("{} expects a non-negative integer, got '{}'", flag, text));
    }
    return value;
}

core::Expected<Options> parseOptions(int argc, char** argv)
{
    Options options;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view flag{argv[i]};

        if (flag == "--help" || flag == "-h")
        {
            options.help = true;
            continue;
        }
        if (flag == "--status")
        {
            options.status = true;
            continue;
        }

        if (i + 1 >= argc)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument, std::format("{} expects a value", flag));
        }
        const std::string_view value{argv[++i]};

        if (flag == "--script")
        {
            options.script = std::string{value};
        }
        else if (flag == "--command-capacity")
        {
            options.commandCapacity = ZYPPY_TRY(parseCount(flag, value));
        }
        else if (flag == "--output-capacity")
        {
            options.outputCapacity = ZYPPY_TRY(parseCount(flag, value));
        }
        else if (flag == "--shutdown-timeout-ms")
        {
            options.shutdownTimeout = std::chrono::milliseconds{ZYPPY_TRY(parseCount(flag, value))};
        }
        else if (flag == "--log-level")
        {
            options.logLevel = ZYPPY_TRY(core::parseLogLevel(value));
        }
        else
        {
            return core::makeError(core::ErrorCode::kInvalidArgument, std::format("unknown option '{}'", flag));
        }
    }
    return options;
}

// ─── Session helpers ──────────────────────────────────────────

using Session = engine::LifecycleController<demo::AdventureState>;

constexpr std::chrono::milliseconds kTick{100};

void printStatus(Session& session)
{
    auto panel = frontend::refreshStatus(session, [](const demo::AdventureState& state) {
        return demo::describeStatus(state);
    });
    if (panel)
    {
        std::cerr << "\n-- status --\n" << *panel << "------------\n";
    }
}

} // namespace

// ─── MAIN ─────────────────────────────────────────────────────

int main(int argc, char** argv)
{
    auto options = parseOptions(argc, argv);
    if (!options)
    {
        std::cerr << "zyppy: " << options.error().message() << "\n\n" << kUsage;
        return 2;
    }
    if (options->help)
    {
        std::cout << kUsage;
        return 0;
    }

    core::Log::setMinLevel(options->logLevel);

    auto config = engine::Config::Builder{}
                      .commandCapacity(options->commandCapacity)
                      .outputCapacity(options->outputCapacity)
                      .shutdownTimeout(options->shutdownTimeout)
                      .build();
    if (!config)
    {
        std::cerr << "zyppy: " << config.error().message() << '\n';
        return 2;
    }

    std::vector<std::string> scriptLines;
    if (options->script)
    {
        auto loaded = frontend::ScriptedProducer::loadScript(*options->script);
        if (!loaded)
        {
            std::cerr << "zyppy: " << loaded.error().message() << '\n';
            return 2;
        }
        scriptLines = std::move(*loaded);
    }

    // 1. Session: queues, bridge and worker; RUNNING before anything submits.
    Session session{std::move(*config), std::make_unique<demo::TinyAdventure>(), demo::newAdventure()};
    if (auto started = session.start(); !started)
    {
        core::Log::fatal("zyppy", started.error().describe());
        return 1;
    }

    // 2. Display surface.
    frontend::Transcript transcript{std::cout};
    if (auto reading = transcript.start(session.output()); !reading)
    {
        core::Log::fatal("zyppy", reading.error().describe());
        return 1;
    }

    // 3. Producers.
    frontend::SubmitFn submit = [&session](std::string text, concurrency::CommandSource source) {
        return session.submit(std::move(text), source);
    };

    frontend::ConsoleProducer keyboard{STDIN_FILENO, concurrency::CommandSource::kKeyboard};
    std::unique_ptr<frontend::ScriptedProducer> voice;
    if (!scriptLines.empty())
    {
        voice = std::make_unique<frontend::ScriptedProducer>(std::move(scriptLines),
                                                             concurrency::CommandSource::kVoice);
        if (auto ok = voice->start(submit); !ok)
        {
            core::Log::error("zyppy", ok.error().describe());
        }
    }
    if (auto ok = keyboard.start(submit); !ok)
    {
        core::Log::error("zyppy", ok.error().describe());
    }

    // 4. Run until the game ends or every producer is exhausted.
    core::u64 lastConsumed = 0;
    while (!transcript.waitForEnd(kTick))
    {
        const auto stats = session.stats();
        if (options->status && stats.commandsConsumed != lastConsumed)
        {
            lastConsumed = stats.commandsConsumed;
            printStatus(session);
        }

        const bool producersDone = keyboard.isFinished() && (!voice || voice->isFinished());
        const core::u64 submitted = keyboard.linesSubmitted() + (voice ? voice->linesSubmitted() : 0);
        if (producersDone && stats.commandsConsumed >= submitted)
        {
            break;
        }
    }

    // 5. Teardown: quit directive first, force-quit on timeout.
    keyboard.stop();
    if (voice)
    {
        voice->stop();
    }

    auto outcome = session.shutdown();
    transcript.join();
    std::cout << std::endl;

    if (!outcome)
    {
        core::Log::error("zyppy", outcome.error().describe());
        return 1;
    }
    core::Log::info("zyppy", std::format("session ended ({}, {})",
                                         engine::shutdownOutcomeName(*outcome),
                                         engine::stopReasonName(session.stopReason())));
    return transcript.sawFatal() ? 1 : 0;
}
