/**
 * @file ScriptedProducer.cpp
 * @brief ScriptedProducer implementation.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/frontend/ScriptedProducer.hpp>
#include <zyppy/frontend/InputHistory.hpp>
#include <zyppy/core/Log.hpp>

#include <condition_variable>
#include <format>
#include <fstream>
#include <mutex>

namespace zyppy::frontend {

ScriptedProducer::ScriptedProducer(std::vector<std::string> lines,
                                   concurrency::CommandSource source,
                                   std::chrono::milliseconds delay)
    : _lines{std::move(lines)}
    , _source{source}
    , _delay{delay}
{
}

ScriptedProducer::~ScriptedProducer()
{
    stop();
}

core::Expected<std::vector<std::string>> ScriptedProducer::loadScript(const std::filesystem::path& path)
{
    std::ifstream in{path};
    if (!in)
    {
        return core::makeError(core::ErrorCode::kIoError,
                               std::format("cannot open script '{}'", path.string()));
    }

    std::vector<std::string> lines;
    std::string              raw;
    while (std::getline(in, raw))
    {
        std::string line = trimLine(raw);
        if (line.empty() || line.front() == '#')
        {
            continue;
        }
        lines.push_back(std::move(line));
    }

    if (in.bad())
    {
        return core::makeError(core::ErrorCode::kIoError,
                               std::format("read error in script '{}'", path.string()));
    }
    return lines;
}

core::ExpectedVoid ScriptedProducer::start(SubmitFn submit)
{
    if (_started)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "scripted producer already started");
    }
    if (!submit)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "scripted producer needs a submit function");
    }

    _submit  = std::move(submit);
    _started = true;
    _worker  = std::jthread([this](std::stop_token st) { run(st); });
    return {};
}

void ScriptedProducer::stop() noexcept
{
    if (_worker.joinable())
    {
        _worker.request_stop();
        _worker.join();
    }
}

void ScriptedProducer::join()
{
    if (_worker.joinable())
    {
        _worker.join();
    }
}

bool ScriptedProducer::isFinished() const noexcept
{
    return _finished.load(std::memory_order_acquire);
}

core::u64 ScriptedProducer::linesSubmitted() const noexcept
{
    return _submitted.load(std::memory_order_relaxed);
}

void ScriptedProducer::run(std::stop_token stopToken)
{
    std::mutex                  pacingMutex;
    std::condition_variable_any pacing;

    for (const auto& raw : _lines)
    {
        if (_delay.count() > 0)
        {
            std::unique_lock<std::mutex> lock{pacingMutex};
            pacing.wait_for(lock, stopToken, _delay, [] { return false; });
        }
        if (stopToken.stop_requested())
        {
            break;
        }

        std::string line = trimLine(raw);
        if (line.empty())
        {
            continue;
        }

        auto seq = _submit(std::move(line), _source);
        if (!seq)
        {
            if (seq.error().code() == core::ErrorCode::kQueueClosed
                || seq.error().code() == core::ErrorCode::kInvalidState)
            {
                break;
            }
            core::Log::warn("frontend", std::format("script line dropped: {}", seq.error().describe()));
            continue;
        }
        _submitted.fetch_add(1, std::memory_order_relaxed);
    }

    _finished.store(true, std::memory_order_release);
    core::Log::debug("frontend", std::format("script producer submitted {}/{} lines", linesSubmitted(), _lines.size()));
}

} // namespace zyppy::frontend
