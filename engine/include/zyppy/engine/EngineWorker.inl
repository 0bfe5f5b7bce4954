/**
 * @file EngineWorker.inl
 * @brief Template implementation of EngineWorker.
 * @see   EngineWorker.hpp
 */

#ifndef ZYPPY_ENGINE_ENGINEWORKER_INL
    #define ZYPPY_ENGINE_ENGINEWORKER_INL

#include <zyppy/core/Log.hpp>

#include <exception>
#include <format>
#include <utility>

namespace zyppy::engine {

// -------------------------------------------------------------------------- //
//  Construction / Destruction                                                //
// -------------------------------------------------------------------------- //

template <typename State>
EngineWorker<State>::EngineWorker(std::unique_ptr<IInterpreter<State>> interpreter,
                                  State initialState,
                                  concurrency::PriorityCommandQueue& commands,
                                  concurrency::OutputChannel& output,
                                  concurrency::IntrospectionBridge<State>& bridge,
                                  std::string quitDirective)
    : _interpreter{std::move(interpreter)}
    , _state{std::move(initialState)}
    , _commands{commands}
    , _output{output}
    , _bridge{bridge}
    , _quitDirective{std::move(quitDirective)}
{
    _bridge.setWakeHook([&commands] { commands.wakeConsumer(); });
}

template <typename State>
EngineWorker<State>::~EngineWorker()
{
    if (state() != WorkerState::kStopped)
    {
        // A worker parked on a full output channel only wakes up when the
        // channel closes; the stop token alone cannot reach it.
        requestStop();
        _output.close();
        _commands.close();
    }
    join();
    _bridge.close();
    _bridge.setWakeHook({});
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

template <typename State>
core::ExpectedVoid EngineWorker<State>::start()
{
    {
        std::lock_guard<std::mutex> lock{_lifecycleMutex};
        if (_started)
        {
            return core::makeError(core::ErrorCode::kInvalidState, "engine worker already started");
        }
        _started = true;
    }

    _thread = std::jthread([this](std::stop_token stopToken) { run(std::move(stopToken)); });
    return {};
}

template <typename State>
bool EngineWorker<State>::waitUntilRunning(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock{_lifecycleMutex};
    return _lifecycleCv.wait_for(lock, timeout, [this] {
        return _workerState != WorkerState::kStarting;
    });
}

template <typename State>
bool EngineWorker<State>::waitUntilStopped(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock{_lifecycleMutex};
    return _lifecycleCv.wait_for(lock, timeout, [this] {
        return _workerState == WorkerState::kStopped;
    });
}

template <typename State>
void EngineWorker<State>::requestStop() noexcept
{
    _thread.request_stop();
}

template <typename State>
void EngineWorker<State>::join()
{
    if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id())
    {
        _thread.join();
    }
}

// -------------------------------------------------------------------------- //
//  Observers                                                                 //
// -------------------------------------------------------------------------- //

template <typename State>
WorkerState EngineWorker<State>::state() const
{
    std::lock_guard<std::mutex> lock{_lifecycleMutex};
    return _workerState;
}

template <typename State>
StopReason EngineWorker<State>::stopReason() const
{
    std::lock_guard<std::mutex> lock{_lifecycleMutex};
    return _stopReason;
}

template <typename State>
std::optional<core::Error> EngineWorker<State>::fatalError() const
{
    std::lock_guard<std::mutex> lock{_lifecycleMutex};
    return _fatal;
}

template <typename State>
WorkerStats EngineWorker<State>::stats() const noexcept
{
    return WorkerStats{
        _steps.load(std::memory_order_relaxed),
        _commandsConsumed.load(std::memory_order_relaxed),
        _introspections.load(std::memory_order_relaxed),
        _chunksWritten.load(std::memory_order_relaxed),
    };
}

// -------------------------------------------------------------------------- //
//  Worker thread                                                             //
// -------------------------------------------------------------------------- //

template <typename State>
void EngineWorker<State>::run(std::stop_token stopToken)
{
    transition(WorkerState::kRunning);
    core::Log::info("worker", std::format("running interpreter '{}'", _interpreter->name()));

    std::optional<Exit> exit;
    while (!exit)
    {
        _introspections.fetch_add(_bridge.drain(_state), std::memory_order_relaxed);

        if (stopToken.stop_requested())
        {
            exit = Exit{StopReason::kStopRequested, std::nullopt};
            break;
        }

        exit = _awaitingInput ? serviceInput(stopToken) : advance();
    }

    stop(std::move(*exit));
}

template <typename State>
auto EngineWorker<State>::serviceInput(std::stop_token stopToken) -> std::optional<Exit>
{
    auto command = _commands.dequeueBlocking(stopToken);
    if (!command)
    {
        switch (command.error().code())
        {
            case core::ErrorCode::kInterrupted:
                return std::nullopt;
            case core::ErrorCode::kCancelled:
                return Exit{StopReason::kStopRequested, std::nullopt};
            case core::ErrorCode::kQueueClosed:
                return Exit{StopReason::kChannelClosed, std::nullopt};
            default:
                return Exit{StopReason::kEngineFatal, command.error()};
        }
    }

    _commandsConsumed.fetch_add(1, std::memory_order_relaxed);

    if (command->isDirective(_quitDirective))
    {
        core::Log::info("worker", std::format("quit directive received (#{})", command->sequence()));
        return Exit{StopReason::kQuitDirective, std::nullopt};
    }

    core::Log::debug("worker", std::format("feeding {} command #{} (priority {})",
                                           concurrency::commandSourceName(command->source()),
                                           command->sequence(), command->priority()));

    core::ExpectedVoid fed = [&]() -> core::ExpectedVoid {
        try
        {
            return _interpreter->feedLine(_state, command->text());
        }
        catch (const std::exception& e)
        {
            return core::makeError(core::ErrorCode::kEngineFatal, e.what());
        }
        catch (...)
        {
            return core::makeError(core::ErrorCode::kEngineFatal, "unknown exception");
        }
    }();

    if (!fed)
    {
        return Exit{StopReason::kEngineFatal, core::Error{
            core::ErrorCode::kEngineFatal,
            std::format("{}: feedLine failed: {}", _interpreter->name(), fed.error().describe())}};
    }

    _awaitingInput = false;
    return std::nullopt;
}

template <typename State>
auto EngineWorker<State>::advance() -> std::optional<Exit>
{
    core::Expected<StepResult> result = [&]() -> core::Expected<StepResult> {
        try
        {
            return _interpreter->step(_state);
        }
        catch (const std::exception& e)
        {
            return core::makeError(core::ErrorCode::kEngineFatal, e.what());
        }
        catch (...)
        {
            return core::makeError(core::ErrorCode::kEngineFatal, "unknown exception");
        }
    }();

    if (!result)
    {
        return Exit{StopReason::kEngineFatal, core::Error{
            core::ErrorCode::kEngineFatal,
            std::format("{}: step failed: {}", _interpreter->name(), result.error().describe())}};
    }

    _steps.fetch_add(1, std::memory_order_relaxed);

    if (!result->output.empty())
    {
        if (auto written = _output.writeText(std::move(result->output)); !written)
        {
            core::Log::warn("worker", "output channel closed underneath the worker");
            return Exit{StopReason::kChannelClosed, std::nullopt};
        }
        _chunksWritten.fetch_add(1, std::memory_order_relaxed);
    }

    switch (result->kind)
    {
        case StepResult::Kind::kOutput:
            return std::nullopt;
        case StepResult::Kind::kNeedsInput:
            _awaitingInput = true;
            return std::nullopt;
        case StepResult::Kind::kQuit:
            return Exit{StopReason::kInterpreterQuit, std::nullopt};
    }
    return std::nullopt;
}

template <typename State>
void EngineWorker<State>::stop(Exit exit)
{
    transition(WorkerState::kStopping);
    {
        std::lock_guard<std::mutex> lock{_lifecycleMutex};
        _stopReason = exit.reason;
        _fatal = exit.fatal;
    }

    const core::usize abandoned = _bridge.close();
    const core::usize discarded = _commands.close();

    if (exit.fatal)
    {
        const std::string description = exit.fatal->describe();
        core::Log::error("worker", description);

        if (auto written = _output.writeFatal(description); written)
        {
            _chunksWritten.fetch_add(1, std::memory_order_relaxed);
        }
        else
        {
            core::Log::warn("worker", "fatal error could not be delivered: output channel closed");
        }
    }

    _output.close();

    core::Log::info("worker", std::format("stopped ({}): {} command(s) discarded, {} request(s) abandoned",
                                          stopReasonName(exit.reason), discarded, abandoned));
    transition(WorkerState::kStopped);
}

template <typename State>
void EngineWorker<State>::transition(WorkerState next)
{
    {
        std::lock_guard<std::mutex> lock{_lifecycleMutex};
        _workerState = next;
    }
    _lifecycleCv.notify_all();
    core::Log::debug("worker", std::format("-> {}", workerStateName(next)));
}

} // namespace zyppy::engine

#endif // ZYPPY_ENGINE_ENGINEWORKER_INL
