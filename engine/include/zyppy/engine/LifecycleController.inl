/**
 * @file LifecycleController.inl
 * @brief Template implementation of LifecycleController.
 * @see   LifecycleController.hpp
 */

#ifndef ZYPPY_ENGINE_LIFECYCLECONTROLLER_INL
    #define ZYPPY_ENGINE_LIFECYCLECONTROLLER_INL

#include <zyppy/core/Log.hpp>

#include <algorithm>
#include <chrono>
#include <format>

namespace zyppy::engine {

template <typename State>
LifecycleController<State>::LifecycleController(Config config,
                                                std::unique_ptr<IInterpreter<State>> interpreter,
                                                State initialState)
    : _config{std::move(config)}
    , _commands{_config.commandCapacity(), _config.overflowPolicy()}
    , _output{_config.outputCapacity()}
    , _bridge{}
    , _worker{std::move(interpreter), std::move(initialState), _commands, _output, _bridge,
              _config.quitDirective()}
{
}

template <typename State>
LifecycleController<State>::~LifecycleController()
{
    if (auto outcome = shutdown(); !outcome)
    {
        core::Log::error("lifecycle", outcome.error().describe());
    }
}

template <typename State>
core::ExpectedVoid LifecycleController<State>::start()
{
    std::lock_guard<std::mutex> lock{_lifecycleMutex};

    if (_started || _shutdownDone)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "session already started");
    }

    ZYPPY_TRY_VOID(_worker.start());
    _started = true;

    if (!_worker.waitUntilRunning(_config.startupTimeout()))
    {
        core::Log::error("lifecycle", "engine worker did not report readiness");
        _worker.requestStop();
        return core::makeError(core::ErrorCode::kTimeout,
                               std::format("engine worker not running after {} ms",
                                           _config.startupTimeout().count()));
    }

    core::Log::info("lifecycle", std::format("session started (commands: {}, output: {})",
                                             _config.commandCapacity(), _config.outputCapacity()));
    return {};
}

template <typename State>
core::Expected<core::u64> LifecycleController<State>::submit(std::string text,
                                                              concurrency::CommandSource source)
{
    {
        std::lock_guard<std::mutex> lock{_lifecycleMutex};
        if (!_started)
        {
            return core::makeError(core::ErrorCode::kInvalidState, "session not started");
        }
    }

    if (source != concurrency::CommandSource::kSystem && _config.isControlDirective(text))
    {
        core::Log::debug("lifecycle", std::format("'{}' from {} promoted to a system command", text,
                                                  concurrency::commandSourceName(source)));
        source = concurrency::CommandSource::kSystem;
    }

    // Not under the lifecycle lock: enqueue may block on backpressure.
    return _commands.enqueue(std::move(text), source, _config.priorityFor(source));
}

template <typename State>
core::Expected<ShutdownOutcome> LifecycleController<State>::shutdown()
{
    std::lock_guard<std::mutex> lock{_lifecycleMutex};

    if (_shutdownDone)
    {
        return ShutdownOutcome::kAlreadyStopped;
    }
    _shutdownDone = true;

    if (!_started)
    {
        _bridge.close();
        _commands.close();
        _output.close();
        return ShutdownOutcome::kAlreadyStopped;
    }

    if (_worker.state() == WorkerState::kStopped)
    {
        _worker.join();
        return ShutdownOutcome::kAlreadyStopped;
    }

    using Clock = std::chrono::steady_clock;
    const auto timeout  = _config.shutdownTimeout();
    const auto deadline = Clock::now() + timeout;

    auto quit = _commands.enqueueFor(_config.quitDirective(),
                                     concurrency::CommandSource::kSystem,
                                     _config.priorityFor(concurrency::CommandSource::kSystem),
                                     timeout);
    if (!quit && quit.error().code() != core::ErrorCode::kQueueClosed)
    {
        core::Log::warn("lifecycle", std::format("could not enqueue quit directive: {}",
                                                 quit.error().describe()));
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (_worker.waitUntilStopped(std::max(remaining, std::chrono::milliseconds{0})))
    {
        _worker.join();
        core::Log::info("lifecycle", "session stopped gracefully");
        return ShutdownOutcome::kGraceful;
    }

    core::Log::warn("lifecycle", std::format("graceful shutdown timed out after {} ms; forcing",
                                             timeout.count()));
    _worker.requestStop();
    _commands.close();
    _output.close();

    if (!_worker.waitUntilStopped(timeout))
    {
        return core::makeError(core::ErrorCode::kTimeout,
                               "engine worker ignored cancellation; it is blocked inside the interpreter");
    }

    _worker.join();
    return ShutdownOutcome::kForced;
}

} // namespace zyppy::engine

#endif // ZYPPY_ENGINE_LIFECYCLECONTROLLER_INL
