/**
 * @file EngineWorker.hpp
 * @brief The single thread that owns engine state and drives the
 *        interpreter.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_ENGINE_ENGINEWORKER_HPP
    #define ZYPPY_ENGINE_ENGINEWORKER_HPP

#include <zyppy/concurrency/IntrospectionBridge.hpp>
#include <zyppy/concurrency/OutputChannel.hpp>
#include <zyppy/concurrency/PriorityCommandQueue.hpp>
#include <zyppy/engine/IInterpreter.hpp>
#include <zyppy/engine/WorkerState.hpp>
#include <zyppy/core/Expected.hpp>
#include <zyppy/core/NonCopyable.hpp>
#include <zyppy/core/Types.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace zyppy::engine {

/**
 * @class EngineWorker
 * @brief Owns the interpreter and its state on a dedicated std::jthread.
 *
 * Loop, repeated while RUNNING:
 *  1. drain the introspection bridge to empty;
 *  2. if the interpreter asked for input, dequeue the next command (the
 *     only blocking point) and feed it;
 *  3. otherwise step once and forward the produced output.
 *
 * The state object is held by value and never handed out; other threads
 * reach it only through the bridge, as a const reference inside a task
 * running on this thread.
 *
 * Leaving RUNNING (quit directive, interpreter quit, fatal error, stop
 * request, closed channel) performs STOPPING: the bridge is closed (pending
 * calls fail with kWorkerStopped), the command queue is closed, the fatal
 * description is written as a kFatal chunk if there is one, the output
 * channel is closed, then the state becomes STOPPED.
 *
 * @tparam State Engine state type.
 */
template <typename State>
class EngineWorker final : public core::NonMovable<EngineWorker<State>>
{
public:
    /**
     * @param interpreter   Execution engine; owned by the worker.
     * @param initialState  Initial engine state; moved into the worker.
     * @param commands      Input channel; must outlive the worker.
     * @param output        Output channel; must outlive the worker.
     * @param bridge        Introspection channel; must outlive the worker.
     * @param quitDirective Text of the system command that stops the worker.
     */
    EngineWorker(std::unique_ptr<IInterpreter<State>> interpreter,
                 State initialState,
                 concurrency::PriorityCommandQueue& commands,
                 concurrency::OutputChannel& output,
                 concurrency::IntrospectionBridge<State>& bridge,
                 std::string quitDirective);

    /** @brief Requests a stop and joins the thread. */
    ~EngineWorker();

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    /** @brief Spawns the thread; kInvalidState when already started. */
    [[nodiscard]] core::ExpectedVoid start();

    /** @brief Waits until the worker has left STARTING. */
    [[nodiscard]] bool waitUntilRunning(std::chrono::milliseconds timeout) const;

    /** @brief Waits until the worker is STOPPED. */
    [[nodiscard]] bool waitUntilStopped(std::chrono::milliseconds timeout) const;

    /**
     * @brief Cooperative cancellation: interrupts a blocked dequeue and
     *        makes the loop exit at its next check.
     */
    void requestStop() noexcept;

    /** @brief Joins the thread if it is joinable. */
    void join();

    // --------------------------------------------------------------------- //
    //  Observers                                                             //
    // --------------------------------------------------------------------- //

    [[nodiscard]] WorkerState                state()      const;
    [[nodiscard]] StopReason                 stopReason() const;
    [[nodiscard]] std::optional<core::Error> fatalError() const;
    [[nodiscard]] WorkerStats                stats()      const noexcept;

private:
    struct Exit
    {
        StopReason                 reason{StopReason::kNone};
        std::optional<core::Error> fatal;
    };

    void run(std::stop_token stopToken);

    /** @brief Step 2 of the loop.  Returns an exit when the worker must stop. */
    std::optional<Exit> serviceInput(std::stop_token stopToken);

    /** @brief Step 3 of the loop.  Returns an exit when the worker must stop. */
    std::optional<Exit> advance();

    void stop(Exit exit);
    void transition(WorkerState next);

    std::unique_ptr<IInterpreter<State>>     _interpreter;
    State                                    _state;
    concurrency::PriorityCommandQueue&       _commands;
    concurrency::OutputChannel&              _output;
    concurrency::IntrospectionBridge<State>& _bridge;
    const std::string                        _quitDirective;

    bool _awaitingInput{false};

    mutable std::mutex              _lifecycleMutex;
    mutable std::condition_variable _lifecycleCv;
    WorkerState                     _workerState{WorkerState::kStarting};
    StopReason                      _stopReason{StopReason::kNone};
    std::optional<core::Error>      _fatal;
    bool                            _started{false};

    std::atomic<core::u64> _steps{0};
    std::atomic<core::u64> _commandsConsumed{0};
    std::atomic<core::u64> _introspections{0};
    std::atomic<core::u64> _chunksWritten{0};

    std::jthread _thread;
};

} // namespace zyppy::engine

    #include "EngineWorker.inl"

#endif // ZYPPY_ENGINE_ENGINEWORKER_HPP
