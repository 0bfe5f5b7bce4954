/**
 * @file LifecycleController.hpp
 * @brief Session façade: builds the channels, starts the engine worker and
 *        shuts it down gracefully or by force.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_ENGINE_LIFECYCLECONTROLLER_HPP
    #define ZYPPY_ENGINE_LIFECYCLECONTROLLER_HPP

#include <zyppy/concurrency/Command.hpp>
#include <zyppy/concurrency/IntrospectionBridge.hpp>
#include <zyppy/concurrency/OutputChannel.hpp>
#include <zyppy/concurrency/PriorityCommandQueue.hpp>
#include <zyppy/engine/Config.hpp>
#include <zyppy/engine/EngineWorker.hpp>
#include <zyppy/engine/IInterpreter.hpp>
#include <zyppy/engine/WorkerState.hpp>
#include <zyppy/core/Expected.hpp>
#include <zyppy/core/NonCopyable.hpp>
#include <zyppy/core/Types.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace zyppy::engine {

/** @brief How shutdown() ended the session. */
enum class ShutdownOutcome : core::u8 {
    kGraceful = 0,   ///< The worker consumed the quit directive in time.
    kForced,         ///< The timeout elapsed and the worker was cancelled.
    kAlreadyStopped  ///< Nothing to do: never started, already stopped, or repeated call.
};

[[nodiscard]] std::string_view shutdownOutcomeName(ShutdownOutcome outcome) noexcept;

/**
 * @class LifecycleController
 * @brief Owns one session: command queue, output channel, introspection
 *        bridge and engine worker.
 *
 * Producers may submit only after start() returned successfully, which
 * happens once the worker reports RUNNING.  shutdown() first enqueues the
 * quit directive as a highest-priority system command and waits for the
 * worker to stop; when the shutdown timeout elapses it escalates to
 * cooperative cancellation of the worker's blocking calls.
 *
 * @tparam State Engine state type.
 */
template <typename State>
class LifecycleController final : public core::NonMovable<LifecycleController<State>>
{
public:
    LifecycleController(Config config,
                        std::unique_ptr<IInterpreter<State>> interpreter,
                        State initialState = State{});

    /** @brief Shuts the session down if the caller did not. */
    ~LifecycleController();

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    /**
     * @brief Spawns the worker and waits for it to report RUNNING.
     * @return kInvalidState when called twice, kTimeout when the worker did
     *         not come up within Config::startupTimeout().
     */
    [[nodiscard]] core::ExpectedVoid start();

    /**
     * @brief Graceful shutdown with force-quit escalation.  Idempotent.
     * @return The outcome, or kTimeout when even the forced path could not
     *         stop the worker (it is stuck inside interpreter code).
     */
    [[nodiscard]] core::Expected<ShutdownOutcome> shutdown();

    // --------------------------------------------------------------------- //
    //  Producers / consumers                                                 //
    // --------------------------------------------------------------------- //

    /**
     * @brief Enqueues @p text with the priority configured for @p source.
     *
     * A line that is exactly one of Config::controlDirectives() is sent as
     * a system command whatever its source, so it overtakes queued input.
     * The quit directive is never promoted: only shutdown() sends it.
     * @return The command's sequence number, or kInvalidState before
     *         start(), or any PriorityCommandQueue::enqueue() error.
     */
    [[nodiscard]] core::Expected<core::u64> submit(std::string text, concurrency::CommandSource source);

    /** @brief Forwards to IntrospectionBridge::call(). */
    template <typename Op>
        requires concurrency::IntrospectionOp<Op, State>
    [[nodiscard]] auto call(Op&& op)
    {
        return _bridge.call(std::forward<Op>(op));
    }

    /** @brief Output channel read by the display surface. */
    [[nodiscard]] concurrency::OutputChannel& output() noexcept { return _output; }

    // --------------------------------------------------------------------- //
    //  Observers                                                             //
    // --------------------------------------------------------------------- //

    [[nodiscard]] const Config&              config()      const noexcept { return _config; }
    [[nodiscard]] WorkerState                workerState() const { return _worker.state(); }
    [[nodiscard]] StopReason                 stopReason()  const { return _worker.stopReason(); }
    [[nodiscard]] std::optional<core::Error> fatalError()  const { return _worker.fatalError(); }
    [[nodiscard]] WorkerStats                stats()       const noexcept { return _worker.stats(); }

private:
    Config                                  _config;
    concurrency::PriorityCommandQueue       _commands;
    concurrency::OutputChannel              _output;
    concurrency::IntrospectionBridge<State> _bridge;
    EngineWorker<State>                     _worker;

    std::mutex _lifecycleMutex;
    bool       _started{false};
    bool       _shutdownDone{false};
};

} // namespace zyppy::engine

    #include "LifecycleController.inl"

#endif // ZYPPY_ENGINE_LIFECYCLECONTROLLER_HPP
