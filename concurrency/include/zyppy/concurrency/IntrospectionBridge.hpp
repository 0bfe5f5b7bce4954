/**
 * @file IntrospectionBridge.hpp
 * @brief Runs read-only queries on the engine worker on behalf of other
 *        threads and hands the result back by value.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_CONCURRENCY_INTROSPECTIONBRIDGE_HPP
    #define ZYPPY_CONCURRENCY_INTROSPECTIONBRIDGE_HPP

#include <zyppy/core/Expected.hpp>
#include <zyppy/core/NonCopyable.hpp>
#include <zyppy/core/Types.hpp>

#include <concepts>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>

namespace zyppy::concurrency {

/**
 * @brief A read-only operation over engine state.
 *
 * The operation receives the state by const reference and returns plain
 * data; the bridge copies that result out to the calling thread.
 */
template <typename Op, typename State>
concept IntrospectionOp = std::invocable<Op&, const State&>;

/**
 * @class IntrospectionBridge
 * @brief Task channel consumed only by the engine worker.
 *
 * call() posts a task and blocks until the worker has run it.  The worker
 * calls drain() before every unit of execution, so an operation always
 * sees the state between two complete steps and never concurrently with
 * one.  Nothing here locks the engine state itself; the only lock guards
 * the task FIFO.
 *
 * call() must not be invoked from the worker thread: the worker would wait
 * on a task only it can run.
 *
 * @par Usage
 * @code{.cpp}
 *   auto room = bridge.call([](const GameState& s) { return s.location; });
 *   if (room) render(*room);
 * @endcode
 *
 * @tparam State Engine state type owned by the worker.
 */
template <typename State>
class IntrospectionBridge final : public core::NonMovable<IntrospectionBridge<State>>
{
public:
    using WakeHook = std::function<void()>;

    IntrospectionBridge() = default;

    /** @brief Fails every task still pending with kWorkerStopped. */
    ~IntrospectionBridge();

    // --------------------------------------------------------------------- //
    //  Caller side                                                           //
    // --------------------------------------------------------------------- //

    /**
     * @brief Runs @p op on the worker and returns its result.
     *
     * If @p op throws, the exception is captured on the worker and rethrown
     * here unchanged; the worker keeps servicing later tasks.
     *
     * @return The value returned by @p op (copied), or kWorkerStopped when
     *         the bridge is closed before the task runs.
     */
    template <typename Op>
        requires IntrospectionOp<Op, State>
    [[nodiscard]] auto call(Op&& op)
        -> core::Expected<std::remove_cvref_t<std::invoke_result_t<Op&, const State&>>>;

    // --------------------------------------------------------------------- //
    //  Worker side                                                           //
    // --------------------------------------------------------------------- //

    /**
     * @brief Runs pending tasks one at a time, in posting order, until the
     *        FIFO is empty (tasks posted meanwhile included).
     * @return Number of tasks serviced.
     */
    core::usize drain(const State& state);

    /**
     * @brief Rejects further calls and fails pending ones with
     *        kWorkerStopped.  Idempotent.
     * @return Number of pending tasks failed by this call.
     */
    core::usize close();

    /** @brief Hook invoked (outside the lock) after every successful post. */
    void setWakeHook(WakeHook hook);

    [[nodiscard]] core::usize pending()  const;
    [[nodiscard]] bool        isClosed() const;

private:
    struct Task
    {
        std::function<void(const State&)> run;
        std::function<void()>              abandon;
    };

    bool post(Task task);

    mutable std::mutex _mutex;
    std::deque<Task>   _tasks;
    WakeHook           _wakeHook;
    bool               _closed{false};
};

} // namespace zyppy::concurrency

    #include "IntrospectionBridge.inl"

#endif // ZYPPY_CONCURRENCY_INTROSPECTIONBRIDGE_HPP
