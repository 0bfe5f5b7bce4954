/**
 * @file PriorityCommandQueue.hpp
 * @brief Bounded, priority-ordered command channel from producers to the
 *        engine worker.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_CONCURRENCY_PRIORITYCOMMANDQUEUE_HPP
    #define ZYPPY_CONCURRENCY_PRIORITYCOMMANDQUEUE_HPP

#include <zyppy/concurrency/Command.hpp>
#include <zyppy/concurrency/CommandHeap.hpp>
#include <zyppy/core/Expected.hpp>
#include <zyppy/core/NonCopyable.hpp>
#include <zyppy/core/Types.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace zyppy::concurrency {

/**
 * @brief What enqueue() does when the queue is at capacity.
 */
enum class OverflowPolicy : core::u8 {
    kBlock = 0, ///< Block the producer until space frees up (backpressure).
    kReject     ///< Fail immediately with ErrorCode::kQueueFull.
};

/**
 * @class PriorityCommandQueue
 * @brief Many-producer, single-consumer bounded priority queue.
 *
 * Commands are served in (priority desc, sequence asc) order regardless of
 * how producer threads interleave.  Sequence numbers are assigned under the
 * queue lock at the moment a command is admitted, so they also record the
 * admission order.
 *
 * Only the engine worker may call dequeueBlocking() / tryDequeue().
 *
 * @par Wake-ups
 * wakeConsumer() sets a sticky flag that makes the current (or the next)
 * dequeueBlocking() return ErrorCode::kInterrupted.  The introspection
 * bridge uses it so that a worker parked on "needs input" still services
 * read-only tasks.
 */
class PriorityCommandQueue final : public core::NonMovable<PriorityCommandQueue>
{
public:
    /**
     * @param capacity Maximum number of queued commands; must be positive.
     * @param policy   Behaviour of enqueue() at capacity.
     */
    explicit PriorityCommandQueue(core::usize capacity,
                                  OverflowPolicy policy = OverflowPolicy::kBlock);

    ~PriorityCommandQueue();

    // --------------------------------------------------------------------- //
    //  Producer side                                                         //
    // --------------------------------------------------------------------- //

    /**
     * @brief Validates and inserts a command, applying the overflow policy.
     * @return The sequence number assigned to the command, or
     *         kInvalidEncoding (line discarded and logged), kQueueFull
     *         (kReject policy only), kQueueClosed.
     */
    [[nodiscard]] core::Expected<core::u64> enqueue(std::string text,
                                                    CommandSource source,
                                                    core::i32 priority);

    /** @brief Like enqueue() but never blocks; kQueueFull at capacity. */
    [[nodiscard]] core::Expected<core::u64> tryEnqueue(std::string text,
                                                       CommandSource source,
                                                       core::i32 priority);

    /** @brief Blocks at most @p timeout for space; kTimeout on expiry. */
    [[nodiscard]] core::Expected<core::u64> enqueueFor(std::string text,
                                                       CommandSource source,
                                                       core::i32 priority,
                                                       std::chrono::milliseconds timeout);

    // --------------------------------------------------------------------- //
    //  Consumer side                                                         //
    // --------------------------------------------------------------------- //

    /**
     * @brief Blocks until a command is available and removes the next one.
     * @param stopToken Cancels the wait (force-quit path).
     * @return The command, or kInterrupted (wakeConsumer()), kCancelled
     *         (stop requested), kQueueClosed.
     */
    [[nodiscard]] core::Expected<Command> dequeueBlocking(std::stop_token stopToken = {});

    /** @brief Removes the next command if one is queued. */
    [[nodiscard]] std::optional<Command> tryDequeue();

    /** @brief Makes the consumer's current or next blocking dequeue return. */
    void wakeConsumer();

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    /**
     * @brief Closes the queue.  Idempotent.
     *
     * Queued commands are discarded; blocked producers and the consumer are
     * released with kQueueClosed.
     * @return Number of commands discarded by this call.
     */
    core::usize close();

    [[nodiscard]] core::usize    size()     const;
    [[nodiscard]] core::usize    capacity() const noexcept { return _capacity; }
    [[nodiscard]] OverflowPolicy policy()   const noexcept { return _policy; }
    [[nodiscard]] bool           isClosed() const;

private:
    enum class AdmitMode : core::u8 { kWait, kNoWait, kDeadline };

    core::Expected<core::u64> admit(std::string text,
                                    CommandSource source,
                                    core::i32 priority,
                                    AdmitMode mode,
                                    std::chrono::steady_clock::time_point deadline);

    Command popLocked();

    const core::usize            _capacity;
    const OverflowPolicy         _policy;

    mutable std::mutex           _mutex;
    std::condition_variable_any  _notEmpty;
    std::condition_variable      _notFull;
    CommandHeap                  _heap;
    core::u64                    _nextSequence{0};
    bool                         _closed{false};
    bool                         _wakeRequested{false};
    bool                         _consumerWaiting{false};
};

} // namespace zyppy::concurrency

#endif // ZYPPY_CONCURRENCY_PRIORITYCOMMANDQUEUE_HPP
