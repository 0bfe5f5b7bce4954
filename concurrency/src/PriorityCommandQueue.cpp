/**
 * @file PriorityCommandQueue.cpp
 * @brief Mutex + condition-variable implementation of the command queue.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/concurrency/PriorityCommandQueue.hpp>
#include <zyppy/core/Assert.hpp>
#include <zyppy/core/Log.hpp>
#include <zyppy/core/Utf8.hpp>

#include <format>

namespace zyppy::concurrency {

// -------------------------------------------------------------------------- //
//  Construction / Destruction                                                //
// -------------------------------------------------------------------------- //

PriorityCommandQueue::PriorityCommandQueue(core::usize capacity, OverflowPolicy policy)
    : _capacity{capacity}
    , _policy{policy}
{
    ZYPPY_VERIFY(capacity > 0);
}

PriorityCommandQueue::~PriorityCommandQueue()
{
    close();
}

// -------------------------------------------------------------------------- //
//  Producer side                                                             //
// -------------------------------------------------------------------------- //

core::Expected<core::u64> PriorityCommandQueue::enqueue(std::string text,
                                                        CommandSource source,
                                                        core::i32 priority)
{
    const AdmitMode mode = (_policy == OverflowPolicy::kBlock) ? AdmitMode::kWait
                                                               : AdmitMode::kNoWait;
    return admit(std::move(text), source, priority, mode, {});
}

core::Expected<core::u64> PriorityCommandQueue::tryEnqueue(std::string text,
                                                           CommandSource source,
                                                           core::i32 priority)
{
    return admit(std::move(text), source, priority, AdmitMode::kNoWait, {});
}

core::Expected<core::u64> PriorityCommandQueue::enqueueFor(std::string text,
                                                           CommandSource source,
                                                           core::i32 priority,
                                                           std::chrono::milliseconds timeout)
{
    return admit(std::move(text), source, priority, AdmitMode::kDeadline,
                 std::chrono::steady_clock::now() + timeout);
}

core::Expected<core::u64> PriorityCommandQueue::admit(std::string text,
                                                      CommandSource source,
                                                      core::i32 priority,
                                                      AdmitMode mode,
                                                      std::chrono::steady_clock::time_point deadline)
{
    if (const auto bad = core::findInvalidUtf8(text))
    {
        core::Log::warn("queue", std::format("discarding {} input: invalid UTF-8 at byte {}",
                                             commandSourceName(source), *bad));
        return core::makeError(core::ErrorCode::kInvalidEncoding,
                               std::format("invalid UTF-8 at byte {}", *bad));
    }

    core::u64 sequence = 0;
    {
        std::unique_lock<std::mutex> lock{_mutex};

        const auto hasRoom = [this] { return _closed || _heap.size() < _capacity; };

        switch (mode)
        {
            case AdmitMode::kWait:
                _notFull.wait(lock, hasRoom);
                break;
            case AdmitMode::kNoWait:
                break;
            case AdmitMode::kDeadline:
                if (!_notFull.wait_until(lock, deadline, hasRoom))
                {
                    return core::makeError(core::ErrorCode::kTimeout,
                                           "timed out waiting for command queue space");
                }
                break;
        }

        if (_closed)
        {
            return core::makeError(core::ErrorCode::kQueueClosed, "command queue is closed");
        }

        if (_heap.size() >= _capacity)
        {
            return core::makeError(core::ErrorCode::kQueueFull,
                                   std::format("command queue full ({} commands)", _capacity));
        }

        sequence = _nextSequence++;
        _heap.push(Command{std::move(text), source, priority, sequence});
    }

    _notEmpty.notify_one();
    return sequence;
}

// -------------------------------------------------------------------------- //
//  Consumer side                                                             //
// -------------------------------------------------------------------------- //

core::Expected<Command> PriorityCommandQueue::dequeueBlocking(std::stop_token stopToken)
{
    std::unique_lock<std::mutex> lock{_mutex};

    ZYPPY_ASSERT(!_consumerWaiting);
    _consumerWaiting = true;

    const bool ready = _notEmpty.wait(lock, stopToken, [this] {
        return _closed || _wakeRequested || !_heap.empty();
    });

    _consumerWaiting = false;

    if (!ready)
    {
        return core::makeError(core::ErrorCode::kCancelled, "dequeue cancelled by stop request");
    }

    if (_closed)
    {
        return core::makeError(core::ErrorCode::kQueueClosed, "command queue is closed");
    }

    if (_wakeRequested)
    {
        _wakeRequested = false;
        return core::makeError(core::ErrorCode::kInterrupted, "consumer woken");
    }

    Command next = popLocked();
    lock.unlock();
    _notFull.notify_one();
    return next;
}

std::optional<Command> PriorityCommandQueue::tryDequeue()
{
    std::unique_lock<std::mutex> lock{_mutex};

    if (_closed || _heap.empty())
    {
        return std::nullopt;
    }

    Command next = popLocked();
    lock.unlock();
    _notFull.notify_one();
    return next;
}

void PriorityCommandQueue::wakeConsumer()
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        _wakeRequested = true;
    }
    _notEmpty.notify_all();
}

Command PriorityCommandQueue::popLocked()
{
    return _heap.pop();
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

core::usize PriorityCommandQueue::close()
{
    core::usize discarded = 0;
    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_closed)
        {
            return 0;
        }
        _closed = true;
        discarded = _heap.size();
        _heap.clear();
    }

    _notEmpty.notify_all();
    _notFull.notify_all();

    if (discarded > 0)
    {
        core::Log::info("queue", std::format("closed with {} pending command(s) discarded", discarded));
    }
    return discarded;
}

core::usize PriorityCommandQueue::size() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _heap.size();
}

bool PriorityCommandQueue::isClosed() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _closed;
}

} // namespace zyppy::concurrency
