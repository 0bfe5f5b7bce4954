/**
 * @file OutputChannel.cpp
 * @brief Mutex + condition-variable implementation of the output channel.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/concurrency/OutputChannel.hpp>
#include <zyppy/core/Assert.hpp>
#include <zyppy/core/Log.hpp>

namespace zyppy::concurrency {

OutputChannel::OutputChannel(core::usize capacity)
    : _capacity{capacity}
{
    ZYPPY_VERIFY(capacity > 0);
}

OutputChannel::~OutputChannel()
{
    close();
}

core::ExpectedVoid OutputChannel::write(OutputChunk chunk)
{
    if (chunk.isEndOfStream())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "end-of-stream is written with close()");
    }

    {
        std::unique_lock<std::mutex> lock{_mutex};
        _notFull.wait(lock, [this] { return _closed || _chunks.size() < _capacity; });

        if (_closed)
        {
            return core::makeError(core::ErrorCode::kQueueClosed, "output channel is closed");
        }

        _chunks.push_back(std::move(chunk));
    }

    _notEmpty.notify_one();
    return {};
}

bool OutputChannel::close()
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_closed)
        {
            return false;
        }
        _closed = true;
    }

    _notEmpty.notify_all();
    _notFull.notify_all();
    core::Log::debug("output", "end of stream");
    return true;
}

OutputChunk OutputChannel::readBlocking()
{
    std::unique_lock<std::mutex> lock{_mutex};
    _notEmpty.wait(lock, [this] { return _closed || !_chunks.empty(); });
    return popLocked();
}

std::optional<OutputChunk> OutputChannel::tryRead()
{
    std::unique_lock<std::mutex> lock{_mutex};
    if (!_closed && _chunks.empty())
    {
        return std::nullopt;
    }
    return popLocked();
}

std::optional<OutputChunk> OutputChannel::readFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock{_mutex};
    if (!_notEmpty.wait_for(lock, timeout, [this] { return _closed || !_chunks.empty(); }))
    {
        return std::nullopt;
    }
    return popLocked();
}

// Real chunks drain first; the end-of-stream is only reported once the
// buffer is empty and then stays sticky for every later read.
OutputChunk OutputChannel::popLocked()
{
    if (_chunks.empty())
    {
        return OutputChunk::endOfStream();
    }

    OutputChunk next = std::move(_chunks.front());
    _chunks.pop_front();
    _notFull.notify_one();
    return next;
}

core::usize OutputChannel::size() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _chunks.size();
}

bool OutputChannel::isClosed() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _closed;
}

} // namespace zyppy::concurrency
