/**
 * @file Transcript.cpp
 * @brief Transcript implementation.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/frontend/Transcript.hpp>
#include <zyppy/core/Log.hpp>

#include <format>

namespace zyppy::frontend {

namespace {

constexpr std::chrono::milliseconds kReadSlice{50};

} // namespace

Transcript::Transcript(std::ostream& sink)
    : _sink{sink}
{
}

Transcript::~Transcript()
{
    join();
}

core::ExpectedVoid Transcript::start(concurrency::OutputChannel& channel)
{
    if (_reader.joinable())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "transcript reader already running");
    }
    _reader = std::jthread([this, &channel](std::stop_token st) { consume(st, channel); });
    return {};
}

void Transcript::join()
{
    if (_reader.joinable())
    {
        _reader.request_stop();
        _reader.join();
    }
}

core::usize Transcript::drainAvailable(concurrency::OutputChannel& channel)
{
    core::usize appended = 0;
    while (auto chunk = channel.tryRead())
    {
        append(*chunk);
        if (chunk->isEndOfStream())
        {
            break;
        }
        ++appended;
    }
    return appended;
}

void Transcript::append(const concurrency::OutputChunk& chunk)
{
    std::lock_guard<std::mutex> lock{_mutex};
    if (_ended)
    {
        return;
    }

    switch (chunk.kind)
    {
    case concurrency::ChunkKind::kText:
        _text += chunk.bytes;
        _sink << chunk.bytes;
        ++_chunks;
        break;
    case concurrency::ChunkKind::kFatal: {
        const std::string line = std::format("\n[fatal] {}\n", chunk.bytes);
        _text += line;
        _sink << line;
        _fatal = chunk.bytes;
        ++_chunks;
        break;
    }
    case concurrency::ChunkKind::kEndOfStream:
        _ended = true;
        _endedCv.notify_all();
        break;
    }
    _sink.flush();
}

bool Transcript::waitForEnd(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock{_mutex};
    return _endedCv.wait_for(lock, timeout, [this] { return _ended; });
}

std::string Transcript::text() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _text;
}

bool Transcript::ended() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _ended;
}

bool Transcript::sawFatal() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _fatal.has_value();
}

std::optional<std::string> Transcript::fatalMessage() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _fatal;
}

core::usize Transcript::chunkCount() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _chunks;
}

// Short read slices keep the thread responsive to join() even when the
// engine never closes the channel.
void Transcript::consume(std::stop_token stopToken, concurrency::OutputChannel& channel)
{
    while (!stopToken.stop_requested())
    {
        auto chunk = channel.readFor(kReadSlice);
        if (!chunk)
        {
            continue;
        }
        append(*chunk);
        if (chunk->isEndOfStream())
        {
            break;
        }
    }
    core::Log::debug("frontend", std::format("transcript reader done ({} chunks)", chunkCount()));
}

} // namespace zyppy::frontend
