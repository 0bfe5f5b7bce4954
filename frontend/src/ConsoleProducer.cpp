/**
 * @file ConsoleProducer.cpp
 * @brief ConsoleProducer implementation (POSIX poll/read).
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/frontend/ConsoleProducer.hpp>
#include <zyppy/core/Log.hpp>

#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <optional>

namespace zyppy::frontend {

namespace {

constexpr int kPollSliceMs = 50;

} // namespace

ConsoleProducer::ConsoleProducer(int fd, concurrency::CommandSource source, core::usize maxLineLength)
    : _fd{fd}
    , _source{source}
    , _maxLineLength{maxLineLength}
{
}

ConsoleProducer::~ConsoleProducer()
{
    stop();
}

core::ExpectedVoid ConsoleProducer::start(SubmitFn submit)
{
    if (_started)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "console producer already started");
    }
    if (!submit)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "console producer needs a submit function");
    }

    _submit  = std::move(submit);
    _started = true;
    _reader  = std::jthread([this](std::stop_token st) { readerLoop(st); });

    core::Log::info("frontend", std::format("console producer reading fd {}", _fd));
    return {};
}

void ConsoleProducer::stop() noexcept
{
    if (_reader.joinable())
    {
        _reader.request_stop();
        _reader.join();
    }
}

bool ConsoleProducer::isFinished() const noexcept
{
    return _finished.load(std::memory_order_acquire);
}

core::u64 ConsoleProducer::linesSubmitted() const noexcept
{
    return _submitted.load(std::memory_order_relaxed);
}

std::vector<std::string> ConsoleProducer::historySnapshot() const
{
    std::lock_guard<std::mutex> lock{_historyMutex};
    return _history.entries();
}

void ConsoleProducer::readerLoop(std::stop_token stopToken)
{
    std::array<char, 512> buffer{};
    std::string           pending;
    bool                  open = true;
    bool                  discarding = false; // inside an overlong line

    while (open && !stopToken.stop_requested())
    {
        pollfd pfd{_fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kPollSliceMs);
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            core::Log::error("frontend", std::format("poll on fd {} failed: {}", _fd, std::strerror(errno)));
            break;
        }
        if (ready == 0)
        {
            continue;
        }

        const ssize_t n = ::read(_fd, buffer.data(), buffer.size());
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
            {
                continue;
            }
            core::Log::error("frontend", std::format("read on fd {} failed: {}", _fd, std::strerror(errno)));
            break;
        }
        if (n == 0)
        {
            // EOF: an unterminated last line still counts.
            if (!pending.empty() && !discarding)
            {
                submitLine(pending);
                pending.clear();
            }
            break;
        }

        pending.append(buffer.data(), static_cast<core::usize>(n));

        std::string::size_type newline;
        while (open && (newline = pending.find('\n')) != std::string::npos)
        {
            const std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (discarding)
            {
                discarding = false;
                continue;
            }
            if (line.size() > _maxLineLength)
            {
                core::Log::warn("frontend", std::format("console line of {} bytes discarded (limit {})",
                                                        line.size(), _maxLineLength));
                continue;
            }
            open = submitLine(line);
        }

        if (pending.size() > _maxLineLength)
        {
            core::Log::warn("frontend", std::format("console line over {} bytes discarded", _maxLineLength));
            pending.clear();
            discarding = true;
        }
    }

    _finished.store(true, std::memory_order_release);
    core::Log::debug("frontend", std::format("console producer finished after {} lines", linesSubmitted()));
}

bool ConsoleProducer::submitLine(std::string_view raw)
{
    std::string line = trimLine(raw);
    if (line.empty())
    {
        return true;
    }

    if (const auto back = parseRecall(line))
    {
        std::optional<std::string> recalled;
        {
            std::lock_guard<std::mutex> lock{_historyMutex};
            recalled = _history.recall(*back);
        }
        if (!recalled)
        {
            core::Log::warn("frontend", std::format("'{}': no such history entry", line));
            return true;
        }
        core::Log::info("frontend", std::format("'{}' recalls '{}'", line, *recalled));
        line = std::move(*recalled);
    }

    auto seq = _submit(line, _source);
    if (seq || seq.error().code() == core::ErrorCode::kQueueFull)
    {
        std::lock_guard<std::mutex> lock{_historyMutex};
        _history.record(line);
    }

    if (seq)
    {
        _submitted.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    if (seq.error().code() == core::ErrorCode::kQueueClosed || seq.error().code() == core::ErrorCode::kInvalidState)
    {
        core::Log::info("frontend", "console producer: command queue closed");
        return false;
    }

    core::Log::warn("frontend", std::format("console line dropped: {}", seq.error().describe()));
    return true;
}

} // namespace zyppy::frontend
