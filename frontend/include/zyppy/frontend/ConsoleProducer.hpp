/**
 * @file ConsoleProducer.hpp
 * @brief Line producer reading a file descriptor (stdin by default).
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#pragma once

#ifndef ZYPPY_FRONTEND_CONSOLEPRODUCER_HPP
    #define ZYPPY_FRONTEND_CONSOLEPRODUCER_HPP

#include <zyppy/frontend/IInputProducer.hpp>
#include <zyppy/frontend/InputHistory.hpp>
#include <zyppy/core/Constants.hpp>
#include <zyppy/core/NonCopyable.hpp>

#include <atomic>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace zyppy::frontend {

/**
 * @class ConsoleProducer
 * @brief Reads newline-terminated lines from a descriptor on a std::jthread.
 *
 * The reader waits with poll(2) in short slices so that stop() is honoured
 * even when nobody types.  Blank lines are skipped.  A line the sink
 * accepts (or turns away only because the queue is full) is recorded in
 * the producer's InputHistory, and "!!" or "!-N" resubmits an entry from
 * it.  A line longer than the length limit is logged and discarded up to
 * its newline.  The descriptor is not owned.
 */
class ConsoleProducer final : public IInputProducer, public core::NonMovable<ConsoleProducer>
{
public:
    explicit ConsoleProducer(int fd = 0,
                             concurrency::CommandSource source = concurrency::CommandSource::kKeyboard,
                             core::usize maxLineLength = core::kMaxLineLength);
    ~ConsoleProducer() override;

    [[nodiscard]] core::ExpectedVoid start(SubmitFn submit) override;
    void stop() noexcept override;
    [[nodiscard]] bool isFinished() const noexcept override;
    [[nodiscard]] const char* name() const noexcept override { return "console"; }

    /** @brief Number of lines accepted by the sink. */
    [[nodiscard]] core::u64 linesSubmitted() const noexcept;

    /** @brief Copy of the history recorded so far. */
    [[nodiscard]] std::vector<std::string> historySnapshot() const;

private:
    void readerLoop(std::stop_token stopToken);

    /** @return false when the sink is closed and reading must end. */
    bool submitLine(std::string_view raw);

    const int                        _fd;
    const concurrency::CommandSource _source;
    const core::usize                _maxLineLength;
    SubmitFn                         _submit;

    mutable std::mutex  _historyMutex;
    InputHistory        _history;

    std::atomic<bool>      _finished{false};
    std::atomic<core::u64> _submitted{0};
    bool                   _started{false};
    std::jthread           _reader;
};

} // namespace zyppy::frontend

#endif // ZYPPY_FRONTEND_CONSOLEPRODUCER_HPP
