/**
 * @file Transcript.hpp
 * @brief Output consumer mirroring the engine's OutputChannel to a stream.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#pragma once

#ifndef ZYPPY_FRONTEND_TRANSCRIPT_HPP
    #define ZYPPY_FRONTEND_TRANSCRIPT_HPP

#include <zyppy/concurrency/OutputChannel.hpp>
#include <zyppy/core/Expected.hpp>
#include <zyppy/core/NonCopyable.hpp>
#include <zyppy/core/Types.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <ostream>
#include <stop_token>
#include <string>
#include <thread>

namespace zyppy::frontend {

/**
 * @class Transcript
 * @brief Accumulates engine output and echoes it to a sink stream.
 *
 * Two ways to feed it:
 *  - start() spawns a reader thread that consumes until EndOfStream;
 *  - drainAvailable() empties whatever is ready without blocking, for a UI
 *    that polls on its own timer.
 *
 * Fatal chunks are rendered on their own line as "[fatal] <message>".
 */
class Transcript final : public core::NonMovable<Transcript>
{
public:
    explicit Transcript(std::ostream& sink);
    ~Transcript();

    /** @brief Spawns the reader thread; kInvalidState if already started. */
    [[nodiscard]] core::ExpectedVoid start(concurrency::OutputChannel& channel);

    /**
     * @brief Non-blocking drain of everything currently buffered.
     * @return Number of text/fatal chunks appended.
     */
    core::usize drainAvailable(concurrency::OutputChannel& channel);

    /** @brief Appends one chunk; EndOfStream marks the transcript ended. */
    void append(const concurrency::OutputChunk& chunk);

    /** @brief Waits for EndOfStream; false on timeout. */
    [[nodiscard]] bool waitForEnd(std::chrono::milliseconds timeout) const;

    /** @brief Stops and joins the reader thread, if any. */
    void join();

    [[nodiscard]] std::string                text()         const;
    [[nodiscard]] bool                       ended()        const;
    [[nodiscard]] bool                       sawFatal()     const;
    [[nodiscard]] std::optional<std::string> fatalMessage() const;
    [[nodiscard]] core::usize                chunkCount()   const;

private:
    void consume(std::stop_token stopToken, concurrency::OutputChannel& channel);

    std::ostream& _sink;

    mutable std::mutex                   _mutex;
    mutable std::condition_variable      _endedCv;
    std::string                          _text;
    std::optional<std::string>           _fatal;
    core::usize                          _chunks{0};
    bool                                 _ended{false};

    std::jthread _reader;
};

} // namespace zyppy::frontend

#endif // ZYPPY_FRONTEND_TRANSCRIPT_HPP
