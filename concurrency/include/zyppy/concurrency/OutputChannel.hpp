/**
 * @file OutputChannel.hpp
 * @brief Bounded FIFO of output chunks from the engine to display
 *        consumers, terminated by an explicit end-of-stream marker.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_CONCURRENCY_OUTPUTCHANNEL_HPP
    #define ZYPPY_CONCURRENCY_OUTPUTCHANNEL_HPP

#include <zyppy/core/Expected.hpp>
#include <zyppy/core/NonCopyable.hpp>
#include <zyppy/core/Types.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace zyppy::concurrency {

/**
 * @brief Kind of an output chunk.
 */
enum class ChunkKind : core::u8 {
    kText = 0,    ///< Ordinary interpreter output.
    kFatal,       ///< Tagged EngineFatal description, emitted once before EOS.
    kEndOfStream  ///< Terminal marker; nothing follows it.
};

/**
 * @struct OutputChunk
 * @brief Opaque payload; only the consumer interprets formatting.
 */
struct OutputChunk
{
    ChunkKind   kind{ChunkKind::kText};
    std::string bytes;

    [[nodiscard]] static OutputChunk text(std::string bytes)  { return {ChunkKind::kText, std::move(bytes)}; }
    [[nodiscard]] static OutputChunk fatal(std::string bytes) { return {ChunkKind::kFatal, std::move(bytes)}; }
    [[nodiscard]] static OutputChunk endOfStream()            { return {ChunkKind::kEndOfStream, {}}; }

    [[nodiscard]] bool isEndOfStream() const noexcept { return kind == ChunkKind::kEndOfStream; }
    [[nodiscard]] bool isFatal()       const noexcept { return kind == ChunkKind::kFatal; }

    bool operator==(const OutputChunk&) const = default;
};

/**
 * @class OutputChannel
 * @brief Blocking bounded FIFO with a sticky end-of-stream.
 *
 * write() blocks while the channel is full, so output is never dropped.
 * close() records the end-of-stream without occupying a slot, therefore it
 * never blocks.  Readers receive every chunk written before close(), in
 * order, and then EndOfStream forever.
 */
class OutputChannel final : public core::NonMovable<OutputChannel>
{
public:
    /** @param capacity Maximum number of buffered chunks; must be positive. */
    explicit OutputChannel(core::usize capacity);

    ~OutputChannel();

    /**
     * @brief Appends a text or fatal chunk, blocking while full.
     * @return kQueueClosed once the channel is closed (including writers
     *         still blocked when close() happens), kInvalidArgument for an
     *         end-of-stream chunk (use close()).
     */
    [[nodiscard]] core::ExpectedVoid write(OutputChunk chunk);

    [[nodiscard]] core::ExpectedVoid writeText(std::string bytes)  { return write(OutputChunk::text(std::move(bytes))); }
    [[nodiscard]] core::ExpectedVoid writeFatal(std::string bytes) { return write(OutputChunk::fatal(std::move(bytes))); }

    /**
     * @brief Records the end-of-stream marker.
     * @return true for the call that actually closed the channel.
     */
    bool close();

    /** @brief Blocks until a chunk or EndOfStream is available. */
    [[nodiscard]] OutputChunk readBlocking();

    /** @brief Non-blocking read; std::nullopt when nothing is ready yet. */
    [[nodiscard]] std::optional<OutputChunk> tryRead();

    /** @brief Blocks at most @p timeout; std::nullopt on expiry. */
    [[nodiscard]] std::optional<OutputChunk> readFor(std::chrono::milliseconds timeout);

    [[nodiscard]] core::usize size()     const;
    [[nodiscard]] core::usize capacity() const noexcept { return _capacity; }
    [[nodiscard]] bool        isClosed() const;

private:
    OutputChunk popLocked();

    const core::usize       _capacity;

    mutable std::mutex      _mutex;
    std::condition_variable _notEmpty;
    std::condition_variable _notFull;
    std::deque<OutputChunk> _chunks;
    bool                    _closed{false};
};

} // namespace zyppy::concurrency

#endif // ZYPPY_CONCURRENCY_OUTPUTCHANNEL_HPP
