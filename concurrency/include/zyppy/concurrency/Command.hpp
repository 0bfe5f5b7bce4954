/**
 * @file Command.hpp
 * @brief Immutable submitted input line with source, priority and sequence.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_CONCURRENCY_COMMAND_HPP
    #define ZYPPY_CONCURRENCY_COMMAND_HPP

#include <zyppy/core/Types.hpp>

#include <string>
#include <string_view>

namespace zyppy::concurrency {

/**
 * @brief Producer that submitted a command.
 */
enum class CommandSource : core::u8 {
    kKeyboard = 0,
    kVoice,
    kSystem
};

/** @brief Lower-case name of a source ("keyboard", "voice", "system"). */
[[nodiscard]] std::string_view commandSourceName(CommandSource source) noexcept;

/**
 * @class Command
 * @brief One line of input plus the metadata used to order it.
 *
 * Only PriorityCommandQueue constructs commands; it stamps each one with a
 * sequence number drawn from a per-queue monotonic counter.  Once built a
 * Command is never modified.
 */
class Command final
{
public:
    Command(std::string text, CommandSource source, core::i32 priority, core::u64 sequence)
        : _text{std::move(text)}
        , _source{source}
        , _priority{priority}
        , _sequence{sequence}
    {}

    [[nodiscard]] const std::string& text()     const noexcept { return _text; }
    [[nodiscard]] CommandSource      source()   const noexcept { return _source; }
    [[nodiscard]] core::i32          priority() const noexcept { return _priority; }
    [[nodiscard]] core::u64          sequence() const noexcept { return _sequence; }

    /** @brief True for a system command whose text is exactly @p directive. */
    [[nodiscard]] bool isDirective(std::string_view directive) const noexcept
    {
        return _source == CommandSource::kSystem && _text == directive;
    }

private:
    std::string   _text;
    CommandSource _source;
    core::i32     _priority;
    core::u64     _sequence;
};

/**
 * @brief Service order: higher priority first, then lower sequence first.
 *
 * Sequence numbers are unique within a queue, so this is a strict total
 * order on the commands of one queue: for a != b exactly one of
 * servedBefore(a, b) and servedBefore(b, a) holds.
 */
[[nodiscard]] inline bool servedBefore(const Command& lhs, const Command& rhs) noexcept
{
    if (lhs.priority() != rhs.priority())
        return lhs.priority() > rhs.priority();
    return lhs.sequence() < rhs.sequence();
}

} // namespace zyppy::concurrency

#endif // ZYPPY_CONCURRENCY_COMMAND_HPP
