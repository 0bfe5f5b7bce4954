/**
 * @file CommandHeap.hpp
 * @brief Binary heap of Commands keyed by (priority desc, sequence asc).
 *
 * Pure data structure: no locking, no blocking.  PriorityCommandQueue adds
 * the capacity bound and the synchronization on top of it.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_CONCURRENCY_COMMANDHEAP_HPP
    #define ZYPPY_CONCURRENCY_COMMANDHEAP_HPP

#include <zyppy/concurrency/Command.hpp>
#include <zyppy/core/Types.hpp>

#include <vector>

namespace zyppy::concurrency {

/**
 * @class CommandHeap
 * @brief Max-heap whose top is the command that must be served next.
 */
class CommandHeap final
{
public:
    /** @brief Inserts @p command.  O(log n). */
    void push(Command command);

    /**
     * @brief Removes and returns the next command to serve.  O(log n).
     * @pre !empty()
     */
    [[nodiscard]] Command pop();

    /**
     * @brief Next command to serve, without removing it.
     * @pre !empty()
     */
    [[nodiscard]] const Command& top() const;

    [[nodiscard]] bool       empty() const noexcept { return _items.empty(); }
    [[nodiscard]] core::usize size() const noexcept { return _items.size(); }

    void clear() noexcept { _items.clear(); }

private:
    /** std heap algorithms keep the "largest" element on top; a command is
     *  "smaller" when it is served later. */
    struct ServedLater
    {
        bool operator()(const Command& lhs, const Command& rhs) const noexcept
        {
            return servedBefore(rhs, lhs);
        }
    };

    std::vector<Command> _items;
};

} // namespace zyppy::concurrency

#endif // ZYPPY_CONCURRENCY_COMMANDHEAP_HPP
