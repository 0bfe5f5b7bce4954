/**
 * @file CommandHeap.cpp
 * @brief CommandHeap implementation over std::push_heap / std::pop_heap.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/concurrency/CommandHeap.hpp>
#include <zyppy/core/Assert.hpp>

#include <algorithm>

namespace zyppy::concurrency {

void CommandHeap::push(Command command)
{
    _items.push_back(std::move(command));
    std::push_heap(_items.begin(), _items.end(), ServedLater{});
}

Command CommandHeap::pop()
{
    ZYPPY_ASSERT(!_items.empty());

    std::pop_heap(_items.begin(), _items.end(), ServedLater{});
    Command next = std::move(_items.back());
    _items.pop_back();
    return next;
}

const Command& CommandHeap::top() const
{
    ZYPPY_ASSERT(!_items.empty());
    return _items.front();
}

} // namespace zyppy::concurrency
