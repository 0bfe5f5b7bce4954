/**
 * @file IntrospectionBridge.inl
 * @brief Template implementation of IntrospectionBridge.
 * @see   IntrospectionBridge.hpp
 */

#ifndef ZYPPY_CONCURRENCY_INTROSPECTIONBRIDGE_INL
    #define ZYPPY_CONCURRENCY_INTROSPECTIONBRIDGE_INL

#include <zyppy/core/Log.hpp>

#include <exception>
#include <utility>

namespace zyppy::concurrency {

template <typename State>
IntrospectionBridge<State>::~IntrospectionBridge()
{
    close();
}

template <typename State>
template <typename Op>
    requires IntrospectionOp<Op, State>
auto IntrospectionBridge<State>::call(Op&& op)
    -> core::Expected<std::remove_cvref_t<std::invoke_result_t<Op&, const State&>>>
{
    using Value  = std::remove_cvref_t<std::invoke_result_t<Op&, const State&>>;
    using Result = core::Expected<Value>;

    // std::function needs copyable targets; the operation and its promise
    // live in one shared slot instead.
    struct Slot
    {
        explicit Slot(Op&& fn) : op{std::forward<Op>(fn)} {}

        std::decay_t<Op>     op;
        std::promise<Result> promise;
    };

    auto slot = std::make_shared<Slot>(std::forward<Op>(op));
    std::future<Result> future = slot->promise.get_future();

    Task task;
    task.run = [slot](const State& state) {
        try
        {
            if constexpr (std::is_void_v<Value>)
            {
                std::invoke(slot->op, state);
                slot->promise.set_value(Result{});
            }
            else
            {
                slot->promise.set_value(Result{std::invoke(slot->op, state)});
            }
        }
        catch (...)
        {
            core::Log::debug("bridge", "introspection operation threw; forwarding to caller");
            slot->promise.set_exception(std::current_exception());
        }
    };
    task.abandon = [slot]() {
        slot->promise.set_value(Result{core::makeError(
            core::ErrorCode::kWorkerStopped, "engine worker stopped before servicing the request")});
    };

    if (!post(std::move(task)))
    {
        return core::makeError(core::ErrorCode::kWorkerStopped, "engine worker is not accepting requests");
    }

    return future.get();
}

template <typename State>
core::usize IntrospectionBridge<State>::drain(const State& state)
{
    core::usize serviced = 0;

    for (;;)
    {
        Task task;
        {
            std::lock_guard<std::mutex> lock{_mutex};
            if (_tasks.empty())
            {
                return serviced;
            }
            task = std::move(_tasks.front());
            _tasks.pop_front();
        }

        task.run(state);
        ++serviced;
    }
}

template <typename State>
core::usize IntrospectionBridge<State>::close()
{
    std::deque<Task> abandoned;
    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_closed)
        {
            return 0;
        }
        _closed = true;
        abandoned.swap(_tasks);
    }

    for (auto& task : abandoned)
    {
        task.abandon();
    }
    return abandoned.size();
}

template <typename State>
void IntrospectionBridge<State>::setWakeHook(WakeHook hook)
{
    std::lock_guard<std::mutex> lock{_mutex};
    _wakeHook = std::move(hook);
}

template <typename State>
core::usize IntrospectionBridge<State>::pending() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _tasks.size();
}

template <typename State>
bool IntrospectionBridge<State>::isClosed() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _closed;
}

template <typename State>
bool IntrospectionBridge<State>::post(Task task)
{
    WakeHook hook;
    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_closed)
        {
            return false;
        }
        _tasks.push_back(std::move(task));
        hook = _wakeHook;
    }

    if (hook)
    {
        hook();
    }
    return true;
}

} // namespace zyppy::concurrency

#endif // ZYPPY_CONCURRENCY_INTROSPECTIONBRIDGE_INL
