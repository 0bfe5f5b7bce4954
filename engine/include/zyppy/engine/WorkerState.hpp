/**
 * @file WorkerState.hpp
 * @brief Engine worker lifecycle states, stop reasons and counters.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_ENGINE_WORKERSTATE_HPP
    #define ZYPPY_ENGINE_WORKERSTATE_HPP

#include <zyppy/core/Types.hpp>

#include <string_view>

namespace zyppy::engine {

/** @brief STARTING → RUNNING → STOPPING → STOPPED; never goes back. */
enum class WorkerState : core::u8 {
    kStarting = 0,
    kRunning,
    kStopping,
    kStopped
};

/** @brief Why the worker left RUNNING. */
enum class StopReason : core::u8 {
    kNone = 0,
    kQuitDirective,   ///< System quit command dequeued.
    kInterpreterQuit, ///< step() reported kQuit.
    kEngineFatal,     ///< step()/feedLine() failed.
    kStopRequested,   ///< Cooperative cancellation (force-quit).
    kChannelClosed    ///< Command queue or output channel closed underneath.
};

[[nodiscard]] std::string_view workerStateName(WorkerState state) noexcept;
[[nodiscard]] std::string_view stopReasonName(StopReason reason) noexcept;

/** @brief Counters published by the worker. */
struct WorkerStats
{
    core::u64 steps{0};
    core::u64 commandsConsumed{0};
    core::u64 introspectionsServiced{0};
    core::u64 chunksWritten{0};
};

} // namespace zyppy::engine

#endif // ZYPPY_ENGINE_WORKERSTATE_HPP
