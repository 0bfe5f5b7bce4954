/**
 * @file WorkerState.cpp
 * @brief Names of worker states, stop reasons and shutdown outcomes.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/engine/LifecycleController.hpp>
#include <zyppy/engine/WorkerState.hpp>

namespace zyppy::engine {

std::string_view workerStateName(WorkerState state) noexcept
{
    switch (state)
    {
        case WorkerState::kStarting: return "starting";
        case WorkerState::kRunning:  return "running";
        case WorkerState::kStopping: return "stopping";
        case WorkerState::kStopped:  return "stopped";
    }
    return "unknown";
}

std::string_view stopReasonName(StopReason reason) noexcept
{
    switch (reason)
    {
        case StopReason::kNone:            return "none";
        case StopReason::kQuitDirective:   return "quit directive";
        case StopReason::kInterpreterQuit: return "interpreter quit";
        case StopReason::kEngineFatal:     return "engine fatal";
        case StopReason::kStopRequested:   return "stop requested";
        case StopReason::kChannelClosed:   return "channel closed";
    }
    return "unknown";
}

std::string_view shutdownOutcomeName(ShutdownOutcome outcome) noexcept
{
    switch (outcome)
    {
        case ShutdownOutcome::kGraceful:       return "graceful";
        case ShutdownOutcome::kForced:         return "forced";
        case ShutdownOutcome::kAlreadyStopped: return "already stopped";
    }
    return "unknown";
}

} // namespace zyppy::engine
