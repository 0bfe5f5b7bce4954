/**
 * @file StatusPanel.hpp
 * @brief Game status snapshot and its text rendering.
 *
 * The snapshot is produced on the engine thread through the introspection
 * bridge, so the panel never touches live interpreter state.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#pragma once

#ifndef ZYPPY_FRONTEND_STATUSPANEL_HPP
    #define ZYPPY_FRONTEND_STATUSPANEL_HPP

#include <zyppy/core/Expected.hpp>
#include <zyppy/core/Types.hpp>
#include <zyppy/engine/LifecycleController.hpp>

#include <string>
#include <utility>
#include <vector>

namespace zyppy::frontend {

/** @brief Value copy of what the status panel shows. */
struct StatusSnapshot
{
    std::string              location;
    core::i32                score{0};
    core::u32                moves{0};
    std::vector<std::string> inventory;

    bool operator==(const StatusSnapshot&) const = default;
};

/**
 * @brief Renders three lines:
 * @code
 * Location: Hall
 * Score: 10  Moves: 3
 * Carrying: lamp, key
 * @endcode
 * An empty inventory renders as "Carrying: nothing".
 */
[[nodiscard]] std::string renderStatus(const StatusSnapshot& snapshot);

/**
 * @brief Queries a running session for a fresh snapshot and renders it.
 *
 * @p query runs on the engine thread and must return a StatusSnapshot.
 * Errors from the bridge (worker stopped) are forwarded unchanged.
 */
template <typename State, typename Query>
[[nodiscard]] core::Expected<std::string> refreshStatus(engine::LifecycleController<State>& session, Query&& query)
{
    auto snapshot = session.call(std::forward<Query>(query));
    if (!snapshot)
    {
        return core::Unexpected{snapshot.error()};
    }
    return renderStatus(*snapshot);
}

} // namespace zyppy::frontend

#endif // ZYPPY_FRONTEND_STATUSPANEL_HPP
