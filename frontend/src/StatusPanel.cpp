/**
 * @file StatusPanel.cpp
 * @brief Status rendering.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/frontend/StatusPanel.hpp>

#include <format>

namespace zyppy::frontend {

std::string renderStatus(const StatusSnapshot& snapshot)
{
    std::string carrying;
    for (const auto& item : snapshot.inventory)
    {
        if (!carrying.empty())
        {
            carrying += ", ";
        }
        carrying += item;
    }
    if (carrying.empty())
    {
        carrying = "nothing";
    }

    return std::format("Location: {}\nScore: {}  Moves: {}\nCarrying: {}\n",
                       snapshot.location.empty() ? "?" : snapshot.location,
                       snapshot.score,
                       snapshot.moves,
                       carrying);
}

} // namespace zyppy::frontend
