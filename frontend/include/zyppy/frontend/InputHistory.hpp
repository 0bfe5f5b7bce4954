/**
 * @file InputHistory.hpp
 * @brief Submitted-line history with shell-style recall.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_FRONTEND_INPUTHISTORY_HPP
    #define ZYPPY_FRONTEND_INPUTHISTORY_HPP

#include <zyppy/core/Types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zyppy::frontend {

/** @brief @p line without leading/trailing whitespace (incl. '\r'). */
[[nodiscard]] std::string trimLine(std::string_view line);

/**
 * @brief Parses a recall request: "!!" is 1 (newest entry), "!-N" is N.
 * @return std::nullopt when @p line is not a recall request.
 */
[[nodiscard]] std::optional<core::usize> parseRecall(std::string_view line) noexcept;

/**
 * @class InputHistory
 * @brief Bounded history of submitted lines, newest last.
 *
 * Not thread-safe.
 */
class InputHistory final
{
public:
    /** @param limit Maximum number of entries kept; oldest are dropped. */
    explicit InputHistory(core::usize limit = 500);

    /**
     * @brief Records a submitted line (trimmed).
     * @return false for a blank line, which is neither recorded nor meant
     *         to be submitted.
     */
    bool record(std::string_view line);

    /** @brief The entry @p back steps from the end (1 = newest), if any. */
    [[nodiscard]] std::optional<std::string> recall(core::usize back) const;

    [[nodiscard]] const std::vector<std::string>& entries() const noexcept { return _entries; }
    [[nodiscard]] core::usize size()  const noexcept { return _entries.size(); }
    [[nodiscard]] core::usize limit() const noexcept { return _limit; }

private:
    std::vector<std::string> _entries;
    core::usize              _limit;
};

} // namespace zyppy::frontend

#endif // ZYPPY_FRONTEND_INPUTHISTORY_HPP
