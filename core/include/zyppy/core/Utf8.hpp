/**
 * @file Utf8.hpp
 * @brief UTF-8 validation for submitted input lines.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_CORE_UTF8_HPP
    #define ZYPPY_CORE_UTF8_HPP

    #include "Types.hpp"

    #include <optional>
    #include <string_view>

namespace zyppy::core {

/**
 * @brief Returns the byte offset of the first malformed sequence in
 *        @p text, or std::nullopt when the whole string is valid UTF-8.
 *
 * Overlong encodings, surrogate code points (U+D800..U+DFFF) and values
 * above U+10FFFF are rejected.
 */
[[nodiscard]] std::optional<usize> findInvalidUtf8(std::string_view text) noexcept;

/** @brief Shorthand for !findInvalidUtf8(text). */
[[nodiscard]] inline bool isValidUtf8(std::string_view text) noexcept
{
    return !findInvalidUtf8(text).has_value();
}

} // namespace zyppy::core

#endif // ZYPPY_CORE_UTF8_HPP
