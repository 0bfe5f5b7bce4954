/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * ZYPPY_TRY / ZYPPY_TRY_VOID macros for early-return propagation.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_CORE_EXPECTED_HPP
    #define ZYPPY_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace zyppy::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace zyppy::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type zyppy::core::Expected<U>.
 */
#define ZYPPY_TRY(expr)                                                   \
    ({                                                                     \
        auto &&_zyppy_result = (expr);                                     \
        if (!_zyppy_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_zyppy_result.error()));       \
        std::move(_zyppy_result.value());                                  \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type zyppy::core::ExpectedVoid.
 */
#define ZYPPY_TRY_VOID(expr)                                              \
    do {                                                                    \
        auto &&_zyppy_result = (expr);                                     \
        if (!_zyppy_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_zyppy_result.error()));       \
    } while (false)

#endif // ZYPPY_CORE_EXPECTED_HPP
