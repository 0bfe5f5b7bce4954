/**
 * @file Constants.hpp
 * @brief Compile-time defaults for the command/output bridge.
 *
 * Every tunable that engine::Config exposes starts from the value defined
 * here.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_CORE_CONSTANTS_HPP
    #define ZYPPY_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <chrono>
    #include <limits>
    #include <string_view>

namespace zyppy::core {

inline constexpr usize kDefaultCommandCapacity = 2048;
inline constexpr usize kDefaultOutputCapacity  = 2048;

inline constexpr i32   kKeyboardPriority       = 0;
inline constexpr i32   kVoicePriority          = 1;
inline constexpr i32   kSystemPriority         = std::numeric_limits<i32>::max();

inline constexpr usize kMaxLineLength          = 4096;

inline constexpr std::string_view kQuitDirective       = ":quit";
inline constexpr std::string_view kCancelEditDirective = ":cancel";
inline constexpr std::string_view kUndoDirective       = ":undo";

inline constexpr std::chrono::milliseconds kDefaultStartupTimeout{2000};
inline constexpr std::chrono::milliseconds kDefaultShutdownTimeout{2000};

} // namespace zyppy::core

#endif // ZYPPY_CORE_CONSTANTS_HPP
