/**
 * @file Command.cpp
 * @brief Command source names.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/concurrency/Command.hpp>

namespace zyppy::concurrency {

std::string_view commandSourceName(CommandSource source) noexcept
{
    switch (source)
    {
        case CommandSource::kKeyboard: return "keyboard";
        case CommandSource::kVoice:    return "voice";
        case CommandSource::kSystem:   return "system";
    }
    return "unknown";
}

} // namespace zyppy::concurrency
