/**
 * @file Config.cpp
 * @brief Config::Builder implementation.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/engine/Config.hpp>

#include <algorithm>
#include <format>

namespace zyppy::engine {

Config::Builder& Config::Builder::commandCapacity(core::usize n) noexcept
{
    _commandCapacity = n;
    return *this;
}

Config::Builder& Config::Builder::outputCapacity(core::usize n) noexcept
{
    _outputCapacity = n;
    return *this;
}

Config::Builder& Config::Builder::overflowPolicy(concurrency::OverflowPolicy policy) noexcept
{
    _overflowPolicy = policy;
    return *this;
}

Config::Builder& Config::Builder::keyboardPriority(core::i32 priority) noexcept
{
    _keyboardPriority = priority;
    return *this;
}

Config::Builder& Config::Builder::voicePriority(core::i32 priority) noexcept
{
    _voicePriority = priority;
    return *this;
}

Config::Builder& Config::Builder::systemPriority(core::i32 priority) noexcept
{
    _systemPriority = priority;
    return *this;
}

Config::Builder& Config::Builder::quitDirective(std::string directive)
{
    _quitDirective = std::move(directive);
    return *this;
}

Config::Builder& Config::Builder::controlDirectives(std::vector<std::string> directives)
{
    _controlDirectives = std::move(directives);
    return *this;
}

Config::Builder& Config::Builder::startupTimeout(std::chrono::milliseconds timeout) noexcept
{
    _startupTimeout = timeout;
    return *this;
}

Config::Builder& Config::Builder::shutdownTimeout(std::chrono::milliseconds timeout) noexcept
{
    _shutdownTimeout = timeout;
    return *this;
}

core::Expected<Config> Config::Builder::build() const
{
    if (_commandCapacity == 0 || _outputCapacity == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "queue capacities must be positive");
    }
    if (_startupTimeout.count() <= 0 || _shutdownTimeout.count() <= 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "timeouts must be positive");
    }
    if (_quitDirective.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "quit directive must not be empty");
    }
    for (const auto& directive : _controlDirectives)
    {
        if (directive.empty() || directive == _quitDirective)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   std::format("invalid control directive '{}'", directive));
        }
    }
    if (_systemPriority <= _keyboardPriority || _systemPriority <= _voicePriority)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("system priority {} must exceed keyboard ({}) and voice ({})",
                                           _systemPriority, _keyboardPriority, _voicePriority));
    }

    Config config;
    config._commandCapacity  = _commandCapacity;
    config._outputCapacity   = _outputCapacity;
    config._overflowPolicy   = _overflowPolicy;
    config._keyboardPriority = _keyboardPriority;
    config._voicePriority    = _voicePriority;
    config._systemPriority   = _systemPriority;
    config._quitDirective    = _quitDirective;
    config._controlDirectives = _controlDirectives;
    config._startupTimeout   = _startupTimeout;
    config._shutdownTimeout  = _shutdownTimeout;
    return config;
}

core::i32 Config::priorityFor(concurrency::CommandSource source) const noexcept
{
    switch (source)
    {
        case concurrency::CommandSource::kKeyboard: return _keyboardPriority;
        case concurrency::CommandSource::kVoice:    return _voicePriority;
        case concurrency::CommandSource::kSystem:   return _systemPriority;
    }
    return _keyboardPriority;
}

bool Config::isControlDirective(std::string_view text) const noexcept
{
    return std::ranges::any_of(_controlDirectives,
                               [text](const std::string& directive) { return directive == text; });
}

} // namespace zyppy::engine
