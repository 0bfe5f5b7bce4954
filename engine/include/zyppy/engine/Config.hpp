/**
 * @file Config.hpp
 * @brief Session configuration (Builder pattern).
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_ENGINE_CONFIG_HPP
    #define ZYPPY_ENGINE_CONFIG_HPP

#include <zyppy/concurrency/Command.hpp>
#include <zyppy/concurrency/PriorityCommandQueue.hpp>
#include <zyppy/core/Constants.hpp>
#include <zyppy/core/Expected.hpp>
#include <zyppy/core/Types.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace zyppy::engine {

/** @brief Immutable session configuration. */
class Config
{
public:
    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        Builder& commandCapacity(core::usize n) noexcept;
        Builder& outputCapacity(core::usize n) noexcept;
        Builder& overflowPolicy(concurrency::OverflowPolicy policy) noexcept;
        Builder& keyboardPriority(core::i32 priority) noexcept;
        Builder& voicePriority(core::i32 priority) noexcept;
        Builder& systemPriority(core::i32 priority) noexcept;
        Builder& quitDirective(std::string directive);
        /** @brief Replaces the control directives promoted to system priority. */
        Builder& controlDirectives(std::vector<std::string> directives);
        Builder& startupTimeout(std::chrono::milliseconds timeout) noexcept;
        Builder& shutdownTimeout(std::chrono::milliseconds timeout) noexcept;

        /**
         * @brief Validates the settings.
         * @return The configuration, or kInvalidArgument when a capacity or
         *         timeout is not positive, a directive is empty or a control
         *         directive equals the quit directive, or the system
         *         priority does not exceed the other two.
         */
        [[nodiscard]] core::Expected<Config> build() const;

    private:
        core::usize _commandCapacity{core::kDefaultCommandCapacity};
        core::usize _outputCapacity{core::kDefaultOutputCapacity};
        concurrency::OverflowPolicy _overflowPolicy{concurrency::OverflowPolicy::kBlock};
        core::i32 _keyboardPriority{core::kKeyboardPriority};
        core::i32 _voicePriority{core::kVoicePriority};
        core::i32 _systemPriority{core::kSystemPriority};
        std::string _quitDirective{core::kQuitDirective};
        std::vector<std::string> _controlDirectives{std::string{core::kCancelEditDirective},
                                                    std::string{core::kUndoDirective}};
        std::chrono::milliseconds _startupTimeout{core::kDefaultStartupTimeout};
        std::chrono::milliseconds _shutdownTimeout{core::kDefaultShutdownTimeout};
    };

    /** @brief Configuration with every default from Constants.hpp. */
    Config() = default;

    [[nodiscard]] core::usize                 commandCapacity() const noexcept { return _commandCapacity; }
    [[nodiscard]] core::usize                 outputCapacity()  const noexcept { return _outputCapacity; }
    [[nodiscard]] concurrency::OverflowPolicy overflowPolicy()  const noexcept { return _overflowPolicy; }
    [[nodiscard]] const std::string&          quitDirective()   const noexcept { return _quitDirective; }
    [[nodiscard]] std::chrono::milliseconds   startupTimeout()  const noexcept { return _startupTimeout; }
    [[nodiscard]] std::chrono::milliseconds   shutdownTimeout() const noexcept { return _shutdownTimeout; }

    /** @brief Priority given to commands submitted by @p source. */
    [[nodiscard]] core::i32 priorityFor(concurrency::CommandSource source) const noexcept;

    [[nodiscard]] const std::vector<std::string>& controlDirectives() const noexcept { return _controlDirectives; }

    /** @brief True when @p text is exactly one of the control directives. */
    [[nodiscard]] bool isControlDirective(std::string_view text) const noexcept;

private:
    friend class Builder;

    core::usize _commandCapacity{core::kDefaultCommandCapacity};
    core::usize _outputCapacity{core::kDefaultOutputCapacity};
    concurrency::OverflowPolicy _overflowPolicy{concurrency::OverflowPolicy::kBlock};
    core::i32 _keyboardPriority{core::kKeyboardPriority};
    core::i32 _voicePriority{core::kVoicePriority};
    core::i32 _systemPriority{core::kSystemPriority};
    std::string _quitDirective{core::kQuitDirective};
    std::vector<std::string> _controlDirectives{std::string{core::kCancelEditDirective},
                                                std::string{core::kUndoDirective}};
    std::chrono::milliseconds _startupTimeout{core::kDefaultStartupTimeout};
    std::chrono::milliseconds _shutdownTimeout{core::kDefaultShutdownTimeout};
};

} // namespace zyppy::engine

#endif // ZYPPY_ENGINE_CONFIG_HPP
