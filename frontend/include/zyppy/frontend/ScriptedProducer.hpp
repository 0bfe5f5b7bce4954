/**
 * @file ScriptedProducer.hpp
 * @brief Producer replaying a fixed list of lines, optionally paced.
 *
 * Stands in for the speech recognizer and drives scripted test sessions.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#pragma once

#ifndef ZYPPY_FRONTEND_SCRIPTEDPRODUCER_HPP
    #define ZYPPY_FRONTEND_SCRIPTEDPRODUCER_HPP

#include <zyppy/frontend/IInputProducer.hpp>
#include <zyppy/core/NonCopyable.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace zyppy::frontend {

/**
 * @class ScriptedProducer
 * @brief Submits each line in order, waiting @p delay before each one.
 *
 * The wait is interruptible by stop().  Blank lines are skipped.
 */
class ScriptedProducer final : public IInputProducer, public core::NonMovable<ScriptedProducer>
{
public:
    ScriptedProducer(std::vector<std::string> lines,
                     concurrency::CommandSource source,
                     std::chrono::milliseconds delay = std::chrono::milliseconds{0});
    ~ScriptedProducer() override;

    /**
     * @brief Reads a script file: one command per line, '#' starts a
     *        comment line, blank lines are ignored.
     * @return The lines, or kIoError when the file cannot be read.
     */
    [[nodiscard]] static core::Expected<std::vector<std::string>> loadScript(const std::filesystem::path& path);

    [[nodiscard]] core::ExpectedVoid start(SubmitFn submit) override;
    void stop() noexcept override;
    [[nodiscard]] bool isFinished() const noexcept override;
    [[nodiscard]] const char* name() const noexcept override { return "script"; }

    /** @brief Blocks until every line has been submitted (or stop()). */
    void join();

    [[nodiscard]] core::u64 linesSubmitted() const noexcept;

private:
    void run(std::stop_token stopToken);

    const std::vector<std::string>   _lines;
    const concurrency::CommandSource _source;
    const std::chrono::milliseconds  _delay;
    SubmitFn                         _submit;

    std::atomic<bool>      _finished{false};
    std::atomic<core::u64> _submitted{0};
    bool                   _started{false};
    std::jthread           _worker;
};

} // namespace zyppy::frontend

#endif // ZYPPY_FRONTEND_SCRIPTEDPRODUCER_HPP
