/**
 * @file IInterpreter.hpp
 * @brief Interface of the external turn-based interpreter driven by the
 *        engine worker.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_ENGINE_IINTERPRETER_HPP
    #define ZYPPY_ENGINE_IINTERPRETER_HPP

#include <zyppy/core/Expected.hpp>
#include <zyppy/core/Types.hpp>

#include <string>
#include <string_view>

namespace zyppy::engine {

/**
 * @struct StepResult
 * @brief Outcome of one unit of interpreter execution.
 *
 * Any kind may carry output (a prompt before kNeedsInput, a farewell with
 * kQuit); empty output is not forwarded.
 */
struct StepResult
{
    enum class Kind : core::u8 {
        kOutput = 0, ///< Execution advanced; call step() again.
        kNeedsInput, ///< The next action reads a line (feedLine()).
        kQuit        ///< The program terminated.
    };

    Kind        kind{Kind::kOutput};
    std::string output;

    [[nodiscard]] static StepResult produced(std::string text)        { return {Kind::kOutput, std::move(text)}; }
    [[nodiscard]] static StepResult needsInput(std::string prompt = {}) { return {Kind::kNeedsInput, std::move(prompt)}; }
    [[nodiscard]] static StepResult quit(std::string farewell = {})     { return {Kind::kQuit, std::move(farewell)}; }
};

/**
 * @class IInterpreter
 * @brief Strategy interface for the execution engine.
 *
 * The interpreter keeps no state of its own between calls: everything
 * lives in the @p State object the worker owns and passes in.  An error
 * returned (or an exception thrown) from either method is fatal for the
 * session.
 *
 * @tparam State Engine state type.
 */
template <typename State>
class IInterpreter
{
public:
    virtual ~IInterpreter() = default;

    /** @brief Advances execution by one unit. */
    [[nodiscard]] virtual core::Expected<StepResult> step(State& state) = 0;

    /** @brief Delivers the line requested by the last kNeedsInput step. */
    [[nodiscard]] virtual core::ExpectedVoid feedLine(State& state, std::string_view line) = 0;

    /** @brief Returns a human-readable name. */
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace zyppy::engine

#endif // ZYPPY_ENGINE_IINTERPRETER_HPP
