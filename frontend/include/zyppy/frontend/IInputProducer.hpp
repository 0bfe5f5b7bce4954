/**
 * @file IInputProducer.hpp
 * @brief Abstract input producer interface (keyboard, speech, scripted
 *        harness).
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#pragma once

#ifndef ZYPPY_FRONTEND_IINPUTPRODUCER_HPP
    #define ZYPPY_FRONTEND_IINPUTPRODUCER_HPP

#include <zyppy/concurrency/Command.hpp>
#include <zyppy/core/Expected.hpp>
#include <zyppy/core/Types.hpp>

#include <functional>
#include <string>

namespace zyppy::frontend {

/**
 * @brief Sink a producer submits lines to, typically bound to
 *        engine::LifecycleController::submit().
 */
using SubmitFn = std::function<core::Expected<core::u64>(std::string, concurrency::CommandSource)>;

/**
 * @class IInputProducer
 * @brief Strategy interface for threaded input producers.
 *
 * Each producer runs on its own thread and pushes whole lines through the
 * SubmitFn.  A producer finishes on its own when its input is exhausted or
 * when the sink reports kQueueClosed.
 */
class IInputProducer
{
public:
    virtual ~IInputProducer() = default;

    /** @brief Starts producing into @p submit. */
    [[nodiscard]] virtual core::ExpectedVoid start(SubmitFn submit) = 0;

    /** @brief Stops producing and joins the producer thread. */
    virtual void stop() noexcept = 0;

    /** @brief True once the producer thread has exited. */
    [[nodiscard]] virtual bool isFinished() const noexcept = 0;

    /** @brief Returns a human-readable name. */
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace zyppy::frontend

#endif // ZYPPY_FRONTEND_IINPUTPRODUCER_HPP
