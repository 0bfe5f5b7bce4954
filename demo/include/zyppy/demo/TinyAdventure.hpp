/**
 * @file TinyAdventure.hpp
 * @brief Minimal built-in text adventure driving the engine worker.
 *
 * Four rooms, three items and a locked gate: just enough game to exercise
 * the bridge end to end without an external story file.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#pragma once

#ifndef ZYPPY_DEMO_TINYADVENTURE_HPP
    #define ZYPPY_DEMO_TINYADVENTURE_HPP

#include <zyppy/engine/IInterpreter.hpp>
#include <zyppy/frontend/StatusPanel.hpp>
#include <zyppy/core/Types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace zyppy::demo {

/** @brief Room indices; kRoomCount doubles as the "carried" location. */
enum class RoomId : core::u8 {
    kCellar = 0,
    kHall,
    kLibrary,
    kGarden,
    kRoad,
    kRoomCount
};

[[nodiscard]] const char* roomName(RoomId room) noexcept;

/** @brief Where the interpreter is in its read-eval-print cycle. */
enum class Phase : core::u8 {
    kIntro = 0,
    kPrompt,
    kAwaitInput,
    kRespond,
    kFinished
};

/** @brief Everything undo restores. */
struct World
{
    RoomId                                location{RoomId::kCellar};
    std::vector<std::vector<std::string>> roomItems;
    std::vector<std::string>              inventory;
    std::vector<std::string>              scored;
    core::u32                             moves{0};
    core::i32                             score{0};
    bool                                  gateOpen{false};

    bool operator==(const World&) const = default;
};

/**
 * @struct AdventureState
 * @brief Engine state owned by the worker; read elsewhere only through
 *        the introspection bridge.
 */
struct AdventureState
{
    World              world;
    Phase              phase{Phase::kIntro};
    std::string        pendingLine;
    std::vector<World> undo;
};

/** @brief A new game: lamp in the cellar, book in the hall, key in the library. */
[[nodiscard]] AdventureState newAdventure();

/** @brief Introspection query backing the status panel. */
[[nodiscard]] frontend::StatusSnapshot describeStatus(const AdventureState& state);

/**
 * @class TinyAdventure
 * @brief IInterpreter over AdventureState.
 *
 * One turn is intro or response (kOutput), then a prompt (kNeedsInput).
 * "quit" ends the program with kQuit.  The system directives ":undo" and
 * ":cancel" are understood as ordinary lines.
 */
class TinyAdventure final : public engine::IInterpreter<AdventureState>
{
public:
    [[nodiscard]] core::Expected<engine::StepResult> step(AdventureState& state) override;
    [[nodiscard]] core::ExpectedVoid feedLine(AdventureState& state, std::string_view line) override;
    [[nodiscard]] const char* name() const noexcept override { return "tiny-adventure"; }

    /** @brief Prompt written before every line is read. */
    static constexpr std::string_view kPrompt = "\n> ";

private:
    struct Response
    {
        std::string text;
        bool        quit{false};
    };

    [[nodiscard]] Response execute(AdventureState& state, std::string_view line);

    [[nodiscard]] std::string look(const World& world) const;
    [[nodiscard]] std::string go(AdventureState& state, std::string_view direction);
    [[nodiscard]] std::string take(AdventureState& state, std::string_view item);
    [[nodiscard]] std::string drop(AdventureState& state, std::string_view item);
    [[nodiscard]] std::string inventory(const World& world) const;
    [[nodiscard]] std::string undo(AdventureState& state);
};

} // namespace zyppy::demo

#endif // ZYPPY_DEMO_TINYADVENTURE_HPP
