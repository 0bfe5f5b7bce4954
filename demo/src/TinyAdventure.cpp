/**
 * @file TinyAdventure.cpp
 * @brief TinyAdventure implementation.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */

#include <zyppy/demo/TinyAdventure.hpp>
#include <zyppy/frontend/InputHistory.hpp>
#include <zyppy/core/Constants.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <optional>

namespace zyppy::demo {

namespace {

enum class Direction : core::u8 { kNorth = 0, kSouth, kEast, kWest };

constexpr core::usize kRoomCount = static_cast<core::usize>(RoomId::kRoomCount);
constexpr core::usize kUndoDepth = 32;
constexpr RoomId      kNoExit    = RoomId::kRoomCount;

struct RoomInfo
{
    const char*           name;
    const char*           description;
    std::array<RoomId, 4> exits; ///< north, south, east, west
};

constexpr std::array<RoomInfo, kRoomCount> kRooms{{
    {"Cellar",  "A damp cellar. Worn stairs lead up to the north.",
     {RoomId::kHall, kNoExit, kNoExit, kNoExit}},
    {"Hall",    "A draughty hall. Doors open east and west; the cellar stairs go down to the south.",
     {kNoExit, RoomId::kCellar, RoomId::kLibrary, RoomId::kGarden}},
    {"Library", "Shelves of mouldering books. The hall is back to the west.",
     {kNoExit, kNoExit, kNoExit, RoomId::kHall}},
    {"Garden",  "An overgrown garden. An iron gate stands to the north; the hall is east.",
     {RoomId::kRoad, kNoExit, RoomId::kHall, kNoExit}},
    {"Road",    "A dusty road leads away from the house. The garden gate is south.",
     {kNoExit, RoomId::kGarden, kNoExit, kNoExit}},
}};

constexpr std::string_view kBanner =
    "TINY ADVENTURE\n"
    "A demonstration game. Type \"help\" for the list of commands.\n\n";

constexpr std::string_view kHelp =
    "Commands: look, go <north|south|east|west> (or n/s/e/w), take <item>, drop <item>,\n"
    "inventory (i), score, undo, help, quit.\n";

constexpr core::i32 kItemScore = 10;
constexpr core::i32 kEscapeScore = 25;

const RoomInfo& info(RoomId room)
{
    return kRooms[static_cast<core::usize>(room)];
}

std::optional<Direction> parseDirection(std::string_view word)
{
    if (word == "n" || word == "north") { return Direction::kNorth; }
    if (word == "s" || word == "south") { return Direction::kSouth; }
    if (word == "e" || word == "east")  { return Direction::kEast; }
    if (word == "w" || word == "west")  { return Direction::kWest; }
    return std::nullopt;
}

std::string lowercase(std::string text)
{
    std::ranges::transform(text, text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string joinList(const std::vector<std::string>& items)
{
    std::string joined;
    for (const auto& item : items)
    {
        if (!joined.empty())
        {
            joined += ", ";
        }
        joined += item;
    }
    return joined;
}

bool contains(const std::vector<std::string>& items, std::string_view item)
{
    return std::ranges::find(items, item) != items.end();
}

// Awards points for @p key once per game.
void awardOnce(World& world, std::string_view key, core::i32 points)
{
    if (!contains(world.scored, key))
    {
        world.scored.emplace_back(key);
        world.score += points;
    }
}

} // namespace

const char* roomName(RoomId room) noexcept
{
    return room < RoomId::kRoomCount ? info(room).name : "Nowhere";
}

AdventureState newAdventure()
{
    AdventureState state;
    state.world.roomItems.resize(kRoomCount);
    state.world.roomItems[static_cast<core::usize>(RoomId::kCellar)].emplace_back("lamp");
    state.world.roomItems[static_cast<core::usize>(RoomId::kHall)].emplace_back("book");
    state.world.roomItems[static_cast<core::usize>(RoomId::kLibrary)].emplace_back("key");
    return state;
}

frontend::StatusSnapshot describeStatus(const AdventureState& state)
{
    return frontend::StatusSnapshot{
        .location  = roomName(state.world.location),
        .score     = state.world.score,
        .moves     = state.world.moves,
        .inventory = state.world.inventory,
    };
}

core::Expected<engine::StepResult> TinyAdventure::step(AdventureState& state)
{
    switch (state.phase)
    {
    case Phase::kIntro:
        state.phase = Phase::kPrompt;
        return engine::StepResult::produced(std::format("{}{}", kBanner, look(state.world)));

    case Phase::kPrompt:
        state.phase = Phase::kAwaitInput;
        return engine::StepResult::needsInput(std::string{kPrompt});

    case Phase::kAwaitInput:
        return core::makeError(core::ErrorCode::kInvalidState, "step() called while waiting for a line");

    case Phase::kRespond: {
        Response response = execute(state, state.pendingLine);
        state.pendingLine.clear();
        if (response.quit)
        {
            state.phase = Phase::kFinished;
            return engine::StepResult::quit(std::move(response.text));
        }
        state.phase = Phase::kPrompt;
        return engine::StepResult::produced(std::move(response.text));
    }

    case Phase::kFinished:
        return engine::StepResult::quit();
    }
    return core::makeError(core::ErrorCode::kInternalError, "unknown interpreter phase");
}

core::ExpectedVoid TinyAdventure::feedLine(AdventureState& state, std::string_view line)
{
    if (state.phase != Phase::kAwaitInput)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "line delivered while not waiting for input");
    }
    state.pendingLine.assign(line);
    state.phase = Phase::kRespond;
    return {};
}

auto TinyAdventure::execute(AdventureState& state, std::string_view line) -> Response
{
    const std::string text = lowercase(frontend::trimLine(line));

    if (text.empty())
    {
        return {"Beg pardon?\n"};
    }
    if (text == core::kCancelEditDirective)
    {
        return {"(cancelled)\n"};
    }
    if (text == core::kUndoDirective || text == "undo")
    {
        return {undo(state)};
    }

    const auto space = text.find(' ');
    const std::string_view verb = std::string_view{text}.substr(0, space);
    const std::string noun = space == std::string::npos ? std::string{} : frontend::trimLine(text.substr(space + 1));

    if (verb == "quit" || verb == "q")
    {
        return {"Goodbye.\n", true};
    }
    if (verb == "look" || verb == "l")
    {
        return {look(state.world)};
    }
    if (verb == "inventory" || verb == "i")
    {
        return {inventory(state.world)};
    }
    if (verb == "score")
    {
        return {std::format("Your score is {} in {} move(s).\n", state.world.score, state.world.moves)};
    }
    if (verb == "help")
    {
        return {std::string{kHelp}};
    }

    // Everything below may change the world and is therefore undoable.
    World before = state.world;
    std::optional<std::string> reply;

    if (verb == "go")
    {
        reply = noun.empty() ? std::string{"Go where?\n"} : go(state, noun);
    }
    else if (parseDirection(verb))
    {
        reply = go(state, verb);
    }
    else if (verb == "take" || verb == "get")
    {
        reply = take(state, noun);
    }
    else if (verb == "drop")
    {
        reply = drop(state, noun);
    }

    if (!reply)
    {
        return {std::format("I don't understand \"{}\".\n", text)};
    }

    if (!(state.world == before))
    {
        state.undo.push_back(std::move(before));
        if (state.undo.size() > kUndoDepth)
        {
            state.undo.erase(state.undo.begin());
        }
    }
    return {std::move(*reply)};
}

std::string TinyAdventure::look(const World& world) const
{
    const RoomInfo& room = info(world.location);
    std::string text = std::format("{}\n{}\n", room.name, room.description);

    const auto& items = world.roomItems[static_cast<core::usize>(world.location)];
    if (!items.empty())
    {
        text += std::format("You see: {}.\n", joinList(items));
    }
    return text;
}

std::string TinyAdventure::go(AdventureState& state, std::string_view direction)
{
    const auto dir = parseDirection(direction);
    if (!dir)
    {
        return std::format("\"{}\" is not a direction.\n", direction);
    }

    World& world = state.world;
    const RoomId target = info(world.location).exits[static_cast<core::usize>(*dir)];
    if (target == kNoExit)
    {
        return "You can't go that way.\n";
    }

    std::string prefix;
    if (world.location == RoomId::kGarden && target == RoomId::kRoad && !world.gateOpen)
    {
        if (!contains(world.inventory, "key"))
        {
            return "The gate is locked.\n";
        }
        world.gateOpen = true;
        prefix = "You unlock the gate with the key.\n";
    }

    world.location = target;
    ++world.moves;
    if (target == RoomId::kRoad)
    {
        awardOnce(world, "road", kEscapeScore);
    }
    return prefix + look(world);
}

std::string TinyAdventure::take(AdventureState& state, std::string_view item)
{
    if (item.empty())
    {
        return "Take what?\n";
    }

    World& world = state.world;
    auto& here = world.roomItems[static_cast<core::usize>(world.location)];
    const auto it = std::ranges::find(here, item);
    if (it == here.end())
    {
        return contains(world.inventory, item) ? std::string{"You already have that.\n"}
                                               : std::format("You see no {} here.\n", item);
    }

    world.inventory.push_back(std::move(*it));
    here.erase(it);
    ++world.moves;
    awardOnce(world, item, kItemScore);
    return "Taken.\n";
}

std::string TinyAdventure::drop(AdventureState& state, std::string_view item)
{
    if (item.empty())
    {
        return "Drop what?\n";
    }

    World& world = state.world;
    const auto it = std::ranges::find(world.inventory, item);
    if (it == world.inventory.end())
    {
        return std::format("You are not carrying {}.\n", item);
    }

    world.roomItems[static_cast<core::usize>(world.location)].push_back(std::move(*it));
    world.inventory.erase(it);
    ++world.moves;
    return "Dropped.\n";
}

std::string TinyAdventure::inventory(const World& world) const
{
    if (world.inventory.empty())
    {
        return "You are empty-handed.\n";
    }
    return std::format("You are carrying: {}.\n", joinList(world.inventory));
}

std::string TinyAdventure::undo(AdventureState& state)
{
    if (state.undo.empty())
    {
        return "Nothing to undo.\n";
    }
    state.world = std::move(state.undo.back());
    state.undo.pop_back();
    return "Undone.\n" + look(state.world);
}

} // namespace zyppy::demo
