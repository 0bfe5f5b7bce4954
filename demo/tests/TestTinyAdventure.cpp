/**
 * @file TestTinyAdventure.cpp
 * @brief Unit tests for demo::TinyAdventure, direct and behind the bridge.
 */

#include <catch2/catch_test_macros.hpp>

#include <zyppy/demo/TinyAdventure.hpp>
#include <zyppy/engine/LifecycleController.hpp>
#include <zyppy/frontend/ScriptedProducer.hpp>
#include <zyppy/frontend/Transcript.hpp>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace zyppy::demo {

using namespace std::chrono_literals;
using engine::StepResult;

namespace {

// Drives the interpreter the way the engine worker does.
class Player
{
public:
    Player()
    {
        intro = _game.step(state).value().output;
        REQUIRE(_game.step(state).value().kind == StepResult::Kind::kNeedsInput);
    }

    StepResult say(std::string_view line)
    {
        REQUIRE(_game.feedLine(state, line));
        StepResult reply = _game.step(state).value();
        if (reply.kind != StepResult::Kind::kQuit)
        {
            REQUIRE(_game.step(state).value().kind == StepResult::Kind::kNeedsInput);
        }
        return reply;
    }

    std::string text(std::string_view line) { return say(line).output; }

    AdventureState state{newAdventure()};
    std::string    intro;

private:
    TinyAdventure _game;
};

bool contains(const std::string& haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("TinyAdventure opens in the cellar", "[demo][adventure]")
{
    Player player;
    REQUIRE(contains(player.intro, "TINY ADVENTURE"));
    REQUIRE(contains(player.intro, "Cellar"));
    REQUIRE(contains(player.intro, "You see: lamp."));
}

TEST_CASE("TinyAdventure movement and look", "[demo][adventure]")
{
    Player player;

    REQUIRE(contains(player.text("north"), "Hall"));
    REQUIRE(contains(player.text("go east"), "Library"));
    REQUIRE(player.text("n") == "You can't go that way.\n");
    REQUIRE(contains(player.text("LOOK"), "Library"));
    REQUIRE(player.text("go") == "Go where?\n");
    REQUIRE(player.state.world.moves == 2);
}

TEST_CASE("TinyAdventure items, inventory and score", "[demo][adventure]")
{
    Player player;

    REQUIRE(player.text("inventory") == "You are empty-handed.\n");
    REQUIRE(player.text("take lamp") == "Taken.\n");
    REQUIRE(player.text("take lamp") == "You already have that.\n");
    REQUIRE(player.text("get sword") == "You see no sword here.\n");
    REQUIRE(player.text("i") == "You are carrying: lamp.\n");
    REQUIRE(player.text("score") == "Your score is 10 in 1 move(s).\n");

    REQUIRE(player.text("drop lamp") == "Dropped.\n");
    REQUIRE(player.text("drop lamp") == "You are not carrying lamp.\n");
    REQUIRE(player.text("take lamp") == "Taken.\n");
    REQUIRE(player.state.world.score == 10);
}

TEST_CASE("TinyAdventure gate needs the key", "[demo][adventure]")
{
    Player player;

    player.text("n");
    player.text("w");
    REQUIRE(player.text("n") == "The gate is locked.\n");

    player.text("e");
    player.text("e");
    REQUIRE(player.text("take key") == "Taken.\n");
    player.text("w");
    player.text("w");

    const std::string opened = player.text("n");
    REQUIRE(contains(opened, "You unlock the gate"));
    REQUIRE(contains(opened, "Road"));
    REQUIRE(player.state.world.score == 35);
}

TEST_CASE("TinyAdventure undo restores the previous world", "[demo][adventure]")
{
    Player player;

    REQUIRE(player.text("undo") == "Nothing to undo.\n");
    player.text("take lamp");
    player.text("north");

    REQUIRE(contains(player.text("undo"), "Cellar"));
    REQUIRE(player.state.world.location == RoomId::kCellar);
    REQUIRE(player.state.world.inventory.size() == 1);

    REQUIRE(contains(player.text(":undo"), "Undone."));
    REQUIRE(player.state.world.inventory.empty());
    REQUIRE(player.state.world.score == 0);

    // Failed actions leave nothing to undo.
    REQUIRE(player.text("w") == "You can't go that way.\n");
    REQUIRE(player.text("undo") == "Nothing to undo.\n");
}

TEST_CASE("TinyAdventure odd input", "[demo][adventure]")
{
    Player player;

    REQUIRE(player.text("") == "Beg pardon?\n");
    REQUIRE(player.text("xyzzy") == "I don't understand \"xyzzy\".\n");
    REQUIRE(player.text(":cancel") == "(cancelled)\n");
    REQUIRE(contains(player.text("help"), "Commands:"));

    auto bye = player.say("quit");
    REQUIRE(bye.kind == StepResult::Kind::kQuit);
    REQUIRE(bye.output == "Goodbye.\n");
}

TEST_CASE("TinyAdventure rejects out-of-turn calls", "[demo][adventure]")
{
    TinyAdventure game;
    AdventureState state = newAdventure();

    REQUIRE(game.feedLine(state, "look").error().code() == core::ErrorCode::kInvalidState);
    REQUIRE(game.step(state).has_value());
    REQUIRE(game.step(state).has_value());
    REQUIRE(game.step(state).error().code() == core::ErrorCode::kInvalidState);
}

TEST_CASE("describeStatus mirrors the world", "[demo][adventure]")
{
    Player player;
    player.text("take lamp");
    player.text("n");

    const auto status = describeStatus(player.state);
    REQUIRE(status.location == "Hall");
    REQUIRE(status.score == 10);
    REQUIRE(status.moves == 2);
    REQUIRE(status.inventory == std::vector<std::string>{"lamp"});
}

TEST_CASE("TinyAdventure session behind the bridge", "[demo][adventure][integration]")
{
    auto config = engine::Config::Builder{}.shutdownTimeout(500ms).build();
    REQUIRE(config.has_value());

    engine::LifecycleController<AdventureState> session{*config, std::make_unique<TinyAdventure>(), newAdventure()};
    REQUIRE(session.start());

    std::ostringstream sink;
    frontend::Transcript transcript{sink};
    REQUIRE(transcript.start(session.output()));

    frontend::ScriptedProducer voice{{"take lamp", "north", "quit"}, concurrency::CommandSource::kVoice};
    REQUIRE(voice.start([&session](std::string text, concurrency::CommandSource source) {
        return session.submit(std::move(text), source);
    }));

    REQUIRE(transcript.waitForEnd(5s));
    voice.stop();

    REQUIRE(session.shutdown().value() == engine::ShutdownOutcome::kAlreadyStopped);
    REQUIRE(session.stopReason() == engine::StopReason::kInterpreterQuit);

    const std::string text = transcript.text();
    REQUIRE(contains(text, "Taken."));
    REQUIRE(contains(text, "Hall"));
    REQUIRE(contains(text, "Goodbye."));
    REQUIRE_FALSE(transcript.sawFatal());
}

TEST_CASE("TinyAdventure status panel through the bridge", "[demo][adventure][integration]")
{
    engine::LifecycleController<AdventureState> session{engine::Config{}, std::make_unique<TinyAdventure>(),
                                                        newAdventure()};
    REQUIRE(session.start());
    REQUIRE(session.submit("take lamp", concurrency::CommandSource::kKeyboard));

    // Wait until the command has been played, then query the panel.
    for (int i = 0; i < 200 && session.stats().commandsConsumed < 1; ++i)
        std::this_thread::sleep_for(5ms);

    auto panel = frontend::refreshStatus(session, [](const AdventureState& s) { return describeStatus(s); });
    REQUIRE(panel.has_value());
    REQUIRE(contains(*panel, "Location: Cellar"));

    REQUIRE(session.shutdown().value() == engine::ShutdownOutcome::kGraceful);
    REQUIRE(frontend::refreshStatus(session, [](const AdventureState& s) { return describeStatus(s); })
                .error().code() == core::ErrorCode::kWorkerStopped);
}

} // namespace zyppy::demo
