#pragma once

#include "EngineContext.hpp"
#include "HighScoreStore.hpp"
#include "KeyInput.hpp"
#include "Physics.hpp"

#include <string>

enum class InputOutcome { None, Exit };

// GAME STATE MACHINE
//
// Playing -> GameOverPrompt -> (y) NameEntry -> Restarting -> Playing
//                           -> (n) Restarting -> Playing
// Every key goes through one switch on the active state, so no state ever
// sees input meant for another.
class GameStateMachine {
public:
    static constexpr const char* DEFAULT_NAME = "PLAYER";

    explicit GameStateMachine(HighScoreStore& store) : store_(store) {}

    InputOutcome onKeyDown(EngineContext& ctx, const KeyInput& key);
    void onKeyUp(EngineContext& ctx, const KeyInput& key);

    // Applies a physics slice result: score while Playing, loss transition.
    void onStep(EngineContext& ctx, const StepResult& step);

    // Restarting -> Playing with score 0 and a fresh world.
    void restart(EngineContext& ctx);

private:
    void handlePlaying(EngineContext& ctx, const KeyInput& key);
    void handleGameOverPrompt(EngineContext& ctx, const KeyInput& key);
    void handleNameEntry(EngineContext& ctx, const KeyInput& key);
    void confirmName(EngineContext& ctx);

    void enter(EngineContext& ctx, GameState next);

    HighScoreStore& store_;
};

// Empty or whitespace-only names become DEFAULT_NAME.
std::string resolveName(const std::string& buffer);
