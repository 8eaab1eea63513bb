#pragma once

#include "BrickField.hpp"
#include "GameConfig.hpp"

#include <string>

struct Paddle {
    float x = 1.0f;
    int   y = 0;
    int   w = 1;
    float speed = 0.0f;
};

struct Ball {
    float x = 0.0f, y = 0.0f;
    float vx = 0.0f, vy = 0.0f;
};

struct PaddleInput {
    bool left  = false;
    bool right = false;
};

// Tagged union of the game's modes. Only NameEntry carries data.
struct GameState {
    enum class Kind { Playing, GameOverPrompt, NameEntry, Restarting };

    Kind kind = Kind::Playing;
    std::string nameBuffer; // NameEntry only

    static GameState playing() { return GameState{}; }
    static GameState gameOverPrompt() { GameState s; s.kind = Kind::GameOverPrompt; return s; }
    static GameState nameEntry() { GameState s; s.kind = Kind::NameEntry; return s; }
    static GameState restarting() { GameState s; s.kind = Kind::Restarting; return s; }

    bool is(Kind k) const { return kind == k; }
};

const char* toString(GameState::Kind kind);

// Everything the simulation mutates, in one place. Owned by the Engine and
// passed by reference to Physics, GameStateMachine and Renderer.
struct EngineContext {
    GameConfig  config;
    Paddle      paddle;
    Ball        ball;
    BrickField  bricks;
    PaddleInput input;
    GameState   state;
    int         score = 0;

    explicit EngineContext(const GameConfig& cfg = GameConfig());

    // Paddle centered, ball above it with the start velocity, full wave.
    void resetWorld();
};
