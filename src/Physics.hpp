#pragma once

#include "EngineContext.hpp"

// What happened during one fixed slice.
struct StepResult {
    int  bricksHit = 0;
    bool waveRegenerated = false;
    bool ballLost = false;
};

// PHYSICS (fixed slice integration + collisions)
//
// Mutates paddle, ball and bricks of the context. Never touches score or state;
// the caller feeds the StepResult to the GameStateMachine.
class Physics {
public:
    static constexpr float MAX_BOUNCE_ANGLE_DEG = 60.0f;
    static constexpr float EDGE_THRESHOLD       = 0.7f;  // |hit| beyond this gets the boost
    static constexpr float EDGE_BOOST           = 0.2f;  // +20% at the very edge
    static constexpr float BRICK_SPEEDUP        = 1.02f;

    // No-op unless the context is Playing. dt must be finite and positive.
    StepResult advance(EngineContext& ctx, float dt, const PaddleInput& input) const;

private:
    void movePaddle(EngineContext& ctx, float dt, const PaddleInput& input) const;
    void bounceWalls(EngineContext& ctx) const;
    bool bouncePaddle(EngineContext& ctx) const;
    bool hitBricks(EngineContext& ctx) const;
};
