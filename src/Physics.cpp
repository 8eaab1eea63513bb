#include "Physics.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

constexpr float Physics::MAX_BOUNCE_ANGLE_DEG;
constexpr float Physics::EDGE_THRESHOLD;
constexpr float Physics::EDGE_BOOST;
constexpr float Physics::BRICK_SPEEDUP;

namespace {

constexpr float PI = 3.14159265358979f;

int cellOf(float v) { return (int)std::lround(v); }

} // namespace

StepResult Physics::advance(EngineContext& ctx, float dt, const PaddleInput& input) const {
    StepResult result;
    if (!ctx.state.is(GameState::Kind::Playing)) return result;
    if (!std::isfinite(dt) || dt <= 0.0f) return result;

    movePaddle(ctx, dt, input);

    Ball& ball = ctx.ball;
    ball.x += ball.vx * dt;
    ball.y += ball.vy * dt;

    bounceWalls(ctx);
    bouncePaddle(ctx);

    if (hitBricks(ctx)) {
        result.bricksHit = 1;
        if (!ctx.bricks.remaining()) {
            ctx.bricks.regenerate();
            result.waveRegenerated = true;
            spdlog::debug("wave cleared, regenerated {} bricks", ctx.bricks.aliveCount());
        }
    }

    if (cellOf(ball.y) >= ctx.config.bottomRow()) result.ballLost = true;
    return result;
}

void Physics::movePaddle(EngineContext& ctx, float dt, const PaddleInput& input) const {
    Paddle& p = ctx.paddle;
    float dir = 0.0f;
    if (input.right) dir += 1.0f;
    if (input.left) dir -= 1.0f;
    p.x += p.speed * dt * dir;

    // stay inside the side walls
    const float maxX = (float)(ctx.config.fieldWidth - 1 - p.w);
    p.x = std::max(1.0f, std::min(p.x, maxX));
}

void Physics::bounceWalls(EngineContext& ctx) const {
    Ball& ball = ctx.ball;
    const float right = (float)(ctx.config.fieldWidth - 2);

    if (ball.x < 1.0f) {
        ball.x = 1.0f;
        ball.vx = std::fabs(ball.vx);
    } else if (ball.x > right) {
        ball.x = right;
        ball.vx = -std::fabs(ball.vx);
    }

    if (ball.y < 1.0f) {
        ball.y = 1.0f;
        ball.vy = std::fabs(ball.vy);
    }
}

bool Physics::bouncePaddle(EngineContext& ctx) const {
    Ball& ball = ctx.ball;
    const Paddle& p = ctx.paddle;

    if (ball.vy <= 0.0f) return false;
    if (ball.y < (float)(p.y - 1) || ball.y > (float)p.y) return false;

    // same cells the renderer draws: lround(x) .. lround(x) + w - 1
    const int left = cellOf(p.x);
    const int col = cellOf(ball.x);
    if (col < left || col > left + p.w - 1) return false;

    // -1 on the leftmost cell, 0 at the center, +1 on the rightmost cell
    const float center = (float)left + (float)(p.w - 1) / 2.0f;
    const float halfWidth = std::max(0.5f, (float)(p.w - 1) / 2.0f);
    float hit = (ball.x - center) / halfWidth;
    hit = std::max(-1.0f, std::min(hit, 1.0f));

    float speed = std::sqrt(ball.vx * ball.vx + ball.vy * ball.vy);
    speed = std::max(ctx.config.minBallSpeed, std::min(speed, ctx.config.maxBallSpeed));

    const float angle = hit * MAX_BOUNCE_ANGLE_DEG * PI / 180.0f;

    // Applied after the clamp, so an edge hit can go slightly past maxBallSpeed.
    const float edge = std::fabs(hit);
    if (edge > EDGE_THRESHOLD) {
        speed *= 1.0f + EDGE_BOOST * (edge - EDGE_THRESHOLD) / (1.0f - EDGE_THRESHOLD);
    }

    ball.vx = speed * std::sin(angle);
    ball.vy = -std::fabs(speed * std::cos(angle));
    ball.y = (float)(p.y - 1);
    return true;
}

bool Physics::hitBricks(EngineContext& ctx) const {
    Ball& ball = ctx.ball;
    const int row = cellOf(ball.y);
    if (row < ctx.bricks.firstRow() || row > ctx.bricks.lastRow()) return false;

    if (!ctx.bricks.testHit(cellOf(ball.x), row)) return false;

    ball.vy = -ball.vy;
    ball.vx *= BRICK_SPEEDUP;
    ball.vy *= BRICK_SPEEDUP;

    const float speed = std::sqrt(ball.vx * ball.vx + ball.vy * ball.vy);
    const float cap = ctx.config.maxBallSpeed;
    if (speed > cap) {
        ball.vx *= cap / speed;
        ball.vy *= cap / speed;
    }
    return true;
}
