#include "EngineContext.hpp"

const char* toString(GameState::Kind kind) {
    switch (kind) {
        case GameState::Kind::Playing:        return "Playing";
        case GameState::Kind::GameOverPrompt: return "GameOverPrompt";
        case GameState::Kind::NameEntry:      return "NameEntry";
        case GameState::Kind::Restarting:     return "Restarting";
    }
    return "?";
}

namespace {

GameConfig sanitized(GameConfig cfg) {
    cfg.sanitize();
    return cfg;
}

} // namespace

EngineContext::EngineContext(const GameConfig& cfg)
    : config(sanitized(cfg)), bricks(config.brickRows, config.maxBrickColumns)
{
    bricks.layout(config.interiorWidth());
    resetWorld();
}

void EngineContext::resetWorld() {
    paddle.w = config.paddleWidth;
    paddle.y = config.paddleRow();
    paddle.speed = config.paddleSpeed;
    paddle.x = (float)(config.fieldWidth - paddle.w) / 2.0f;

    ball.x  = (float)config.fieldWidth / 2.0f;
    ball.y  = (float)(paddle.y - 2);
    ball.vx = config.ballStartSpeedX;
    ball.vy = config.ballStartSpeedY;

    bricks.regenerate();
    input = PaddleInput{};
}
