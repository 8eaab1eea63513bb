#include "GameConfig.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

constexpr int   GameConfig::MAX_FIELD_WIDTH;
constexpr int   GameConfig::MAX_FIELD_HEIGHT;
constexpr float GameConfig::MAX_SPEED;
constexpr float GameConfig::MIN_FIXED_STEP;
constexpr float GameConfig::MAX_FIXED_STEP;
constexpr float GameConfig::MAX_FRAME_DELTA;
constexpr int   GameConfig::MAX_FONT_SIZE;

namespace {

// Each overlay leaves `field` alone when the key is absent and returns false
// when the value has the wrong type. Out-of-range numbers are pinned to a
// representable value here and pulled into range by sanitize().

bool overlay(const nlohmann::json& j, const char* key, int& field) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_integer()) return false;

    if (it->is_number_unsigned()) {
        const std::uint64_t v = it->get<std::uint64_t>();
        field = v > (std::uint64_t)std::numeric_limits<int>::max() ? std::numeric_limits<int>::max() : (int)v;
    } else {
        const std::int64_t v = it->get<std::int64_t>();
        field = (int)std::max<std::int64_t>(std::numeric_limits<int>::min(),
                                            std::min<std::int64_t>(v, std::numeric_limits<int>::max()));
    }
    return true;
}

bool overlay(const nlohmann::json& j, const char* key, float& field) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number()) return false;

    const double v = it->get<double>();
    if (!std::isfinite(v)) return false;
    const double limit = 1e9;
    field = (float)std::max(-limit, std::min(v, limit));
    return true;
}

bool overlay(const nlohmann::json& j, const char* key, std::string& field) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) return false;
    field = it->get<std::string>();
    return true;
}

float positiveOr(float value, float fallback) {
    return (std::isfinite(value) && value > 0.0f) ? value : fallback;
}

float clampSpeed(float value) {
    return std::max(-GameConfig::MAX_SPEED, std::min(value, GameConfig::MAX_SPEED));
}

} // namespace

void GameConfig::sanitize() {
    const GameConfig defaults;

    fieldWidth  = std::max(20, std::min(fieldWidth, MAX_FIELD_WIDTH));
    fieldHeight = std::max(12, std::min(fieldHeight, MAX_FIELD_HEIGHT));

    // paddle has to fit between the walls with room to move
    paddleWidth = std::max(1, std::min(paddleWidth, interiorWidth() - 2));

    paddleSpeed  = std::min(positiveOr(paddleSpeed, defaults.paddleSpeed), MAX_SPEED);
    minBallSpeed = std::min(positiveOr(minBallSpeed, defaults.minBallSpeed), MAX_SPEED);
    maxBallSpeed = std::min(positiveOr(maxBallSpeed, defaults.maxBallSpeed), MAX_SPEED);
    if (maxBallSpeed < minBallSpeed) std::swap(minBallSpeed, maxBallSpeed);

    if (!std::isfinite(ballStartSpeedX)) ballStartSpeedX = defaults.ballStartSpeedX;
    if (!std::isfinite(ballStartSpeedY) || ballStartSpeedY == 0.0f)
        ballStartSpeedY = defaults.ballStartSpeedY;
    ballStartSpeedX = clampSpeed(ballStartSpeedX);
    ballStartSpeedY = clampSpeed(ballStartSpeedY);

    // bricks live between row 2 and a few rows above the paddle
    brickRows       = std::max(1, std::min(brickRows, paddleRow() - 6));
    maxBrickColumns = std::max(1, std::min(maxBrickColumns, interiorWidth()));

    fixedStep     = positiveOr(fixedStep, defaults.fixedStep);
    fixedStep     = std::max(MIN_FIXED_STEP, std::min(fixedStep, MAX_FIXED_STEP));
    maxFrameDelta = positiveOr(maxFrameDelta, defaults.maxFrameDelta);
    maxFrameDelta = std::max(fixedStep, std::min(maxFrameDelta, MAX_FRAME_DELTA));

    fontSize = std::max(6, std::min(fontSize, MAX_FONT_SIZE));
}

bool parseGameConfig(const std::string& text, GameConfig& out) {
    GameConfig cfg = out;
    try {
        const nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            spdlog::warn("config root is not an object, using defaults");
            return false;
        }

        const bool typed =
            overlay(j, "fieldWidth", cfg.fieldWidth) &&
            overlay(j, "fieldHeight", cfg.fieldHeight) &&
            overlay(j, "paddleWidth", cfg.paddleWidth) &&
            overlay(j, "paddleSpeed", cfg.paddleSpeed) &&
            overlay(j, "ballStartSpeedX", cfg.ballStartSpeedX) &&
            overlay(j, "ballStartSpeedY", cfg.ballStartSpeedY) &&
            overlay(j, "minBallSpeed", cfg.minBallSpeed) &&
            overlay(j, "maxBallSpeed", cfg.maxBallSpeed) &&
            overlay(j, "brickRows", cfg.brickRows) &&
            overlay(j, "maxBrickColumns", cfg.maxBrickColumns) &&
            overlay(j, "fixedStep", cfg.fixedStep) &&
            overlay(j, "maxFrameDelta", cfg.maxFrameDelta) &&
            overlay(j, "highScorePath", cfg.highScorePath) &&
            overlay(j, "fontPath", cfg.fontPath) &&
            overlay(j, "fontSize", cfg.fontSize) &&
            overlay(j, "logLevel", cfg.logLevel);
        if (!typed) {
            spdlog::warn("config has a value of the wrong type, using defaults");
            return false;
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("config parse error ({}), using defaults", e.what());
        return false;
    }

    cfg.sanitize();
    out = cfg;
    return true;
}

bool loadGameConfig(const std::string& path, GameConfig& out) {
    std::ifstream f(path);
    if (!f) {
        spdlog::debug("no config at {}", path);
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    if (!parseGameConfig(ss.str(), out)) return false;

    spdlog::info("loaded config from {}", path);
    return true;
}
