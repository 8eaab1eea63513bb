#pragma once

#include <string>

// Tunable geometry and physics. Defaults are the shipped game; a JSON file
// may override any subset of keys.
struct GameConfig {
    // Hard limits applied by sanitize()
    static constexpr int   MAX_FIELD_WIDTH  = 200;
    static constexpr int   MAX_FIELD_HEIGHT = 100;
    static constexpr float MAX_SPEED        = 240.0f; // columns / second
    static constexpr float MIN_FIXED_STEP   = 1.0f / 1000.0f;
    static constexpr float MAX_FIXED_STEP   = 1.0f / 10.0f;
    static constexpr float MAX_FRAME_DELTA  = 1.0f;
    static constexpr int   MAX_FONT_SIZE    = 96;

    // Field, in grid cells (borders included)
    int fieldWidth  = 40;
    int fieldHeight = 22;

    // Paddle
    int   paddleWidth = 7;
    float paddleSpeed = 30.0f; // columns / second

    // Ball, columns / second
    float ballStartSpeedX = 8.0f;
    float ballStartSpeedY = -12.0f;
    float minBallSpeed    = 12.0f;
    float maxBallSpeed    = 30.0f;

    // Bricks
    int brickRows       = 4;
    int maxBrickColumns = 12;

    // Loop timing, seconds
    float fixedStep     = 1.0f / 60.0f;
    float maxFrameDelta = 0.25f;

    // Host side
    std::string highScorePath = "brickterm_scores.json";
    std::string fontPath      = "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf";
    int         fontSize      = 18;
    std::string logLevel      = "info";

    int interiorWidth() const { return fieldWidth - 2; }
    int paddleRow() const { return fieldHeight - 3; }
    int bottomRow() const { return fieldHeight - 1; }

    // Pull values back into ranges the simulation can live with.
    void sanitize();
};

// Overlays keys found in the JSON object at `path` onto `out`.
// Returns false (leaving `out` untouched) when the file is missing, malformed,
// or holds a value of the wrong type (integer keys take JSON integers only).
bool loadGameConfig(const std::string& path, GameConfig& out);

// Same as above but from an in-memory document.
bool parseGameConfig(const std::string& text, GameConfig& out);
