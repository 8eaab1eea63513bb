#pragma once

#include "EngineContext.hpp"
#include "HighScoreStore.hpp"

#include <string>
#include <vector>

// One full text frame, every row the same width.
using TextFrame = std::vector<std::string>;

std::string joinFrame(const TextFrame& frame);

// Where finished frames go. Destroying the surface unmounts it from the host.
class ITextSurface {
public:
    virtual ~ITextSurface() = default;
    virtual void draw(const TextFrame& frame) = 0;
};

// RENDERER (text grid)
class Renderer {
public:
    static constexpr int PANEL_WIDTH  = 24;
    static constexpr int PANEL_GAP    = 2;
    static constexpr int PANEL_ROWS   = 10;
    static constexpr int NAME_COLUMNS = 10;

    static constexpr char BALL   = 'O';
    static constexpr char TRAIL  = '.';
    static constexpr char PADDLE = '=';

    // Playfield, prompt and scoreboard. Remembers the ball cell for the trail.
    TextFrame compose(const EngineContext& ctx, const HighScoreStore& store);

    // Pushes the frame only if it differs from the last one presented.
    bool present(ITextSurface& surface, const TextFrame& frame);

    // Forget the previous frame and trail (new surface).
    void reset();

    static std::vector<std::string> promptLines(const EngineContext& ctx);
    static std::vector<std::string> scoreboardLines(const EngineContext& ctx, const HighScoreStore& store);
    static std::string formatScoreRow(int rank, const HighScoreEntry& entry);

private:
    void drawField(TextFrame& field, const EngineContext& ctx);
    static void drawPrompt(TextFrame& field, const EngineContext& ctx);

    bool haveLastBall_ = false;
    int  lastBallCol_  = 0;
    int  lastBallRow_  = 0;

    bool      havePrevious_ = false;
    TextFrame previous_;
};
