#include "Renderer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>

constexpr int Renderer::PANEL_WIDTH;
constexpr int Renderer::PANEL_GAP;
constexpr int Renderer::PANEL_ROWS;
constexpr int Renderer::NAME_COLUMNS;
constexpr char Renderer::BALL;
constexpr char Renderer::TRAIL;
constexpr char Renderer::PADDLE;

namespace {

std::string fitWidth(std::string s, int width) {
    s.resize((std::size_t)width, ' ');
    return s;
}

} // namespace

std::string joinFrame(const TextFrame& frame) {
    std::string out;
    for (std::size_t i = 0; i < frame.size(); ++i) {
        if (i) out.push_back('\n');
        out += frame[i];
    }
    return out;
}

std::string Renderer::formatScoreRow(int rank, const HighScoreEntry& entry) {
    const std::string name = entry.name.substr(0, (std::size_t)NAME_COLUMNS);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%2d. %-10s %7d", rank, name.c_str(), entry.score);
    return std::string(buf);
}

std::vector<std::string> Renderer::scoreboardLines(const EngineContext& ctx, const HighScoreStore& store) {
    std::vector<std::string> lines;
    lines.push_back("SCORE " + std::to_string(ctx.score));
    lines.push_back("");
    lines.push_back("HIGH SCORES");
    lines.push_back(std::string((std::size_t)PANEL_WIDTH, '-'));

    // persisted entries only, never the score in progress
    const std::vector<HighScoreEntry> top = store.topN((std::size_t)PANEL_ROWS);
    for (std::size_t i = 0; i < top.size(); ++i) {
        lines.push_back(formatScoreRow((int)i + 1, top[i]));
    }
    if (top.empty()) lines.push_back("  (none yet)");
    return lines;
}

std::vector<std::string> Renderer::promptLines(const EngineContext& ctx) {
    switch (ctx.state.kind) {
        case GameState::Kind::GameOverPrompt:
            return { "GAME OVER  SCORE " + std::to_string(ctx.score), "", "SAVE SCORE? (Y/N)" };
        case GameState::Kind::NameEntry:
            return { "ENTER NAME:", "", ctx.state.nameBuffer + "_", "", "ENTER=SAVE" };
        case GameState::Kind::Playing:
        case GameState::Kind::Restarting:
            break;
    }
    return {};
}

TextFrame Renderer::compose(const EngineContext& ctx, const HighScoreStore& store) {
    const int W = ctx.config.fieldWidth;
    const int H = ctx.config.fieldHeight;

    TextFrame field((std::size_t)H, std::string((std::size_t)W, ' '));
    drawField(field, ctx);
    drawPrompt(field, ctx);

    const std::vector<std::string> panel = scoreboardLines(ctx, store);
    const std::string gap((std::size_t)PANEL_GAP, ' ');

    TextFrame frame;
    frame.reserve(field.size());
    for (std::size_t r = 0; r < field.size(); ++r) {
        const std::string side = r < panel.size() ? panel[r] : std::string();
        frame.push_back(field[r] + gap + fitWidth(side, PANEL_WIDTH));
    }
    return frame;
}

void Renderer::drawField(TextFrame& field, const EngineContext& ctx) {
    const int W = ctx.config.fieldWidth;
    const int H = ctx.config.fieldHeight;

    // borders
    for (int c = 0; c < W; ++c) {
        field[0][c] = '-';
        field[H - 1][c] = '-';
    }
    for (int r = 0; r < H; ++r) {
        const char wall = (r == 0 || r == H - 1) ? '+' : '|';
        field[r][0] = wall;
        field[r][W - 1] = wall;
    }

    // bricks: [##]
    for (const Brick& b : ctx.bricks.bricks()) {
        if (!b.alive) continue;
        for (int i = 0; i < b.w; ++i) {
            const int c = b.x + i;
            if (c <= 0 || c >= W - 1) continue;
            field[b.y][c] = (i == 0) ? '[' : (i == b.w - 1 ? ']' : '#');
        }
    }

    // paddle
    const int px = (int)std::lround(ctx.paddle.x);
    for (int i = 0; i < ctx.paddle.w; ++i) {
        const int c = px + i;
        if (c > 0 && c < W - 1) field[ctx.paddle.y][c] = PADDLE;
    }

    // ball and its one-frame-old trail
    const int bc = (int)std::lround(ctx.ball.x);
    const int br = (int)std::lround(ctx.ball.y);
    const bool inside = bc > 0 && bc < W - 1 && br > 0 && br < H - 1;

    if (haveLastBall_ && (lastBallCol_ != bc || lastBallRow_ != br)) {
        char& cell = field[lastBallRow_][lastBallCol_];
        if (cell == ' ') cell = TRAIL;
    }
    if (inside) {
        field[br][bc] = BALL;
        haveLastBall_ = true;
        lastBallCol_ = bc;
        lastBallRow_ = br;
    } else {
        haveLastBall_ = false;
    }
}

void Renderer::drawPrompt(TextFrame& field, const EngineContext& ctx) {
    const std::vector<std::string> lines = promptLines(ctx);
    if (lines.empty()) return;

    const int W = ctx.config.fieldWidth;
    const int H = ctx.config.fieldHeight;
    const int interior = W - 2;
    const int top = std::max(1, H / 2 - (int)lines.size() / 2);

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const int row = top + (int)i;
        if (row >= H - 1) break;

        const std::string text = lines[i].substr(0, (std::size_t)interior);
        const int col = 1 + (interior - (int)text.size()) / 2;
        for (std::size_t k = 0; k < text.size(); ++k) {
            field[row][col + (int)k] = text[k];
        }
    }
}

bool Renderer::present(ITextSurface& surface, const TextFrame& frame) {
    if (havePrevious_ && frame == previous_) return false;
    surface.draw(frame);
    previous_ = frame;
    havePrevious_ = true;
    return true;
}

void Renderer::reset() {
    havePrevious_ = false;
    previous_.clear();
    haveLastBall_ = false;
}
