#include "EngineContext.hpp"
#include "Fakes.hpp"
#include "HighScoreStore.hpp"
#include "Renderer.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <string>

namespace {

HighScoreEntry entry(const std::string& name, int score) {
    HighScoreEntry e;
    e.name = name;
    e.score = score;
    return e;
}

bool frameContains(const TextFrame& frame, const std::string& text) {
    for (const auto& row : frame)
        if (row.find(text) != std::string::npos) return true;
    return false;
}

} // namespace

TEST(Renderer, FrameHasFieldPlusPanelWidth) {
    EngineContext ctx;
    HighScoreStore store(nullptr);
    Renderer renderer;

    const TextFrame frame = renderer.compose(ctx, store);
    ASSERT_EQ(frame.size(), (std::size_t)ctx.config.fieldHeight);
    const std::size_t width = (std::size_t)(ctx.config.fieldWidth + Renderer::PANEL_GAP + Renderer::PANEL_WIDTH);
    for (const auto& row : frame) EXPECT_EQ(row.size(), width);

    const int W = ctx.config.fieldWidth;
    const int H = ctx.config.fieldHeight;
    EXPECT_EQ(frame[0][0], '+');
    EXPECT_EQ(frame[0][W - 1], '+');
    EXPECT_EQ(frame[H - 1][0], '+');
    EXPECT_EQ(frame[5][0], '|');
    EXPECT_EQ(frame[5][W - 1], '|');
    EXPECT_EQ(frame[0][5], '-');
}

TEST(Renderer, DrawsBricksPaddleAndBall) {
    EngineContext ctx;
    HighScoreStore store(nullptr);
    Renderer renderer;

    TextFrame frame = renderer.compose(ctx, store);
    EXPECT_EQ(frame[2].substr(3, 4), "[##]");
    EXPECT_EQ(frame[5].substr(33, 4), "[##]");

    const int px = 17; // lround(16.5)
    EXPECT_EQ(frame[ctx.paddle.y].substr(px, ctx.paddle.w), std::string((std::size_t)ctx.paddle.w, '='));
    EXPECT_EQ(frame[17][20], 'O');

    ctx.bricks.testHit(3, 2);
    frame = renderer.compose(ctx, store);
    EXPECT_EQ(frame[2].substr(3, 4), "    ");
}

TEST(Renderer, TrailMarksPreviousBallCellForOneFrame) {
    EngineContext ctx;
    HighScoreStore store(nullptr);
    Renderer renderer;

    renderer.compose(ctx, store);
    ctx.ball.x = 22.0f;
    ctx.ball.y = 15.0f;

    TextFrame frame = renderer.compose(ctx, store);
    EXPECT_EQ(frame[15][22], 'O');
    EXPECT_EQ(frame[17][20], '.');

    frame = renderer.compose(ctx, store);
    EXPECT_EQ(frame[15][22], 'O');
    EXPECT_EQ(frame[17][20], ' ');
}

TEST(Renderer, PromptsAreCenteredInField) {
    EngineContext ctx;
    HighScoreStore store(nullptr);
    Renderer renderer;

    ctx.score = 9;
    ctx.state = GameState::gameOverPrompt();
    TextFrame frame = renderer.compose(ctx, store);
    EXPECT_TRUE(frameContains(frame, "SAVE SCORE? (Y/N)"));
    EXPECT_TRUE(frameContains(frame, "GAME OVER  SCORE 9"));

    // "SAVE SCORE? (Y/N)" is 17 wide: 1 + (38 - 17) / 2 = 11
    bool found = false;
    for (const auto& row : frame) {
        if (row.compare(11, 17, "SAVE SCORE? (Y/N)") == 0) found = true;
    }
    EXPECT_TRUE(found);

    ctx.state = GameState::nameEntry();
    ctx.state.nameBuffer = "AC";
    frame = renderer.compose(ctx, store);
    EXPECT_TRUE(frameContains(frame, "ENTER NAME:"));
    EXPECT_TRUE(frameContains(frame, "AC_"));
    EXPECT_FALSE(frameContains(frame, "SAVE SCORE?"));
}

TEST(Renderer, ScoreRowHasFixedColumns) {
    EXPECT_EQ(Renderer::formatScoreRow(1, entry("AC", 5)),
              std::string(" 1. ") + "AC" + std::string(8, ' ') + " " + std::string(6, ' ') + "5");

    // long names are cut at ten characters
    const std::string row = Renderer::formatScoreRow(10, entry("abcdefghijkl", 1234567));
    EXPECT_EQ(row, "10. abcdefghij 1234567");
}

TEST(Renderer, ScoreboardShowsTopTenOfPersistedStoreOnly) {
    EngineContext ctx;
    HighScoreStore store(nullptr);
    for (int i = 1; i <= 12; ++i) store.record(entry("p" + std::to_string(i), i * 10));
    ctx.score = 999;

    const std::vector<std::string> lines = Renderer::scoreboardLines(ctx, store);
    EXPECT_EQ(lines[0], "SCORE 999");
    EXPECT_EQ(lines[2], "HIGH SCORES");
    ASSERT_EQ(lines.size(), 4u + 10u);
    EXPECT_EQ(lines[4], Renderer::formatScoreRow(1, entry("p12", 120)));
    EXPECT_EQ(lines[13], Renderer::formatScoreRow(10, entry("p3", 30)));
    // the score in progress never shows up among the ranks
    for (std::size_t i = 4; i < lines.size(); ++i) EXPECT_EQ(lines[i].find("999"), std::string::npos);

    Renderer renderer;
    const TextFrame frame = renderer.compose(ctx, store);
    EXPECT_FALSE(frameContains(frame, "p2 "));
    EXPECT_TRUE(frameContains(frame, "p3 "));
}

TEST(Renderer, PresentSkipsUnchangedFrames) {
    EngineContext ctx;
    HighScoreStore store(nullptr);
    Renderer renderer;
    auto log = std::make_shared<SurfaceLog>();
    RecordingSurface surface(log);

    const TextFrame a = renderer.compose(ctx, store);
    EXPECT_TRUE(renderer.present(surface, a));
    EXPECT_FALSE(renderer.present(surface, a));
    EXPECT_EQ(log->draws, 1);

    ctx.paddle.x += 3.0f;
    const TextFrame b = renderer.compose(ctx, store);
    EXPECT_TRUE(renderer.present(surface, b));
    EXPECT_EQ(log->draws, 2);
    EXPECT_EQ(log->last, b);

    renderer.reset();
    EXPECT_TRUE(renderer.present(surface, b));
    EXPECT_EQ(log->draws, 3);
}

TEST(Renderer, JoinFrameUsesNewlines) {
    EXPECT_EQ(joinFrame(TextFrame{"ab", "cd"}), "ab\ncd");
    EXPECT_EQ(joinFrame(TextFrame{}), "");
}
