#include "Engine.hpp"
#include "Fakes.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace {

class EngineTest : public ::testing::Test {
protected:
    std::shared_ptr<StorageState> storage = std::make_shared<StorageState>();
    FakeHost host;
    FakeScheduler scheduler;
    FakeClock clock;
    Engine engine{GameConfig(), host, scheduler, clock, memoryStorage(storage)};

    void frame(double seconds) {
        clock.advance(seconds);
        ASSERT_TRUE(scheduler.runPending());
    }

    // Drops the ball straight into the bottom row, far from the paddle.
    void loseBall() {
        Ball& ball = engine.context().ball;
        ball.x = 2.0f;
        ball.y = 20.4f;
        ball.vx = 0.0f;
        ball.vy = 12.0f;
        engine.step();
    }

    bool shown(const std::string& text) const {
        for (const auto& row : host.surface->last)
            if (row.find(text) != std::string::npos) return true;
        return false;
    }
};

} // namespace

TEST_F(EngineTest, StartMountsAttachesDrawsAndSchedules) {
    engine.start();

    EXPECT_TRUE(engine.running());
    EXPECT_EQ(host.mounts, 1);
    EXPECT_TRUE(host.surface->mounted);
    ASSERT_EQ(host.listeners.size(), 1u);
    EXPECT_EQ(host.listeners[0], &engine);
    EXPECT_EQ(host.surface->draws, 1);
    EXPECT_TRUE(scheduler.pending());
    EXPECT_TRUE(engine.context().state.is(GameState::Kind::Playing));
    EXPECT_EQ(engine.context().score, 0);
}

TEST_F(EngineTest, StartLoadsPersistedScores) {
    storage->present = true;
    storage->data = R"([{"name":"ann","score":12}])";
    engine.start();

    ASSERT_EQ(engine.scores().entries().size(), 1u);
    EXPECT_TRUE(shown("ann"));
}

TEST_F(EngineTest, TickRunsWholeSlicesOfElapsedTime) {
    engine.start();
    const float y0 = engine.context().ball.y;

    frame(0.051);
    EXPECT_EQ(engine.stepsTaken(), 3);
    EXPECT_NEAR(engine.context().ball.y, y0 - 12.0f * 3.0f / 60.0f, 1e-3f);
    EXPECT_TRUE(scheduler.pending());

    // the leftover carries into the next frame
    frame(0.016);
    EXPECT_EQ(engine.stepsTaken(), 4);
}

TEST_F(EngineTest, HugeDeltaIsClamped) {
    engine.start();
    frame(10.0);

    // 0.25 s of 1/60 slices; float rounding may leave the last one for later
    EXPECT_GE(engine.stepsTaken(), 14);
    EXPECT_LE(engine.stepsTaken(), 15);
}

TEST_F(EngineTest, BackwardsClockIsIgnored) {
    engine.start();
    frame(-5.0);
    EXPECT_EQ(engine.stepsTaken(), 0);
    EXPECT_TRUE(scheduler.pending());
}

TEST_F(EngineTest, TimeDoesNotAdvanceWorldOutsidePlaying) {
    engine.start();
    loseBall();
    ASSERT_TRUE(engine.context().state.is(GameState::Kind::GameOverPrompt));
    const int steps = engine.stepsTaken();
    const Ball ball = engine.context().ball;

    frame(0.2);
    frame(0.2);
    EXPECT_EQ(engine.stepsTaken(), steps);
    EXPECT_FLOAT_EQ(engine.context().ball.y, ball.y);
    EXPECT_TRUE(shown("SAVE SCORE? (Y/N)"));

    // back to Playing: only the sub-slice remainder carries over, not the frozen time
    host.type("n");
    frame(0.02);
    EXPECT_GE(engine.stepsTaken(), steps + 1);
    EXPECT_LE(engine.stepsTaken(), steps + 2);
}

TEST_F(EngineTest, EscapeTearsDownEverything) {
    engine.start();
    frame(0.02);
    host.keyDown(KeyInput::of(Key::Escape));

    EXPECT_FALSE(engine.running());
    EXPECT_FALSE(scheduler.pending());
    EXPECT_TRUE(host.listeners.empty());
    EXPECT_FALSE(host.surface->mounted);
    ASSERT_EQ(host.printed.size(), 1u);
    EXPECT_EQ(host.printed[0], "breakout exited");

    // later keys and stops are no-ops
    host.keyDown(KeyInput::of(Key::Left));
    engine.stop();
    EXPECT_EQ(host.printed.size(), 1u);
    EXPECT_FALSE(engine.context().input.left);
}

TEST_F(EngineTest, EscapeFromNameEntryRecordsNothing) {
    engine.start();
    engine.context().score = 4;
    loseBall();
    host.type("yAB");
    host.keyDown(KeyInput::of(Key::Escape));

    EXPECT_FALSE(engine.running());
    EXPECT_TRUE(engine.scores().entries().empty());
    EXPECT_EQ(storage->writes, 0);
}

TEST_F(EngineTest, DecliningToSaveStartsFreshGame) {
    engine.start();
    engine.context().score = 7;
    engine.context().bricks.testHit(4, 2);
    loseBall();

    host.type("n");

    const EngineContext& ctx = engine.context();
    EXPECT_TRUE(ctx.state.is(GameState::Kind::Playing));
    EXPECT_EQ(ctx.score, 0);
    EXPECT_EQ(ctx.bricks.aliveCount(), 28);
    EXPECT_FLOAT_EQ(ctx.ball.x, 20.0f);
    EXPECT_FLOAT_EQ(ctx.ball.y, 17.0f);
    EXPECT_TRUE(engine.scores().entries().empty());
    EXPECT_EQ(storage->writes, 0);
}

TEST_F(EngineTest, SavedNameShowsOnScoreboard) {
    engine.start();
    engine.context().score = 5;
    loseBall();

    host.type("y");
    host.type("AB");
    host.keyDown(KeyInput::of(Key::Backspace));
    host.type("C");
    host.keyDown(KeyInput::of(Key::Enter));

    ASSERT_EQ(engine.scores().entries().size(), 1u);
    EXPECT_EQ(engine.scores().entries()[0].name, "AC");
    EXPECT_EQ(engine.scores().entries()[0].score, 5);
    EXPECT_EQ(storage->data, R"([{"name":"AC","score":5}])");
    EXPECT_TRUE(engine.context().state.is(GameState::Kind::Playing));

    frame(0.0);
    EXPECT_TRUE(shown(Renderer::formatScoreRow(1, engine.scores().entries()[0])));
    EXPECT_TRUE(shown("SCORE 0"));
}

TEST_F(EngineTest, UnchangedFrameIsNotRedrawn) {
    engine.start();
    loseBall();

    // the first frame shows the prompt, the second drops the trail
    frame(0.1);
    frame(0.1);
    const int draws = host.surface->draws;
    frame(0.1);
    frame(0.1);
    EXPECT_EQ(host.surface->draws, draws);
}

TEST(EngineDeterminism, SameInputsSameWorld) {
    FakeHost hostA, hostB;
    FakeScheduler schedA, schedB;
    FakeClock clockA, clockB;
    Engine a(GameConfig(), hostA, schedA, clockA, nullptr);
    Engine b(GameConfig(), hostB, schedB, clockB, nullptr);
    a.start();
    b.start();

    const double deltas[] = { 0.016, 0.017, 0.033, 0.5, 0.001, 0.02 };
    for (int i = 0; i < 300; ++i) {
        if (i % 40 == 0) {
            hostA.keyDown(KeyInput::of(Key::Left));
            hostB.keyDown(KeyInput::of(Key::Left));
        }
        if (i % 40 == 20) {
            hostA.keyUp(KeyInput::of(Key::Left));
            hostB.keyUp(KeyInput::of(Key::Left));
        }
        const double dt = deltas[i % 6];
        clockA.advance(dt);
        clockB.advance(dt);
        schedA.runPending();
        schedB.runPending();
    }

    EXPECT_EQ(a.stepsTaken(), b.stepsTaken());
    EXPECT_EQ(a.context().ball.x, b.context().ball.x);
    EXPECT_EQ(a.context().ball.y, b.context().ball.y);
    EXPECT_EQ(a.context().paddle.x, b.context().paddle.x);
    EXPECT_EQ(a.context().score, b.context().score);
    EXPECT_EQ(hostA.surface->last, hostB.surface->last);
}
