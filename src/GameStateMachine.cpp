#include "GameStateMachine.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstddef>
#include <utility>

constexpr const char* GameStateMachine::DEFAULT_NAME;

std::string resolveName(const std::string& buffer) {
    const std::size_t first = buffer.find_first_not_of(' ');
    if (first == std::string::npos) return GameStateMachine::DEFAULT_NAME;
    const std::size_t last = buffer.find_last_not_of(' ');
    return buffer.substr(first, last - first + 1);
}

InputOutcome GameStateMachine::onKeyDown(EngineContext& ctx, const KeyInput& key) {
    // exit works from anywhere
    if (key.code == Key::Escape) return InputOutcome::Exit;

    switch (ctx.state.kind) {
        case GameState::Kind::Playing:
            handlePlaying(ctx, key);
            break;
        case GameState::Kind::GameOverPrompt:
            handleGameOverPrompt(ctx, key);
            break;
        case GameState::Kind::NameEntry:
            handleNameEntry(ctx, key);
            break;
        case GameState::Kind::Restarting:
            // transient, never observed between events
            break;
    }
    return InputOutcome::None;
}

void GameStateMachine::onKeyUp(EngineContext& ctx, const KeyInput& key) {
    if (!ctx.state.is(GameState::Kind::Playing)) return;

    if (key.code == Key::Left) ctx.input.left = false;
    else if (key.code == Key::Right) ctx.input.right = false;
}

void GameStateMachine::onStep(EngineContext& ctx, const StepResult& step) {
    if (!ctx.state.is(GameState::Kind::Playing)) return;

    ctx.score += step.bricksHit;
    if (step.ballLost) {
        spdlog::info("ball lost, final score {}", ctx.score);
        ctx.input = PaddleInput{};
        enter(ctx, GameState::gameOverPrompt());
    }
}

void GameStateMachine::restart(EngineContext& ctx) {
    enter(ctx, GameState::restarting());
    ctx.score = 0;
    ctx.resetWorld();
    enter(ctx, GameState::playing());
}

void GameStateMachine::handlePlaying(EngineContext& ctx, const KeyInput& key) {
    if (key.code == Key::Left) ctx.input.left = true;
    else if (key.code == Key::Right) ctx.input.right = true;
}

void GameStateMachine::handleGameOverPrompt(EngineContext& ctx, const KeyInput& key) {
    if (key.code != Key::Character) return;

    const char c = (char)std::tolower((unsigned char)key.text);
    if (c == 'y') {
        enter(ctx, GameState::nameEntry());
    } else if (c == 'n') {
        restart(ctx);
    }
}

void GameStateMachine::handleNameEntry(EngineContext& ctx, const KeyInput& key) {
    std::string& buffer = ctx.state.nameBuffer;

    switch (key.code) {
        case Key::Character:
            if (buffer.size() < HighScoreStore::MAX_NAME && HighScoreStore::isNameChar(key.text))
                buffer.push_back(key.text);
            break;
        case Key::Backspace:
            if (!buffer.empty()) buffer.pop_back();
            break;
        case Key::Enter:
            confirmName(ctx);
            break;
        case Key::Left:
        case Key::Right:
        case Key::Escape:
        case Key::Other:
            break;
    }
}

void GameStateMachine::confirmName(EngineContext& ctx) {
    HighScoreEntry entry;
    entry.name  = resolveName(ctx.state.nameBuffer);
    entry.score = ctx.score;
    store_.record(entry);
    restart(ctx);
}

void GameStateMachine::enter(EngineContext& ctx, GameState next) {
    spdlog::debug("state {} -> {}", toString(ctx.state.kind), toString(next.kind));
    ctx.state = std::move(next);
}
