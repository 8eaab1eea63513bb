#include "Engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

Engine::Engine(const GameConfig& config,
               IEngineHost& host,
               IFrameScheduler& scheduler,
               IClock& clock,
               std::unique_ptr<IScoreStorage> storage)
    : host_(host), scheduler_(scheduler), clock_(clock),
      ctx_(config), store_(std::move(storage)), machine_(store_)
{
}

Engine::~Engine() {
    stop();
}

void Engine::start() {
    if (running_) return;

    store_.load();

    ctx_.state = GameState::playing();
    ctx_.score = 0;
    ctx_.resetWorld();

    surface_ = host_.mountSurface();
    renderer_.reset();
    host_.attachKeyListener(this);

    lastTime_ = clock_.nowSeconds();
    accumulator_ = 0.0;
    running_ = true;
    spdlog::info("breakout started ({}x{} field, {} bricks)",
                 ctx_.config.fieldWidth, ctx_.config.fieldHeight, ctx_.bricks.aliveCount());

    render();
    scheduleTick();
}

void Engine::stop() {
    if (!running_) return;
    running_ = false;

    // order matters: nothing may call back into us after this returns
    scheduler_.cancel();
    host_.detachKeyListener(this);
    surface_.reset();

    spdlog::info("breakout stopped after {} steps", stepsTaken_);
    host_.printLine("breakout exited");
}

void Engine::onKeyDown(const KeyInput& key) {
    if (!running_) return;
    if (machine_.onKeyDown(ctx_, key) == InputOutcome::Exit) stop();
}

void Engine::onKeyUp(const KeyInput& key) {
    if (!running_) return;
    machine_.onKeyUp(ctx_, key);
}

void Engine::tick() {
    if (!running_) return;

    const double now = clock_.nowSeconds();
    double dt = now - lastTime_;
    lastTime_ = now;

    // backgrounded hosts come back with huge deltas; clocks can jump backwards
    if (!std::isfinite(dt) || dt < 0.0) dt = 0.0;
    dt = std::min(dt, (double)ctx_.config.maxFrameDelta);
    accumulator_ += dt;

    const double slice = ctx_.config.fixedStep;
    while (accumulator_ >= slice) {
        accumulator_ -= slice;
        // not Playing: time passes, the world doesn't
        if (ctx_.state.is(GameState::Kind::Playing)) step();
    }

    render();
    scheduleTick();
}

void Engine::step() {
    const StepResult result = physics_.advance(ctx_, ctx_.config.fixedStep, ctx_.input);
    machine_.onStep(ctx_, result);
    ++stepsTaken_;
}

void Engine::render() {
    if (!surface_) return;
    renderer_.present(*surface_, renderer_.compose(ctx_, store_));
}

void Engine::scheduleTick() {
    if (!running_) return;
    scheduler_.scheduleNextTick([this]() { tick(); });
}
