#pragma once

#include "EngineContext.hpp"
#include "GameStateMachine.hpp"
#include "HighScoreStore.hpp"
#include "KeyInput.hpp"
#include "Physics.hpp"
#include "Renderer.hpp"

#include <functional>
#include <memory>
#include <string>

// HOST-FACING SEAMS

class IClock {
public:
    virtual ~IClock() = default;
    virtual double nowSeconds() = 0;
};

// Animation-frame style: at most one pending tick.
class IFrameScheduler {
public:
    virtual ~IFrameScheduler() = default;
    virtual void scheduleNextTick(std::function<void()> tick) = 0;
    virtual void cancel() = 0;
    virtual bool pending() const = 0;
};

class IEngineHost {
public:
    virtual ~IEngineHost() = default;

    virtual std::unique_ptr<ITextSurface> mountSurface() = 0;
    virtual void attachKeyListener(IKeyListener* listener) = 0;
    virtual void detachKeyListener(IKeyListener* listener) = 0;
    virtual void printLine(const std::string& line) = 0;
};

// SIMULATION LOOP
//
// Fixed-timestep driver. Each tick clamps the wall-clock delta, accumulates it
// and drains it in fixed slices, stepping physics only while Playing, then
// renders once and schedules the next tick.
class Engine final : public IKeyListener {
public:
    Engine(const GameConfig& config,
           IEngineHost& host,
           IFrameScheduler& scheduler,
           IClock& clock,
           std::unique_ptr<IScoreStorage> storage);
    ~Engine() override;

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    void start();
    // Cancels the pending tick, detaches input and unmounts before returning.
    void stop();
    bool running() const { return running_; }

    void onKeyDown(const KeyInput& key) override;
    void onKeyUp(const KeyInput& key) override;

    // One scheduled frame. Public so hosts and tests can drive it directly.
    void tick();

    // Runs exactly one fixed slice (no clock involved).
    void step();

    const EngineContext& context() const { return ctx_; }
    EngineContext& context() { return ctx_; }
    const HighScoreStore& scores() const { return store_; }
    int stepsTaken() const { return stepsTaken_; }

private:
    void render();
    void scheduleTick();

    IEngineHost&     host_;
    IFrameScheduler& scheduler_;
    IClock&          clock_;

    EngineContext    ctx_;
    HighScoreStore   store_;
    Physics          physics_;
    GameStateMachine machine_;
    Renderer         renderer_;

    std::unique_ptr<ITextSurface> surface_;

    bool   running_     = false;
    double lastTime_    = 0.0;
    double accumulator_ = 0.0;
    int    stepsTaken_  = 0;
};
