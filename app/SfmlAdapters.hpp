#pragma once

#include "Engine.hpp"
#include "KeyInput.hpp"

#include <SFML/Graphics.hpp>

#include <functional>
#include <utility>

// SFML: wall clock for the simulation loop
class SfmlClock final : public IClock {
    sf::Clock clock_;
public:
    double nowSeconds() override { return (double)clock_.getElapsedTime().asMicroseconds() / 1e6; }
};

// Holds the single pending tick; the window loop runs it once per displayed frame.
class SfmlFrameScheduler final : public IFrameScheduler {
    std::function<void()> pending_;
public:
    void scheduleNextTick(std::function<void()> tick) override { pending_ = std::move(tick); }
    void cancel() override { pending_ = nullptr; }
    bool pending() const override { return static_cast<bool>(pending_); }

    // Runs the tick scheduled before this call. A tick may schedule the next one.
    void runPending();
};

// sf::Event -> KeyInput. Returns false for events the engine has no use for.
// KeyPressed/KeyReleased carry the control keys, TextEntered the printable characters.
bool translateKeyEvent(const sf::Event& e, KeyInput& out, bool& released);
