#include "SfmlAdapters.hpp"

#include <utility>

void SfmlFrameScheduler::runPending() {
    if (!pending_) return;
    std::function<void()> tick = std::move(pending_);
    pending_ = nullptr;
    tick();
}

bool translateKeyEvent(const sf::Event& e, KeyInput& out, bool& released) {
    released = false;

    if (e.type == sf::Event::TextEntered) {
        // control characters (enter, backspace, escape) arrive as KeyPressed too
        const sf::Uint32 u = e.text.unicode;
        if (u < 32 || u > 126) return false;
        out = KeyInput::character((char)u);
        return true;
    }

    if (e.type != sf::Event::KeyPressed && e.type != sf::Event::KeyReleased) return false;
    released = (e.type == sf::Event::KeyReleased);

    switch (e.key.code) {
        case sf::Keyboard::Left:      out = KeyInput::of(Key::Left); return true;
        case sf::Keyboard::Right:     out = KeyInput::of(Key::Right); return true;
        case sf::Keyboard::Enter:     out = KeyInput::of(Key::Enter); return true;
        case sf::Keyboard::Backspace: out = KeyInput::of(Key::Backspace); return true;
        case sf::Keyboard::Escape:    out = KeyInput::of(Key::Escape); return true;
        default: break;
    }
    return false;
}
