#include "ConsoleHost.hpp"
#include "Engine.hpp"
#include "GameConfig.hpp"
#include "HighScoreStore.hpp"
#include "Renderer.hpp"
#include "SfmlAdapters.hpp"

#include <SFML/Graphics.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

// MAIN (SFML entry point)

int main() {
    GameConfig config;
    loadGameConfig("brickterm.json", config);
    spdlog::set_level(spdlog::level::from_str(config.logLevel));

    sf::Font font;
    if (!font.loadFromFile(config.fontPath)) {
        spdlog::error("could not load font {}", config.fontPath);
        return -1;
    }

    // size the window for the field plus the scoreboard, in monospace cells
    const unsigned int size = (unsigned int)config.fontSize;
    const float cellW = font.getGlyph('M', size, false).advance;
    const float cellH = font.getLineSpacing(size);
    const int columns = config.fieldWidth + Renderer::PANEL_GAP + Renderer::PANEL_WIDTH;
    const int rows = std::max(config.fieldHeight, 24) + 1;

    sf::RenderWindow window(sf::VideoMode((unsigned int)std::ceil(columns * cellW) + 16,
                                          (unsigned int)std::ceil(rows * cellH) + 16),
                            "brickterm");
    window.setFramerateLimit(60);

    ConsoleHost host(font, size);
    SfmlFrameScheduler scheduler;
    SfmlClock clock;

    Engine engine(config, host, scheduler, clock,
                  std::make_unique<FileScoreStorage>(config.highScorePath));

    host.registerCommand("breakout", [&engine](const std::vector<std::string>&) {
        engine.start();
    }, "Play breakout (arrows move, Esc quits)");

    host.printLine("brickterm ready. Type 'help' for commands.");

    while (window.isOpen()) {
        sf::Event e;
        while (window.pollEvent(e)) {
            if (e.type == sf::Event::Closed) {
                engine.stop();
                window.close();
                break;
            }
            host.handleEvent(e);
        }
        if (!window.isOpen()) break;

        scheduler.runPending();
        host.draw(window);
    }

    return 0;
}
