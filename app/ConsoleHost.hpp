#pragma once

#include "Engine.hpp"

#include <SFML/Graphics.hpp>

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// A small text console that hosts the engine: scrollback, one input line,
// a few commands, and a text surface the engine can mount over it.
class ConsoleHost final : public IEngineHost {
public:
    using CommandHandler = std::function<void(const std::vector<std::string>& args)>;

    ConsoleHost(const sf::Font& font, unsigned int characterSize);

    void registerCommand(const std::string& name, CommandHandler handler, const std::string& description);
    void runCommand(const std::string& line);

    // Routes one SFML event either to attached key listeners or to the prompt.
    void handleEvent(const sf::Event& e);
    void draw(sf::RenderWindow& window);

    // IEngineHost
    std::unique_ptr<ITextSurface> mountSurface() override;
    void attachKeyListener(IKeyListener* listener) override;
    void detachKeyListener(IKeyListener* listener) override;
    void printLine(const std::string& line) override;

    void clear() { scrollback_.clear(); }

private:
    class Surface;
    friend class Surface;

    struct Command {
        CommandHandler handler;
        std::string    description;
    };

    void editPrompt(const sf::Event& e);

    const sf::Font& font_;
    unsigned int    characterSize_;

    std::map<std::string, Command> commands_;
    std::deque<std::string>        scrollback_;
    std::string                    input_;

    std::vector<IKeyListener*> listeners_;
    Surface*                   surface_ = nullptr;
};
