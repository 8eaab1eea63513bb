#include "ConsoleHost.hpp"
#include "SfmlAdapters.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>

namespace {

const std::size_t MAX_SCROLLBACK = 200;

// Splits on spaces; single or double quotes group words.
std::vector<std::string> tokenize(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    char quote = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char ch = s[i];
        if (quote) {
            if (ch == quote) { quote = 0; continue; }
            if (ch == '\\' && i + 1 < s.size()) { cur += s[++i]; continue; }
            cur += ch;
        } else if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == ' ') {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
        } else {
            cur += ch;
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

} // namespace

// The engine's text surface. Lives as long as the engine keeps it mounted.
class ConsoleHost::Surface final : public ITextSurface {
    ConsoleHost& host_;
public:
    std::string text;

    explicit Surface(ConsoleHost& host) : host_(host) { host_.surface_ = this; }
    ~Surface() override {
        if (host_.surface_ == this) host_.surface_ = nullptr;
    }

    void draw(const TextFrame& frame) override { text = joinFrame(frame); }
};

ConsoleHost::ConsoleHost(const sf::Font& font, unsigned int characterSize)
    : font_(font), characterSize_(characterSize)
{
    registerCommand("help", [this](const std::vector<std::string>&) {
        printLine("Available commands:");
        for (const auto& kv : commands_) printLine("  " + kv.first + " - " + kv.second.description);
    }, "Show help");

    registerCommand("clear", [this](const std::vector<std::string>&) { clear(); }, "Clear the screen");
}

void ConsoleHost::registerCommand(const std::string& name, CommandHandler handler, const std::string& description) {
    commands_[name] = Command{ std::move(handler), description };
}

void ConsoleHost::runCommand(const std::string& line) {
    const std::vector<std::string> tokens = tokenize(line);
    if (tokens.empty()) return;

    auto it = commands_.find(tokens[0]);
    if (it == commands_.end()) {
        printLine("command not found: " + tokens[0]);
        return;
    }
    const std::vector<std::string> args(tokens.begin() + 1, tokens.end());
    it->second.handler(args);
}

void ConsoleHost::handleEvent(const sf::Event& e) {
    if (listeners_.empty()) {
        editPrompt(e);
        return;
    }

    KeyInput key;
    bool released = false;
    if (!translateKeyEvent(e, key, released)) return;

    // a listener may detach itself (exit) while we dispatch
    const std::vector<IKeyListener*> targets = listeners_;
    for (IKeyListener* l : targets) {
        if (std::find(listeners_.begin(), listeners_.end(), l) == listeners_.end()) continue;
        if (released) l->onKeyUp(key);
        else l->onKeyDown(key);
    }
}

void ConsoleHost::editPrompt(const sf::Event& e) {
    if (e.type == sf::Event::TextEntered) {
        const sf::Uint32 u = e.text.unicode;
        if (u >= 32 && u <= 126) input_.push_back((char)u);
        return;
    }
    if (e.type != sf::Event::KeyPressed) return;

    if (e.key.code == sf::Keyboard::Backspace) {
        if (!input_.empty()) input_.pop_back();
    } else if (e.key.code == sf::Keyboard::Enter) {
        const std::string line = input_;
        input_.clear();
        printLine("$ " + line);
        runCommand(line);
    }
}

void ConsoleHost::draw(sf::RenderWindow& window) {
    window.clear(sf::Color(16, 16, 16));

    sf::Text t;
    t.setFont(font_);
    t.setCharacterSize(characterSize_);
    t.setFillColor(sf::Color(200, 200, 200));
    t.setPosition(8.f, 8.f);

    if (surface_) {
        t.setString(surface_->text);
    } else {
        // as many trailing scrollback lines as fit above the prompt
        const float lineHeight = font_.getLineSpacing(characterSize_);
        const std::size_t fit = (std::size_t)std::max(1.f, (window.getSize().y - 16.f) / lineHeight) - 1;
        const std::size_t first = scrollback_.size() > fit ? scrollback_.size() - fit : 0;

        std::string text;
        for (std::size_t i = first; i < scrollback_.size(); ++i) text += scrollback_[i] + "\n";
        text += "$ " + input_ + "_";
        t.setString(text);
    }

    window.draw(t);
    window.display();
}

std::unique_ptr<ITextSurface> ConsoleHost::mountSurface() {
    return std::make_unique<Surface>(*this);
}

void ConsoleHost::attachKeyListener(IKeyListener* listener) {
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
        listeners_.push_back(listener);
}

void ConsoleHost::detachKeyListener(IKeyListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void ConsoleHost::printLine(const std::string& line) {
    scrollback_.push_back(line);
    while (scrollback_.size() > MAX_SCROLLBACK) scrollback_.pop_front();
    spdlog::debug("console: {}", line);
}
