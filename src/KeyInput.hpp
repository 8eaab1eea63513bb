#pragma once

// Platform-neutral key event. Hosts translate their own events into this.
enum class Key { Left, Right, Enter, Backspace, Escape, Character, Other };

struct KeyInput {
    Key  code = Key::Other;
    char text = '\0'; // printable character when code == Key::Character

    static KeyInput of(Key k) { KeyInput in; in.code = k; return in; }
    static KeyInput character(char c) { KeyInput in; in.code = Key::Character; in.text = c; return in; }
};

// Receives raw key events from the host.
class IKeyListener {
public:
    virtual ~IKeyListener() = default;
    virtual void onKeyDown(const KeyInput& key) = 0;
    virtual void onKeyUp(const KeyInput& key) = 0;
};
