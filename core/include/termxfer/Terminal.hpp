// Terminal runtime capability: raw mode, screen clearing, frame rendering and key input.
// The activity builds a Frame; how it is painted is up to the implementation.
#pragma once
#include "Config.hpp"
#include "LogRing.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace termxfer {

struct KeyEvent {
    enum class Key {
        Char, Enter, Esc, Backspace, Tab, BackTab, Delete,
        Up, Down, Left, Right, PageUp, PageDown, Home, End,
        Resize
    };
    Key key = Key::Char;
    char ch = 0;       // for Key::Char
    bool ctrl = false; // Ctrl+letter arrives as Char with ctrl set

    static KeyEvent character(char c, bool ctrl = false) {
        KeyEvent e;
        e.key = Key::Char;
        e.ch = c;
        e.ctrl = ctrl;
        return e;
    }
    static KeyEvent special(Key k) {
        KeyEvent e;
        e.key = k;
        return e;
    }
    bool is(char c) const { return key == Key::Char && ch == c && !ctrl; }
    bool isCtrl(char c) const { return key == Key::Char && ch == c && ctrl; }
};

struct PaneView {
    std::string title;
    std::vector<std::string> lines;
    std::vector<bool> marked;
    std::size_t cursor = 0;
    bool focused = false;
    std::string colour;
};

struct PopupView {
    std::string title;
    std::vector<std::string> lines;
    std::optional<std::string> input;    // text field, if any
    std::vector<std::string> options;    // buttons or list items
    bool list = false;                   // options are a scrollable list, not buttons
    std::size_t selected = 0;
    std::optional<double> progress;      // 0..1, first bar
    std::optional<double> progressTotal; // 0..1, second bar
    std::string colour;
};

struct LogLine {
    LogLevel level = LogLevel::Info;
    std::string text;
};

struct Frame {
    PaneView left;
    PaneView right;
    std::vector<LogLine> log;
    std::size_t logCursor = 0;
    bool logFocused = false;
    int logHeight = 8;
    std::string status;
    std::string footer;
    std::vector<PopupView> popups; // bottom to top
    Theme theme;
};

class Terminal {
public:
    virtual ~Terminal() = default;

    virtual bool clearScreen(std::string& err) = 0;
    virtual bool enableRawMode(std::string& err) = 0;
    virtual bool disableRawMode(std::string& err) = 0;

    virtual void render(const Frame& frame) = 0;
    // Wait at most timeout for one input event.
    virtual std::optional<KeyEvent> pollEvent(std::chrono::milliseconds timeout) = 0;
};

} // namespace termxfer
