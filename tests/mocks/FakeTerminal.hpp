// Terminal double for activity tests: scripted key input, recorded frames and mode changes.
#pragma once
#include "termxfer/Terminal.hpp"
#include <deque>

class FakeTerminal : public termxfer::Terminal {
public:
    bool clearScreen(std::string&) override {
        ++clears;
        return true;
    }
    bool enableRawMode(std::string&) override {
        raw = true;
        ++rawEnables;
        return true;
    }
    bool disableRawMode(std::string&) override {
        raw = false;
        return true;
    }
    void render(const termxfer::Frame& frame) override {
        lastFrame = frame;
        ++renders;
    }
    std::optional<termxfer::KeyEvent> pollEvent(std::chrono::milliseconds) override {
        if (keys.empty()) return std::nullopt;
        termxfer::KeyEvent ev = keys.front();
        keys.pop_front();
        return ev;
    }

    void pushChar(char c) { keys.push_back(termxfer::KeyEvent::character(c)); }
    void pushKey(termxfer::KeyEvent::Key k) { keys.push_back(termxfer::KeyEvent::special(k)); }

    std::deque<termxfer::KeyEvent> keys;
    termxfer::Frame lastFrame;
    bool raw = false;
    int rawEnables = 0;
    int clears = 0;
    int renders = 0;
};
