// ncurses implementation of the terminal runtime: two panes side by side, the log panel
// below them, a status line, and popups stacked in the middle of the screen.
#pragma once
#include "termxfer/Terminal.hpp"
#include <string>

typedef struct screen SCREEN;

namespace termxfer {

class NcursesTerminal : public Terminal {
public:
    NcursesTerminal() = default;
    ~NcursesTerminal() override;

    NcursesTerminal(const NcursesTerminal&) = delete;
    NcursesTerminal& operator=(const NcursesTerminal&) = delete;

    bool clearScreen(std::string& err) override;
    bool enableRawMode(std::string& err) override;
    bool disableRawMode(std::string& err) override;

    void render(const Frame& frame) override;
    std::optional<KeyEvent> pollEvent(std::chrono::milliseconds timeout) override;

private:
    SCREEN* screen_ = nullptr;
    bool active_ = false;
    bool colours_ = false;

    int attrFor(const std::string& colour) const;
    void drawBox(int y, int x, int h, int w, const std::string& title, int attr);
    void drawPane(const PaneView& pane, int y, int x, int h, int w);
    void drawLog(const Frame& frame, int y, int h, int w);
    void drawPopup(const PopupView& popup, int rows, int cols);
};

} // namespace termxfer
