#include "NcursesTerminal.hpp"
#include "termxfer/Log.hpp"
#include <algorithm>
#include <cstdio>
#include <curses.h>

namespace termxfer {

namespace {

const char* kColours[] = {"black", "red", "green", "yellow", "blue", "magenta", "cyan", "white"};
const short kCursesColours[] = {COLOR_BLACK, COLOR_RED,     COLOR_GREEN, COLOR_YELLOW,
                                COLOR_BLUE,  COLOR_MAGENTA, COLOR_CYAN,  COLOR_WHITE};
constexpr int kColourCount = 8;

// Clip s to at most w columns.
std::string clip(const std::string& s, int w) {
    if (w <= 0) return {};
    if (static_cast<int>(s.size()) <= w) return s;
    return s.substr(0, static_cast<std::size_t>(w));
}

std::string progressBar(double ratio, int width) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    const int inner = std::max(0, width - 8);
    const int filled = static_cast<int>(ratio * inner);
    char pct[8];
    std::snprintf(pct, sizeof(pct), " %3d%%", static_cast<int>(ratio * 100.0));
    return "[" + std::string(static_cast<std::size_t>(filled), '#') +
           std::string(static_cast<std::size_t>(inner - filled), '-') + "]" + pct;
}

} // namespace

NcursesTerminal::~NcursesTerminal() {
    std::string err;
    if (!disableRawMode(err)) LOGW("ncurses: %s", err.c_str());
    if (screen_) {
        delscreen(screen_);
        screen_ = nullptr;
    }
}

bool NcursesTerminal::enableRawMode(std::string& err) {
    if (active_) return true;
    if (!screen_) {
        screen_ = newterm(nullptr, stdout, stdin);
        if (!screen_) {
            err = "Could not initialize the terminal (is TERM set?)";
            return false;
        }
        set_term(screen_);
        if (has_colors() && start_color() == OK) {
            use_default_colors();
            for (int i = 0; i < kColourCount; ++i) init_pair(static_cast<short>(i + 1), kCursesColours[i], -1);
            colours_ = true;
        }
        set_escdelay(25);
    } else {
        // Back from endwin(): a refresh restores the program mode
        reset_prog_mode();
        refresh();
    }
    raw();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    active_ = true;
    return true;
}

bool NcursesTerminal::disableRawMode(std::string& err) {
    if (!active_) return true;
    active_ = false;
    if (endwin() == ERR) {
        err = "Could not restore the terminal";
        return false;
    }
    return true;
}

bool NcursesTerminal::clearScreen(std::string& err) {
    if (active_) {
        if (clear() == ERR || refresh() == ERR) {
            err = "Could not clear the screen";
            return false;
        }
        return true;
    }
    if (std::fputs("\033[2J\033[H", stdout) < 0 || std::fflush(stdout) != 0) {
        err = "Could not clear the screen";
        return false;
    }
    return true;
}

int NcursesTerminal::attrFor(const std::string& colour) const {
    if (!colours_) return A_NORMAL;
    for (int i = 0; i < kColourCount; ++i) {
        if (colour == kColours[i]) return COLOR_PAIR(i + 1);
    }
    return A_NORMAL;
}

void NcursesTerminal::drawBox(int y, int x, int h, int w, const std::string& title, int attr) {
    if (h < 2 || w < 2) return;
    attron(attr);
    mvhline(y, x + 1, ACS_HLINE, w - 2);
    mvhline(y + h - 1, x + 1, ACS_HLINE, w - 2);
    mvvline(y + 1, x, ACS_VLINE, h - 2);
    mvvline(y + 1, x + w - 1, ACS_VLINE, h - 2);
    mvaddch(y, x, ACS_ULCORNER);
    mvaddch(y, x + w - 1, ACS_URCORNER);
    mvaddch(y + h - 1, x, ACS_LLCORNER);
    mvaddch(y + h - 1, x + w - 1, ACS_LRCORNER);
    if (!title.empty()) mvaddstr(y, x + 2, clip(" " + title + " ", w - 4).c_str());
    attroff(attr);
}

void NcursesTerminal::drawPane(const PaneView& pane, int y, int x, int h, int w) {
    const int colour = attrFor(pane.colour);
    drawBox(y, x, h, w, pane.title, colour | (pane.focused ? A_BOLD : A_NORMAL));
    const int rows = h - 2;
    if (rows <= 0) return;
    const int n = static_cast<int>(pane.lines.size());
    const int cursor = static_cast<int>(pane.cursor);
    int first = 0;
    if (cursor >= rows) first = cursor - rows + 1;
    for (int r = 0; r < rows && first + r < n; ++r) {
        const int i = first + r;
        const bool marked = i < static_cast<int>(pane.marked.size()) && pane.marked[static_cast<std::size_t>(i)];
        int attr = marked ? (colour | A_BOLD) : A_NORMAL;
        if (i == cursor && pane.focused) attr |= A_REVERSE;
        else if (i == cursor) attr |= A_UNDERLINE;
        attron(attr);
        const std::string text = (marked ? "*" : " ") + pane.lines[static_cast<std::size_t>(i)];
        mvaddstr(y + 1 + r, x + 1, clip(text, w - 2).c_str());
        attroff(attr);
    }
}

void NcursesTerminal::drawLog(const Frame& frame, int y, int h, int w) {
    drawBox(y, 0, h, w, "Log", attrFor(frame.theme.logPanel) | (frame.logFocused ? A_BOLD : A_NORMAL));
    const int rows = h - 2;
    const int n = static_cast<int>(frame.log.size());
    const int cursor = static_cast<int>(frame.logCursor);
    int first = 0;
    if (cursor >= rows) first = cursor - rows + 1;
    for (int r = 0; r < rows && first + r < n; ++r) {
        const LogLine& line = frame.log[static_cast<std::size_t>(first + r)];
        int attr = A_NORMAL;
        if (line.level == LogLevel::Error) attr = attrFor(frame.theme.error);
        else if (line.level == LogLevel::Warn) attr = attrFor("yellow");
        if (frame.logFocused && first + r == cursor) attr |= A_REVERSE;
        attron(attr);
        mvaddstr(y + 1 + r, 1, clip(line.text, w - 2).c_str());
        attroff(attr);
    }
}

void NcursesTerminal::drawPopup(const PopupView& popup, int rows, int cols) {
    int width = std::max<int>(40, static_cast<int>(popup.title.size()) + 6);
    for (const auto& l : popup.lines) width = std::max(width, static_cast<int>(l.size()) + 4);
    if (popup.list) {
        for (const auto& o : popup.options) width = std::max(width, static_cast<int>(o.size()) + 4);
    }
    width = std::min(width, cols - 4);

    int listRows = 0;
    if (popup.list) listRows = std::min<int>(static_cast<int>(popup.options.size()), std::max(3, rows / 2));
    int height = 2 + static_cast<int>(popup.lines.size()) + listRows;
    if (popup.input) height += 1;
    if (popup.progress) height += 1;
    if (popup.progressTotal) height += 1;
    if (!popup.list && !popup.options.empty()) height += 1;
    height = std::min(height, rows - 2);
    if (width < 4 || height < 3) return;

    const int y = (rows - height) / 2;
    const int x = (cols - width) / 2;
    const int attr = attrFor(popup.colour);
    for (int r = 0; r < height; ++r) mvhline(y + r, x, ' ', width);
    drawBox(y, x, height, width, popup.title, attr | A_BOLD);

    int row = y + 1;
    const int last = y + height - 1;
    for (const auto& l : popup.lines) {
        if (row >= last) break;
        mvaddstr(row++, x + 2, clip(l, width - 4).c_str());
    }
    if (popup.input && row < last) {
        mvaddstr(row++, x + 2, clip("> " + *popup.input + "_", width - 4).c_str());
    }
    if (popup.progress && row < last) {
        attron(attrFor("green"));
        mvaddstr(row++, x + 2, progressBar(*popup.progress, width - 4).c_str());
        attroff(attrFor("green"));
    }
    if (popup.progressTotal && row < last) {
        attron(attr);
        mvaddstr(row++, x + 2, progressBar(*popup.progressTotal, width - 4).c_str());
        attroff(attr);
    }
    if (popup.list) {
        const int sel = static_cast<int>(popup.selected);
        int first = sel >= listRows ? sel - listRows + 1 : 0;
        for (int r = 0; r < listRows && row < last; ++r) {
            const int i = first + r;
            if (i >= static_cast<int>(popup.options.size())) break;
            if (i == sel) attron(A_REVERSE);
            mvaddstr(row++, x + 2, clip(popup.options[static_cast<std::size_t>(i)], width - 4).c_str());
            if (i == sel) attroff(A_REVERSE);
        }
    } else if (!popup.options.empty() && row < last) {
        int cx = x + 2;
        for (std::size_t i = 0; i < popup.options.size(); ++i) {
            const std::string button = "[" + popup.options[i] + "]";
            if (cx + static_cast<int>(button.size()) > x + width - 2) break;
            if (i == popup.selected) attron(A_REVERSE | attr);
            mvaddstr(row, cx, button.c_str());
            if (i == popup.selected) attroff(A_REVERSE | attr);
            cx += static_cast<int>(button.size()) + 1;
        }
    }
}

void NcursesTerminal::render(const Frame& frame) {
    if (!active_) return;
    int rows = 0;
    int cols = 0;
    getmaxyx(stdscr, rows, cols);
    erase();

    const int logH = std::min(frame.logHeight + 2, std::max(3, rows / 3));
    const int paneH = std::max(3, rows - logH - 2);
    const int half = cols / 2;
    drawPane(frame.left, 0, 0, paneH, half);
    drawPane(frame.right, 0, half, paneH, cols - half);
    drawLog(frame, paneH, logH, cols);

    attron(A_REVERSE);
    mvhline(rows - 2, 0, ' ', cols);
    mvaddstr(rows - 2, 0, clip(frame.status, cols).c_str());
    attroff(A_REVERSE);
    mvaddstr(rows - 1, 0, clip(frame.footer, cols).c_str());

    for (const auto& p : frame.popups) drawPopup(p, rows, cols);
    refresh();
}

std::optional<KeyEvent> NcursesTerminal::pollEvent(std::chrono::milliseconds timeout) {
    using Key = KeyEvent::Key;
    if (!active_) return std::nullopt;
    wtimeout(stdscr, static_cast<int>(timeout.count()));
    const int ch = wgetch(stdscr);
    switch (ch) {
        case ERR: return std::nullopt;
        case KEY_UP: return KeyEvent::special(Key::Up);
        case KEY_DOWN: return KeyEvent::special(Key::Down);
        case KEY_LEFT: return KeyEvent::special(Key::Left);
        case KEY_RIGHT: return KeyEvent::special(Key::Right);
        case KEY_PPAGE: return KeyEvent::special(Key::PageUp);
        case KEY_NPAGE: return KeyEvent::special(Key::PageDown);
        case KEY_HOME: return KeyEvent::special(Key::Home);
        case KEY_END: return KeyEvent::special(Key::End);
        case KEY_DC: return KeyEvent::special(Key::Delete);
        case KEY_BTAB: return KeyEvent::special(Key::BackTab);
        case KEY_RESIZE: return KeyEvent::special(Key::Resize);
        case KEY_ENTER:
        case '\n':
        case '\r': return KeyEvent::special(Key::Enter);
        case KEY_BACKSPACE:
        case 127:
        case 8: return KeyEvent::special(Key::Backspace);
        case '\t': return KeyEvent::special(Key::Tab);
        case 27: return KeyEvent::special(Key::Esc);
        default: break;
    }
    if (ch >= 1 && ch <= 26) return KeyEvent::character(static_cast<char>('a' + ch - 1), true);
    if (ch >= 32 && ch < 127) return KeyEvent::character(static_cast<char>(ch));
    return std::nullopt;
}

} // namespace termxfer
