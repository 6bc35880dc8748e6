#include "tui/curses_console.h"
#include "utils/logger.h"

#include <ncurses.h>
#include <algorithm>
#include <clocale>
#include <string>
#include <vector>
#include <unistd.h>

namespace avatarcli {
namespace tui {

static const int KEY_ESCAPE = 27;
static const char* MENU_HELP = " Up/Down move  Enter select  Left/Right page  q back ";

static int safeScreenWidth(int x, int requested) {
    if (requested <= 0) return 0;
    int maxW = COLS - x;
    if (maxW <= 0) return 0;
    if (maxW > 1) maxW -= 1;
    return std::min(requested, maxW);
}

static void printClippedLine(int y, int x, int width, const std::string& s) {
    int w = safeScreenWidth(x, width);
    if (w <= 0) return;
    mvhline(y, x, ' ', w);
    mvaddnstr(y, x, s.c_str(), w);
}

// Splits on newlines, then hard-wraps each line at width bytes.
static std::vector<std::string> wrapText(const std::string& s, int width) {
    std::vector<std::string> out;
    if (width <= 0) return out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t nl = s.find('\n', start);
        std::string line = s.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (line.empty()) out.emplace_back();
        for (size_t pos = 0; pos < line.size(); pos += static_cast<size_t>(width)) {
            out.push_back(line.substr(pos, static_cast<size_t>(width)));
        }
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return out;
}

static bool isEnter(int ch) {
    return ch == '\n' || ch == '\r' || ch == KEY_ENTER;
}

struct CursesConsole::Impl {
    bool running = false;
    std::string status;
    Color statusColor = Color::DEFAULT;
    std::string busy;

    void drawHeader(const std::string& title);
    void drawFooter(const std::string& help);
    void drawStatus();
};

void CursesConsole::Impl::drawHeader(const std::string& title) {
    attron(A_BOLD | COLOR_PAIR(static_cast<int>(Color::CYAN)));
    printClippedLine(0, 1, COLS - 2, title);
    attroff(A_BOLD | COLOR_PAIR(static_cast<int>(Color::CYAN)));
    mvhline(1, 0, ACS_HLINE, COLS);
}

void CursesConsole::Impl::drawFooter(const std::string& help) {
    mvhline(LINES - 2, 0, ACS_HLINE, COLS);
    attron(A_DIM);
    printClippedLine(LINES - 1, 1, COLS - 2, help);
    attroff(A_DIM);
}

void CursesConsole::Impl::drawStatus() {
    int row = LINES - 3;
    if (!busy.empty()) {
        attron(COLOR_PAIR(static_cast<int>(Color::YELLOW)));
        printClippedLine(row, 1, COLS - 2, busy + "...");
        attroff(COLOR_PAIR(static_cast<int>(Color::YELLOW)));
        return;
    }
    attron(COLOR_PAIR(static_cast<int>(statusColor)));
    printClippedLine(row, 1, COLS - 2, status);
    attroff(COLOR_PAIR(static_cast<int>(statusColor)));
}

CursesConsole::CursesConsole() : impl_(std::make_unique<Impl>()) {}

CursesConsole::~CursesConsole() {
    shutdown();
}

bool CursesConsole::init() {
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        return false;
    }

    setlocale(LC_ALL, "");
    WINDOW* w = initscr();
    if (!w) {
        return false;
    }

    if (LINES < 10 || COLS < 40) {
        endwin();
        utils::Logger::log(utils::LogLevel::WARN, "tui", "terminal too small for curses mode");
        return false;
    }

    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(1, COLOR_GREEN, -1);
        init_pair(2, COLOR_YELLOW, -1);
        init_pair(3, COLOR_RED, -1);
        init_pair(4, COLOR_CYAN, -1);
        init_pair(5, COLOR_MAGENTA, -1);
        init_pair(6, COLOR_BLUE, -1);
        init_pair(7, COLOR_WHITE, -1);
    }

    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    set_escdelay(25);
    clear();
    ::refresh();

    impl_->running = true;
    return true;
}

void CursesConsole::shutdown() {
    if (impl_->running) {
        impl_->running = false;
        endwin();
    }
}

bool CursesConsole::isRunning() const {
    return impl_->running;
}

std::optional<std::string> CursesConsole::menu(const std::string& title, const std::vector<std::string>& options) {
    if (options.empty()) return std::nullopt;

    int count = static_cast<int>(options.size());
    int highlight = 0;
    int top = 0;

    auto indexOf = [&](const char* label) {
        for (int i = 0; i < count; ++i) {
            if (options[static_cast<size_t>(i)] == label) return i;
        }
        return -1;
    };

    while (true) {
        int listHeight = std::max(1, LINES - 5);
        if (highlight < top) top = highlight;
        if (highlight >= top + listHeight) top = highlight - listHeight + 1;

        erase();
        impl_->drawHeader(title);
        for (int row = 0; row < listHeight && top + row < count; ++row) {
            int idx = top + row;
            if (idx == highlight) attron(A_REVERSE);
            printClippedLine(2 + row, 1, COLS - 2, " " + options[static_cast<size_t>(idx)]);
            if (idx == highlight) attroff(A_REVERSE);
        }
        impl_->drawStatus();
        impl_->drawFooter(MENU_HELP);
        ::refresh();

        int ch = getch();
        switch (ch) {
            case KEY_UP:
            case 'k':
                highlight = (highlight - 1 + count) % count;
                break;
            case KEY_DOWN:
            case 'j':
                highlight = (highlight + 1) % count;
                break;
            case KEY_PPAGE:
                highlight = std::max(0, highlight - listHeight);
                break;
            case KEY_NPAGE:
                highlight = std::min(count - 1, highlight + listHeight);
                break;
            case KEY_HOME:
                highlight = 0;
                break;
            case KEY_END:
                highlight = count - 1;
                break;
            case KEY_LEFT: {
                int idx = indexOf(PREVIOUS_PAGE_LABEL);
                if (idx >= 0) {
                    impl_->status.clear();
                    return options[static_cast<size_t>(idx)];
                }
                break;
            }
            case KEY_RIGHT: {
                int idx = indexOf(NEXT_PAGE_LABEL);
                if (idx >= 0) {
                    impl_->status.clear();
                    return options[static_cast<size_t>(idx)];
                }
                break;
            }
            case 'q':
            case 'Q':
            case KEY_ESCAPE:
                impl_->status.clear();
                return std::nullopt;
            case KEY_RESIZE:
                break;
            default:
                if (isEnter(ch)) {
                    impl_->status.clear();
                    return options[static_cast<size_t>(highlight)];
                }
                break;
        }
    }
}

std::string CursesConsole::prompt(const std::string& message) {
    std::string buffer;
    curs_set(1);
    while (true) {
        int row = LINES - 3;
        std::string label = message + " ";
        int avail = std::max(1, COLS - 3 - static_cast<int>(label.size()));
        std::string shown = buffer.size() > static_cast<size_t>(avail)
            ? buffer.substr(buffer.size() - static_cast<size_t>(avail))
            : buffer;
        attron(A_BOLD);
        printClippedLine(row, 1, COLS - 2, label);
        attroff(A_BOLD);
        mvaddnstr(row, 1 + static_cast<int>(label.size()), shown.c_str(), avail);
        impl_->drawFooter(" Enter accept  Esc cancel ");
        move(row, std::min(COLS - 2, 1 + static_cast<int>(label.size() + shown.size())));
        ::refresh();

        int ch = getch();
        if (isEnter(ch)) break;
        if (ch == KEY_ESCAPE) {
            buffer.clear();
            break;
        }
        if (ch == KEY_BACKSPACE || ch == 127 || ch == 8) {
            while (!buffer.empty() && (static_cast<unsigned char>(buffer.back()) & 0xC0) == 0x80) buffer.pop_back();
            if (!buffer.empty()) buffer.pop_back();
            continue;
        }
        if (ch >= 32 && ch < 256 && buffer.size() < 8192) {
            buffer.push_back(static_cast<char>(ch));
        }
    }
    curs_set(0);
    printClippedLine(LINES - 3, 1, COLS - 2, "");
    ::refresh();
    return buffer;
}

bool CursesConsole::confirm(const std::string& message) {
    int row = LINES - 3;
    attron(A_BOLD | COLOR_PAIR(static_cast<int>(Color::YELLOW)));
    printClippedLine(row, 1, COLS - 2, message + " (y/N)");
    attroff(A_BOLD | COLOR_PAIR(static_cast<int>(Color::YELLOW)));
    ::refresh();
    int ch = getch();
    printClippedLine(row, 1, COLS - 2, "");
    ::refresh();
    return ch == 'y' || ch == 'Y';
}

void CursesConsole::showMessage(const std::string& msg, Color color) {
    impl_->status = msg;
    impl_->statusColor = color;
    impl_->drawStatus();
    ::refresh();
}

void CursesConsole::showError(const std::string& err) {
    showMessage(err, Color::RED);
}

void CursesConsole::showDetails(const std::string& title, const std::string& text) {
    int top = 0;
    while (true) {
        std::vector<std::string> lines = wrapText(text, std::max(1, COLS - 3));
        int height = std::max(1, LINES - 5);
        int maxTop = std::max(0, static_cast<int>(lines.size()) - height);
        top = std::min(top, maxTop);

        erase();
        impl_->drawHeader(title);
        for (int row = 0; row < height && top + row < static_cast<int>(lines.size()); ++row) {
            printClippedLine(2 + row, 1, COLS - 2, lines[static_cast<size_t>(top + row)]);
        }
        if (maxTop > 0) {
            std::string pos = "lines " + std::to_string(top + 1) + "-" +
                              std::to_string(std::min(top + height, static_cast<int>(lines.size()))) +
                              " of " + std::to_string(lines.size());
            attron(A_DIM);
            printClippedLine(LINES - 3, 1, COLS - 2, pos);
            attroff(A_DIM);
        }
        impl_->drawFooter(" Up/Down scroll  any other key returns ");
        ::refresh();

        int ch = getch();
        if (ch == KEY_UP || ch == 'k') {
            top = std::max(0, top - 1);
        } else if (ch == KEY_DOWN || ch == 'j') {
            top = std::min(maxTop, top + 1);
        } else if (ch == KEY_PPAGE) {
            top = std::max(0, top - height);
        } else if (ch == KEY_NPAGE || ch == ' ') {
            top = std::min(maxTop, top + height);
        } else if (ch != KEY_RESIZE) {
            return;
        }
    }
}

void CursesConsole::waitForKey(const std::string& message) {
    impl_->drawFooter(" " + message + " ");
    ::refresh();
    int ch;
    do {
        ch = getch();
    } while (ch == KEY_RESIZE);
}

void CursesConsole::beginBusy(const std::string& label) {
    impl_->busy = label;
    impl_->drawStatus();
    ::refresh();
}

void CursesConsole::endBusy() {
    impl_->busy.clear();
    impl_->drawStatus();
    ::refresh();
}

}
}
