#pragma once

#include <optional>
#include <string>
#include <vector>

namespace avatarcli {
namespace tui {

enum class Color {
    DEFAULT = 0,
    GREEN = 1,
    YELLOW = 2,
    RED = 3,
    CYAN = 4,
    MAGENTA = 5,
    BLUE = 6,
    WHITE = 7
};

// Navigation rows the list widgets emit. Consoles map Left/Right to the
// page entries when a menu carries them.
extern const char* const PREVIOUS_PAGE_LABEL;
extern const char* const NEXT_PAGE_LABEL;
extern const char* const GO_BACK_LABEL;

class Console {
public:
    virtual ~Console() = default;

    virtual bool init() = 0;
    virtual void shutdown() = 0;

    // Blocks until one option is picked; std::nullopt when cancelled.
    virtual std::optional<std::string> menu(const std::string& title, const std::vector<std::string>& options) = 0;
    // Empty string when nothing was entered or input was cancelled.
    virtual std::string prompt(const std::string& message) = 0;
    // Defaults to no.
    virtual bool confirm(const std::string& message) = 0;

    virtual void showMessage(const std::string& msg, Color color = Color::GREEN) = 0;
    virtual void showError(const std::string& err) = 0;
    // Shows a multi-line text and returns once the operator dismisses it.
    virtual void showDetails(const std::string& title, const std::string& text) = 0;
    virtual void waitForKey(const std::string& message = "Press any key to continue...") = 0;

    virtual void beginBusy(const std::string& label) = 0;
    virtual void endBusy() = 0;

    // True once input is exhausted and no further choice can be made.
    virtual bool closed() const { return false; }
};

class BusyScope {
public:
    BusyScope(Console& console, const std::string& label) : console_(console) { console_.beginBusy(label); }
    ~BusyScope() { console_.endBusy(); }
    BusyScope(const BusyScope&) = delete;
    BusyScope& operator=(const BusyScope&) = delete;

private:
    Console& console_;
};

}
}
