#pragma once

#include "tui/console.h"
#include <memory>

namespace avatarcli {
namespace tui {

class CursesConsole : public Console {
public:
    CursesConsole();
    ~CursesConsole() override;

    // False when stdin/stdout is not a terminal or the screen is too small.
    bool init() override;
    void shutdown() override;
    bool isRunning() const;

    std::optional<std::string> menu(const std::string& title, const std::vector<std::string>& options) override;
    std::string prompt(const std::string& message) override;
    bool confirm(const std::string& message) override;

    void showMessage(const std::string& msg, Color color = Color::GREEN) override;
    void showError(const std::string& err) override;
    void showDetails(const std::string& title, const std::string& text) override;
    void waitForKey(const std::string& message = "Press any key to continue...") override;

    void beginBusy(const std::string& label) override;
    void endBusy() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
