#pragma once

#include "tui/console.h"
#include <iostream>

namespace avatarcli {
namespace tui {

// Numbered menus over plain streams, for pipes and dumb terminals.
class LineConsole : public Console {
public:
    explicit LineConsole(std::istream& in = std::cin, std::ostream& out = std::cout);

    bool init() override;
    void shutdown() override;

    std::optional<std::string> menu(const std::string& title, const std::vector<std::string>& options) override;
    std::string prompt(const std::string& message) override;
    bool confirm(const std::string& message) override;

    void showMessage(const std::string& msg, Color color = Color::GREEN) override;
    void showError(const std::string& err) override;
    void showDetails(const std::string& title, const std::string& text) override;
    void waitForKey(const std::string& message = "Press any key to continue...") override;

    void beginBusy(const std::string& label) override;
    void endBusy() override;
    bool closed() const override { return eof_; }

private:
    bool readLine(std::string& line);

    std::istream& in_;
    std::ostream& out_;
    bool eof_ = false;
};

}
}
