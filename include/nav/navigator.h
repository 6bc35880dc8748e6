#pragma once

#include "nav/module.h"
#include "nav/registry.h"
#include "tui/console.h"

#include <cstdint>
#include <string>

namespace avatarcli {
namespace nav {

class Navigator {
public:
    Navigator(const ModuleRegistry& registry, tui::Console& console, NavigationContext& context);

    // Loops until the exit screen is reached.
    void run(const std::string& start = screens::MAIN_MENU);
    // Performs one transition from screen and returns the next one.
    std::string step(const std::string& screen);

    const std::string& current() const;
    uint64_t transitions() const;

private:
    std::string mainMenu();

    const ModuleRegistry& registry_;
    tui::Console& console_;
    NavigationContext& context_;
    std::string current_;
    uint64_t transitions_ = 0;
};

}
}
