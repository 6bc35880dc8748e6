#include "nav/navigator.h"
#include "utils/logger.h"
#include "utils/utils.h"

#include <exception>

namespace avatarcli {
namespace nav {

static const char* EXIT_LABEL = "Exit";

Navigator::Navigator(const ModuleRegistry& registry, tui::Console& console, NavigationContext& context)
    : registry_(registry), console_(console), context_(context), current_(screens::MAIN_MENU) {}

void Navigator::run(const std::string& start) {
    current_ = start;
    LOG_INFO("navigation started at '" + current_ + "'");
    while (current_ != screens::EXIT) {
        current_ = step(current_);
    }
    LOG_INFO("navigation finished after " + std::to_string(transitions_) + " transitions");
}

std::string Navigator::step(const std::string& screen) {
    ++transitions_;
    if (screen == screens::EXIT) return screens::EXIT;
    if (screen == screens::MAIN_MENU) return mainMenu();

    Module* module = registry_.resolve(screen);
    if (!module) {
        utils::Logger::log(utils::LogLevel::ERROR, "nav", "no module owns screen '" + screen + "'");
        return screens::MAIN_MENU;
    }

    std::string next;
    try {
        next = module->execute(screen, context_);
    } catch (const std::exception& e) {
        utils::Logger::log(utils::LogLevel::ERROR, "nav",
                           "module '" + module->name() + "' failed on '" + screen + "': " + e.what());
        console_.showError(std::string("Error: ") + e.what());
        return screens::MAIN_MENU;
    }

    if (next.empty()) {
        utils::Logger::log(utils::LogLevel::ERROR, "nav",
                           "module '" + module->name() + "' returned no screen from '" + screen + "'");
        return screens::MAIN_MENU;
    }
    LOG_DEBUG(screen + " -> " + next);
    return next;
}

const std::string& Navigator::current() const {
    return current_;
}

uint64_t Navigator::transitions() const {
    return transitions_;
}

std::string Navigator::mainMenu() {
    std::vector<std::string> options;
    for (const auto& entry : registry_.menuEntries()) options.push_back(entry.label);
    options.push_back(EXIT_LABEL);

    std::string title = "Main Menu - API key: " + utils::Formatter::maskSecret(context_.apiKey);
    auto choice = console_.menu(title, options);
    if (!choice) {
        if (console_.closed()) return screens::EXIT;
        return screens::MAIN_MENU;
    }
    if (*choice == EXIT_LABEL) return screens::EXIT;
    if (auto target = registry_.targetFor(*choice)) return *target;
    return screens::MAIN_MENU;
}

}
}
