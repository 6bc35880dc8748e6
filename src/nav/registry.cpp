#include "nav/registry.h"
#include "utils/logger.h"

namespace avatarcli {
namespace nav {

namespace screens {

const char* const MAIN_MENU = "main_menu";
const char* const EXIT = "exit";

}

static const char* EXIT_LABEL = "Exit";

bool isReservedScreen(const std::string& screen) {
    return screen == screens::MAIN_MENU || screen == screens::EXIT;
}

void ModuleRegistry::add(std::shared_ptr<Module> module) {
    if (!module) {
        throw RegistrationError("cannot register a null module");
    }
    const std::string name = module->name();
    if (frozen_) {
        throw RegistrationError("registry is frozen; cannot register module '" + name + "'");
    }

    std::vector<std::string> claimed = module->screens();
    if (claimed.empty()) {
        throw RegistrationError("module '" + name + "' owns no screens");
    }

    std::map<std::string, bool> seen;
    for (const auto& screen : claimed) {
        if (screen.empty()) {
            throw RegistrationError("module '" + name + "' claims an empty screen identifier");
        }
        if (isReservedScreen(screen)) {
            throw RegistrationError("module '" + name + "' claims reserved screen '" + screen + "'");
        }
        auto owner = owners_.find(screen);
        if (owner != owners_.end()) {
            throw RegistrationError("screen '" + screen + "' claimed by '" + name + "' is already owned by '" +
                                    owner->second->name() + "'");
        }
        if (seen[screen]) {
            throw RegistrationError("module '" + name + "' claims screen '" + screen + "' twice");
        }
        seen[screen] = true;
    }

    std::vector<MenuEntry> entries = module->menuEntries();
    std::map<std::string, bool> seenLabels;
    for (const auto& entry : entries) {
        if (entry.label.empty() || entry.label == EXIT_LABEL) {
            throw RegistrationError("module '" + name + "' contributes invalid menu label '" + entry.label + "'");
        }
        if (labelTargets_.count(entry.label) || seenLabels[entry.label]) {
            throw RegistrationError("menu label '" + entry.label + "' from '" + name + "' is already taken");
        }
        seenLabels[entry.label] = true;
    }

    Module* raw = module.get();
    for (const auto& screen : claimed) {
        owners_[screen] = raw;
        screenOrder_.push_back(screen);
    }
    for (const auto& entry : entries) {
        entries_.push_back(entry);
        labelTargets_[entry.label] = entry.target;
    }
    modules_.push_back(std::move(module));

    utils::Logger::log(utils::LogLevel::DEBUG, "nav",
                       "registered module '" + name + "' with " + std::to_string(claimed.size()) + " screens");
}

void ModuleRegistry::freeze() {
    for (const auto& entry : entries_) {
        if (!isReservedScreen(entry.target) && owners_.find(entry.target) == owners_.end()) {
            throw RegistrationError("menu label '" + entry.label + "' targets unknown screen '" + entry.target + "'");
        }
    }
    frozen_ = true;
}

bool ModuleRegistry::frozen() const {
    return frozen_;
}

Module* ModuleRegistry::resolve(const std::string& screen) const {
    auto it = owners_.find(screen);
    return it == owners_.end() ? nullptr : it->second;
}

std::vector<MenuEntry> ModuleRegistry::menuEntries() const {
    return entries_;
}

std::optional<std::string> ModuleRegistry::targetFor(const std::string& label) const {
    auto it = labelTargets_.find(label);
    if (it == labelTargets_.end()) return std::nullopt;
    return it->second;
}

size_t ModuleRegistry::size() const {
    return modules_.size();
}

std::vector<std::string> ModuleRegistry::moduleNames() const {
    std::vector<std::string> names;
    for (const auto& m : modules_) names.push_back(m->name());
    return names;
}

std::vector<std::string> ModuleRegistry::allScreens() const {
    return screenOrder_;
}

}
}
