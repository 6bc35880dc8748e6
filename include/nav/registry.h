#pragma once

#include "nav/module.h"

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace avatarcli {
namespace nav {

class RegistrationError : public std::runtime_error {
public:
    explicit RegistrationError(const std::string& what) : std::runtime_error(what) {}
};

class ModuleRegistry {
public:
    // Throws RegistrationError on an empty or colliding claim, a reserved
    // identifier, a duplicate menu label, or after freeze().
    void add(std::shared_ptr<Module> module);
    // Also checks that every menu entry targets a known screen.
    void freeze();
    bool frozen() const;

    Module* resolve(const std::string& screen) const;
    std::vector<MenuEntry> menuEntries() const;
    std::optional<std::string> targetFor(const std::string& label) const;

    size_t size() const;
    std::vector<std::string> moduleNames() const;
    std::vector<std::string> allScreens() const;

private:
    std::vector<std::shared_ptr<Module>> modules_;
    std::map<std::string, Module*> owners_;
    std::vector<std::string> screenOrder_;
    std::vector<MenuEntry> entries_;
    std::map<std::string, std::string> labelTargets_;
    bool frozen_ = false;
};

}
}
