#pragma once

#include "api/api_client.h"

#include <memory>
#include <string>
#include <vector>

namespace avatarcli {
namespace nav {

namespace screens {

extern const char* const MAIN_MENU;
extern const char* const EXIT;

}

bool isReservedScreen(const std::string& screen);

// What a module may touch while handling a screen. Only the API key
// module replaces these.
struct NavigationContext {
    std::shared_ptr<api::ApiClient> client;
    std::string apiKey;
};

struct MenuEntry {
    std::string label;
    std::string target;
};

class Module {
public:
    virtual ~Module() = default;

    virtual std::string name() const = 0;
    virtual std::vector<std::string> screens() const = 0;
    virtual std::vector<MenuEntry> menuEntries() const = 0;
    // Handles one screen and returns the next screen identifier.
    virtual std::string execute(const std::string& screen, NavigationContext& context) = 0;
};

}
}
