#pragma once

#include "api/api_client.h"
#include "nav/module.h"
#include "tui/console.h"

#include <optional>
#include <string>
#include <vector>

namespace avatarcli {
namespace modules {

class ApiKeyModule : public nav::Module {
public:
    static const char* const SET_API_KEY;

    // keyFile may be empty, in which case the key is never saved.
    ApiKeyModule(tui::Console& console, api::ApiClientFactory factory, std::string keyFile);

    std::string name() const override;
    std::vector<std::string> screens() const override;
    std::vector<nav::MenuEntry> menuEntries() const override;
    std::string execute(const std::string& screen, nav::NavigationContext& context) override;

    // First non-empty line of the file, trimmed.
    static std::optional<std::string> loadKeyFile(const std::string& path);
    // Writes the key with owner-only permissions.
    static bool saveKeyFile(const std::string& path, const std::string& key);

private:
    std::string setApiKey(nav::NavigationContext& context);

    tui::Console& console_;
    api::ApiClientFactory factory_;
    std::string keyFile_;
};

}
}
