#include "modules/api_key_module.h"
#include "utils/logger.h"
#include "utils/utils.h"

#include <filesystem>
#include <fstream>

namespace avatarcli {
namespace modules {

using utils::Formatter;

const char* const ApiKeyModule::SET_API_KEY = "set_api_key";

ApiKeyModule::ApiKeyModule(tui::Console& console, api::ApiClientFactory factory, std::string keyFile)
    : console_(console), factory_(std::move(factory)), keyFile_(std::move(keyFile)) {}

std::string ApiKeyModule::name() const {
    return "api_key";
}

std::vector<std::string> ApiKeyModule::screens() const {
    return {SET_API_KEY};
}

std::vector<nav::MenuEntry> ApiKeyModule::menuEntries() const {
    return {{"Set API Key", SET_API_KEY}};
}

std::string ApiKeyModule::execute(const std::string& screen, nav::NavigationContext& context) {
    if (screen == SET_API_KEY) return setApiKey(context);
    return nav::screens::MAIN_MENU;
}

std::string ApiKeyModule::setApiKey(nav::NavigationContext& context) {
    console_.showMessage("Currently set API key: " + Formatter::maskSecret(context.apiKey), tui::Color::CYAN);
    if (!console_.confirm("Would you like to set a new API key?")) {
        return nav::screens::MAIN_MENU;
    }

    std::string key = Formatter::trim(console_.prompt("Enter your API key:"));
    if (key.empty()) {
        console_.showError("API key cannot be empty. The current key was kept.");
        return nav::screens::MAIN_MENU;
    }

    context.apiKey = key;
    context.client = factory_ ? factory_(key) : nullptr;
    LOG_INFO("API key updated to " + utils::Logger::redactKey(key));

    if (!keyFile_.empty() && console_.confirm("Save this key to " + keyFile_ + "?")) {
        if (saveKeyFile(keyFile_, key)) {
            console_.showMessage("API key saved to " + keyFile_);
        } else {
            console_.showError("Could not write " + keyFile_);
        }
        return nav::screens::MAIN_MENU;
    }
    console_.showMessage("API key set: " + Formatter::maskSecret(key));
    return nav::screens::MAIN_MENU;
}

std::optional<std::string> ApiKeyModule::loadKeyFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::string line;
    while (std::getline(in, line)) {
        line = Formatter::trim(line);
        if (!line.empty()) return line;
    }
    return std::nullopt;
}

bool ApiKeyModule::saveKeyFile(const std::string& path, const std::string& key) {
    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        LOG_ERROR("cannot open key file " + path);
        return false;
    }
    out << key << "\n";
    out.close();
    if (!out) {
        LOG_ERROR("failed writing key file " + path);
        return false;
    }

    std::filesystem::permissions(p, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) LOG_WARN("could not restrict permissions on " + path + ": " + ec.message());
    return true;
}

}
}
