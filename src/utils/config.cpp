#include "utils/config.h"
#include <unordered_map>
#include <fstream>
#include <algorithm>
#include <cstdlib>
#include <mutex>

namespace avatarcli {
namespace utils {

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::string dataDir;
    mutable std::mutex mtx;
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    const char* home = std::getenv("HOME");
    if (home) {
        impl_->dataDir = std::string(home) + "/.avatarcli";
    } else {
        impl_->dataDir = ".avatarcli";
    }
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("api.base_url", "https://tavusapi.com/v2");
    set("api.key_file", ".tavus_api_key");
    set("api.timeout", 30);
    
    set("ui.items_per_page", 10);
    set("ui.plain", false);
    
    set("log.level", "info");
    set("log.file", "");
    
    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;
    
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        
        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            
            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r") + 1);
            
            if (key.empty()) continue;
            impl_->data[key] = value;
        }
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;
    
    std::ofstream file(savePath);
    if (!file.is_open()) return false;
    
    file << "# avatarcli configuration\n\n";
    
    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());
    
    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return true;
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoi(it->second); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    std::string val = it->second;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = value;
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value ? value : ""));
}

void Config::set(const std::string& key, int value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = std::to_string(value);
}

void Config::set(const std::string& key, bool value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = value ? "true" : "false";
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

ApiConfig Config::getApiConfig() const {
    ApiConfig cfg;
    cfg.baseUrl = getString("api.base_url", cfg.baseUrl);
    cfg.keyFile = getString("api.key_file", cfg.keyFile);
    int timeout = getInt("api.timeout", static_cast<int>(cfg.timeoutSeconds));
    cfg.timeoutSeconds = timeout > 0 ? static_cast<uint32_t>(timeout) : cfg.timeoutSeconds;
    while (!cfg.baseUrl.empty() && cfg.baseUrl.back() == '/') cfg.baseUrl.pop_back();
    return cfg;
}

UiConfig Config::getUiConfig() const {
    UiConfig cfg;
    int perPage = getInt("ui.items_per_page", static_cast<int>(cfg.itemsPerPage));
    cfg.itemsPerPage = perPage > 0 ? static_cast<uint32_t>(perPage) : cfg.itemsPerPage;
    cfg.plain = getBool("ui.plain", false);
    return cfg;
}

LogConfig Config::getLogConfig() const {
    LogConfig cfg;
    cfg.level = getString("log.level", cfg.level);
    cfg.file = getString("log.file", "");
    if (cfg.file.empty()) {
        cfg.file = getDataDir() + "/avatarcli.log";
    }
    return cfg;
}

void Config::setUiConfig(const UiConfig& cfg) {
    set("ui.items_per_page", static_cast<int>(cfg.itemsPerPage));
    set("ui.plain", cfg.plain);
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->dataDir;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

std::string Config::getDefaultConfigPath() const {
    return getDataDir() + "/avatarcli.conf";
}

}
}
