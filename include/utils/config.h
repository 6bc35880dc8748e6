#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace avatarcli {
namespace utils {

struct ApiConfig {
    std::string baseUrl = "https://tavusapi.com/v2";
    std::string keyFile = ".tavus_api_key";
    uint32_t timeoutSeconds = 30;
};

struct UiConfig {
    uint32_t itemsPerPage = 10;
    bool plain = false;
};

struct LogConfig {
    std::string level = "info";
    std::string file;
};

class Config {
public:
    static Config& instance();
    
    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();
    
    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    bool getBool(const std::string& key, bool def = false) const;
    
    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
    
    bool has(const std::string& key) const;
    std::vector<std::string> keys(const std::string& prefix = "") const;
    
    ApiConfig getApiConfig() const;
    UiConfig getUiConfig() const;
    LogConfig getLogConfig() const;
    
    void setUiConfig(const UiConfig& config);
    
    std::string getDataDir() const;
    std::string getConfigPath() const;
    std::string getDefaultConfigPath() const;

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
