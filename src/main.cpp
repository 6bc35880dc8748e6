#include "api/api_client.h"
#include "modules/api_key_module.h"
#include "modules/conversation_module.h"
#include "modules/persona_module.h"
#include "modules/replica_module.h"
#include "modules/video_module.h"
#include "nav/navigator.h"
#include "nav/registry.h"
#include "tui/curses_console.h"
#include "tui/line_console.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"

#include <ncurses.h>
#include <getopt.h>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace avatarcli {

static const char* VERSION = "0.1.0";

struct Options {
    bool showHelp = false;
    bool showVersion = false;
    std::string configPath;
    std::string keyFile;
    std::string apiKey;
    std::string baseUrl;
    std::string logLevel;
    std::string logFile;
    int pageSize = 0;
    bool plain = false;
};

static volatile std::sig_atomic_t g_cursesActive = 0;

void signalHandler(int signal) {
    if (g_cursesActive) endwin();
    std::_Exit(128 + signal);
}

void registerSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

void printHelp(const char* progName) {
    std::cout << "avatarcli v" << VERSION << " - interactive client for the video avatar API\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "  -v, --version           Show version\n";
    std::cout << "  -c, --config <path>     Config file (default ~/.avatarcli/avatarcli.conf)\n";
    std::cout << "  -k, --key-file <path>   API key file (default .tavus_api_key)\n";
    std::cout << "  -K, --api-key <key>     API key (overrides AVATARCLI_API_KEY and the key file)\n";
    std::cout << "  -u, --base-url <url>    API base URL\n";
    std::cout << "  -n, --page-size <n>     Items per page in lists\n";
    std::cout << "  -p, --plain             Line-mode console instead of curses\n";
    std::cout << "  -l, --loglevel <level>  trace, debug, info, warn, error, fatal or off\n";
    std::cout << "  -L, --logfile <path>    Log file (default ~/.avatarcli/avatarcli.log)\n";
}

void printVersion() {
    std::cout << "avatarcli v" << VERSION << "\n";
}

bool parseArgs(int argc, char* argv[], Options& opts) {
    static struct option longOptions[] = {
        {"help",      no_argument,       0, 'h'},
        {"version",   no_argument,       0, 'v'},
        {"config",    required_argument, 0, 'c'},
        {"key-file",  required_argument, 0, 'k'},
        {"api-key",   required_argument, 0, 'K'},
        {"base-url",  required_argument, 0, 'u'},
        {"page-size", required_argument, 0, 'n'},
        {"plain",     no_argument,       0, 'p'},
        {"loglevel",  required_argument, 0, 'l'},
        {"logfile",   required_argument, 0, 'L'},
        {0, 0, 0, 0}
    };

    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "hvc:k:K:u:n:pl:L:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h': opts.showHelp = true; break;
            case 'v': opts.showVersion = true; break;
            case 'c': opts.configPath = optarg; break;
            case 'k': opts.keyFile = optarg; break;
            case 'K': opts.apiKey = optarg; break;
            case 'u': opts.baseUrl = optarg; break;
            case 'n': {
                char* end = nullptr;
                long n = std::strtol(optarg, &end, 10);
                if (end == optarg || *end != '\0' || n <= 0 || n > 1000) {
                    std::cerr << "Invalid page size: " << optarg << "\n";
                    return false;
                }
                opts.pageSize = static_cast<int>(n);
                break;
            }
            case 'p': opts.plain = true; break;
            case 'l': opts.logLevel = optarg; break;
            case 'L': opts.logFile = optarg; break;
            default:
                printHelp(argv[0]);
                return false;
        }
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

// File values first, then command-line overrides.
bool loadConfig(const Options& opts) {
    utils::Config& config = utils::Config::instance();
    std::string path = opts.configPath;
    if (path.empty()) {
        std::error_code ec;
        std::string def = config.getDefaultConfigPath();
        if (std::filesystem::exists(def, ec)) path = def;
    }
    if (!path.empty() && !config.load(path)) {
        std::cerr << "Failed to load config: " << path << "\n";
        return false;
    }

    if (!opts.keyFile.empty()) config.set("api.key_file", opts.keyFile);
    if (!opts.baseUrl.empty()) config.set("api.base_url", opts.baseUrl);
    if (opts.pageSize > 0) config.set("ui.items_per_page", opts.pageSize);
    if (opts.plain) config.set("ui.plain", true);
    if (!opts.logLevel.empty()) config.set("log.level", opts.logLevel);
    if (!opts.logFile.empty()) config.set("log.file", opts.logFile);
    return true;
}

bool setupLogging() {
    utils::LogConfig logCfg = utils::Config::instance().getLogConfig();
    utils::LogLevel level = utils::LogLevel::INFO;
    if (!utils::Logger::parseLevel(logCfg.level, level)) {
        std::cerr << "Invalid log level: " << logCfg.level << "\n";
        return false;
    }
    utils::Logger::init(logCfg.file);
    utils::Logger::setLevel(level);
    return true;
}

std::string resolveApiKey(const Options& opts, const std::string& keyFile) {
    if (!opts.apiKey.empty()) {
        utils::Logger::log(utils::LogLevel::INFO, "main", "using API key from command line");
        return opts.apiKey;
    }
    const char* env = std::getenv("AVATARCLI_API_KEY");
    if (env && *env) {
        utils::Logger::log(utils::LogLevel::INFO, "main", "using API key from AVATARCLI_API_KEY");
        return env;
    }
    auto stored = modules::ApiKeyModule::loadKeyFile(keyFile);
    if (stored) {
        utils::Logger::log(utils::LogLevel::INFO, "main", "using API key from " + keyFile);
        return *stored;
    }
    return "";
}

std::unique_ptr<tui::Console> startConsole(bool plain) {
    if (!plain) {
        auto curses = std::make_unique<tui::CursesConsole>();
        if (curses->init()) {
            g_cursesActive = 1;
            return curses;
        }
        utils::Logger::log(utils::LogLevel::WARN, "main", "curses console unavailable, using line mode");
    }
    auto line = std::make_unique<tui::LineConsole>();
    if (!line->init()) return nullptr;
    return line;
}

int run(const Options& opts) {
    utils::Config& config = utils::Config::instance();
    utils::ApiConfig apiCfg = config.getApiConfig();
    utils::UiConfig uiCfg = config.getUiConfig();
    int perPage = static_cast<int>(uiCfg.itemsPerPage);

    std::string apiKey = resolveApiKey(opts, apiCfg.keyFile);

    std::unique_ptr<tui::Console> console = startConsole(uiCfg.plain);
    if (!console) {
        std::cerr << "Failed to start console\n";
        return 1;
    }
    utils::Logger::enableConsole(false);

    if (apiKey.empty()) {
        apiKey = utils::Formatter::trim(console->prompt("Enter your API key:"));
        if (apiKey.empty()) {
            console->showError("No API key set. Use 'Set API Key' from the main menu.");
        }
    }

    api::ApiClientFactory factory = [apiCfg](const std::string& key) {
        return api::createHttpClient(key, apiCfg.baseUrl, apiCfg.timeoutSeconds);
    };

    nav::NavigationContext context;
    context.apiKey = apiKey;
    if (!apiKey.empty()) context.client = factory(apiKey);

    auto apiKeyModule = std::make_shared<modules::ApiKeyModule>(*console, factory, apiCfg.keyFile);
    auto replicaModule = std::make_shared<modules::ReplicaModule>(*console, perPage);
    auto personaModule = std::make_shared<modules::PersonaModule>(*console, perPage);
    auto videoModule = std::make_shared<modules::VideoModule>(*console, perPage);
    auto conversationModule = std::make_shared<modules::ConversationModule>(*console, perPage);

    nav::ModuleRegistry registry;
    try {
        registry.add(apiKeyModule);
        registry.add(replicaModule);
        registry.add(personaModule);
        registry.add(videoModule);
        registry.add(conversationModule);
        registry.freeze();
    } catch (const nav::RegistrationError& e) {
        console->shutdown();
        g_cursesActive = 0;
        utils::Logger::log(utils::LogLevel::FATAL, "main", e.what());
        std::cerr << "Module registration failed: " << e.what() << "\n";
        return 1;
    }
    utils::Logger::log(utils::LogLevel::INFO, "main",
                       "registered " + std::to_string(registry.size()) + " modules");

    if (context.client) {
        tui::BusyScope busy(*console, "Loading replicas and personas");
        if (!replicaModule->refresh(*context.client)) {
            utils::Logger::log(utils::LogLevel::WARN, "main", "replica warm-up failed");
        }
        if (!personaModule->refresh(*context.client)) {
            utils::Logger::log(utils::LogLevel::WARN, "main", "persona warm-up failed");
        }
    }

    nav::Navigator navigator(registry, *console, context);
    navigator.run();

    console->shutdown();
    g_cursesActive = 0;
    return 0;
}

}

int main(int argc, char* argv[]) {
    avatarcli::registerSignalHandlers();

    avatarcli::Options opts;
    if (!avatarcli::parseArgs(argc, argv, opts)) {
        return 1;
    }
    if (opts.showHelp) {
        avatarcli::printHelp(argv[0]);
        return 0;
    }
    if (opts.showVersion) {
        avatarcli::printVersion();
        return 0;
    }

    if (!avatarcli::loadConfig(opts)) return 1;
    if (!avatarcli::setupLogging()) return 1;
    avatarcli::utils::Logger::log(avatarcli::utils::LogLevel::INFO, "main",
                                  std::string("avatarcli v") + avatarcli::VERSION + " starting");

    int rc = avatarcli::run(opts);
    avatarcli::utils::Logger::shutdown();
    return rc;
}
