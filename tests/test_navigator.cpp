#include "nav/navigator.h"
#include "nav/registry.h"
#include "modules/api_key_module.h"
#include "modules/module_support.h"
#include "modules/replica_module.h"
#include "test_support.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

using namespace avatarcli;
using avatarcli::test::ScriptedConsole;

// Module whose screens misbehave on purpose.
class FaultyModule : public nav::Module {
public:
    std::string name() const override { return "faulty"; }
    std::vector<std::string> screens() const override { return {"throws", "dangling", "silent", "ok"}; }
    std::vector<nav::MenuEntry> menuEntries() const override {
        return {{"Throw", "throws"}, {"Dangling", "dangling"}, {"Silent", "silent"}, {"Ok", "ok"}};
    }
    std::string execute(const std::string& screen, nav::NavigationContext&) override {
        ++calls;
        if (screen == "throws") throw std::runtime_error("kaboom");
        if (screen == "dangling") return "no_such_screen";
        if (screen == "silent") return "";
        return nav::screens::MAIN_MENU;
    }

    int calls = 0;
};

static void testExitFromMainMenu() {
    ScriptedConsole console;
    nav::ModuleRegistry registry;
    registry.add(std::make_shared<FaultyModule>());
    registry.freeze();
    nav::NavigationContext context;
    context.apiKey = "abcdefghijklmnop";

    console.pick("Exit");
    nav::Navigator navigator(registry, console, context);
    navigator.run();

    assert(navigator.current() == nav::screens::EXIT);
    assert(console.menus.size() == 1);
    assert(console.menus[0].title == "Main Menu - API key: abcd...mnop");
    assert(console.menus[0].options.back() == "Exit");
    assert(console.menus[0].options.size() == 5);
}

static void testRecoversFromModuleFaults() {
    ScriptedConsole console;
    auto faulty = std::make_shared<FaultyModule>();
    nav::ModuleRegistry registry;
    registry.add(faulty);
    registry.freeze();
    nav::NavigationContext context;

    console.pick("Throw").pick("Dangling").pick("Silent").pick("Ok").pick("Exit");
    nav::Navigator navigator(registry, console, context);
    navigator.run();

    assert(faulty->calls == 4);
    assert(console.sawError("Error: kaboom"));
    // Every fault lands back on the main menu.
    assert(console.menus.size() == 5);
    for (const auto& m : console.menus) assert(m.title.compare(0, 9, "Main Menu") == 0);
}

static void testStepResolution() {
    ScriptedConsole console;
    nav::ModuleRegistry registry;
    registry.add(std::make_shared<FaultyModule>());
    registry.freeze();
    nav::NavigationContext context;
    nav::Navigator navigator(registry, console, context);

    assert(navigator.step("unknown_screen") == nav::screens::MAIN_MENU);
    assert(navigator.step("dangling") == "no_such_screen");
    assert(navigator.step(nav::screens::EXIT) == nav::screens::EXIT);
    assert(navigator.transitions() == 3);
    assert(console.menus.empty());
}

static void testCancelKeepsMainMenuUntilClosed() {
    ScriptedConsole console;
    nav::ModuleRegistry registry;
    registry.add(std::make_shared<FaultyModule>());
    registry.freeze();
    nav::NavigationContext context;

    console.cancel().cancel();
    nav::Navigator navigator(registry, console, context);
    navigator.run();

    // Two explicit cancels redisplay the menu, the third call finds input exhausted.
    assert(console.menus.size() == 3);
    assert(console.closed());
    assert(navigator.current() == nav::screens::EXIT);
}

static void testApiKeyFlowInstallsClient() {
    ScriptedConsole console;
    auto created = std::make_shared<test::FakeApiClient>();
    std::string seenKey;
    api::ApiClientFactory factory = [&](const std::string& key) {
        seenKey = key;
        return created;
    };

    auto stamp = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    auto keyFile = std::filesystem::temp_directory_path() / ("avatarcli_nav_" + stamp) / "api_key";

    nav::ModuleRegistry registry;
    registry.add(std::make_shared<modules::ApiKeyModule>(console, factory, keyFile.string()));
    registry.add(std::make_shared<modules::ReplicaModule>(console, 10));
    registry.freeze();
    nav::NavigationContext context;

    console.pick("Work with Replicas");
    console.pick("Set API Key").answer(true).type("  sk-live-1234567890  ").answer(true);
    console.pick("Exit");
    nav::Navigator navigator(registry, console, context);
    navigator.run();

    assert(console.sawError(modules::CLIENT_MISSING_MESSAGE));
    assert(seenKey == "sk-live-1234567890");
    assert(context.apiKey == "sk-live-1234567890");
    assert(context.client == created);
    assert(console.menus.back().title == "Main Menu - API key: sk-l...7890");

    auto stored = modules::ApiKeyModule::loadKeyFile(keyFile.string());
    assert(stored && *stored == "sk-live-1234567890");
    auto perms = std::filesystem::status(keyFile).permissions();
    assert((perms & std::filesystem::perms::group_read) == std::filesystem::perms::none);
    assert((perms & std::filesystem::perms::others_read) == std::filesystem::perms::none);

    std::error_code ec;
    std::filesystem::remove_all(keyFile.parent_path(), ec);
}

static void testApiKeyEmptyKeepsCurrent() {
    ScriptedConsole console;
    int factoryCalls = 0;
    api::ApiClientFactory factory = [&](const std::string&) {
        ++factoryCalls;
        return std::make_shared<test::FakeApiClient>();
    };
    modules::ApiKeyModule module(console, factory, "");
    nav::NavigationContext context;
    context.apiKey = "old-key-123456";

    console.answer(true).type("   ");
    assert(module.execute("set_api_key", context) == nav::screens::MAIN_MENU);
    assert(context.apiKey == "old-key-123456");
    assert(factoryCalls == 0);
    assert(console.messages[0] == "Currently set API key: old-...3456");
    assert(!console.errors.empty());
}

int main() {
    testExitFromMainMenu();
    testRecoversFromModuleFaults();
    testStepResolution();
    testCancelKeepsMainMenuUntilClosed();
    testApiKeyFlowInstallsClient();
    testApiKeyEmptyKeepsCurrent();
    return 0;
}
