#include "tui/line_console.h"
#include "nav/pagination.h"
#include "nav/navigator.h"
#include "nav/registry.h"

#include <cassert>
#include <sstream>
#include <string>
#include <vector>

using namespace avatarcli;

static void testNumberedMenu() {
    std::istringstream in("2\n");
    std::ostringstream out;
    tui::LineConsole console(in, out);

    auto choice = console.menu("Pick one", {"alpha", "beta", "gamma"});
    assert(choice && *choice == "beta");
    std::string text = out.str();
    assert(text.find("Pick one") != std::string::npos);
    assert(text.find("  2) beta") != std::string::npos);
    assert(text.find("Select [1-3], q = back:") != std::string::npos);
    assert(!console.closed());
}

static void testInvalidThenValid() {
    std::istringstream in("seven\n9\n1x\n3\n");
    std::ostringstream out;
    tui::LineConsole console(in, out);

    auto choice = console.menu("Pick", {"a", "b", "c"});
    assert(choice && *choice == "c");
    assert(out.str().find("Invalid choice: seven") != std::string::npos);
    assert(out.str().find("Invalid choice: 9") != std::string::npos);
    assert(out.str().find("Invalid choice: 1x") != std::string::npos);
}

static void testCancelAndEof() {
    std::istringstream in("q\n\n");
    std::ostringstream out;
    tui::LineConsole console(in, out);

    assert(!console.menu("Pick", {"a"}));
    assert(!console.menu("Pick", {"a"}));
    assert(!console.closed());
    assert(!console.menu("Pick", {"a"}));
    assert(console.closed());
    assert(console.prompt("Name:").empty());
    assert(!console.confirm("Sure?"));
}

static void testPageShortcuts() {
    std::istringstream in("n\np\n");
    std::ostringstream out;
    tui::LineConsole console(in, out);
    std::vector<std::string> options = {tui::PREVIOUS_PAGE_LABEL, "11. x", tui::NEXT_PAGE_LABEL, tui::GO_BACK_LABEL};

    assert(*console.menu("List", options) == tui::NEXT_PAGE_LABEL);
    assert(*console.menu("List", options) == tui::PREVIOUS_PAGE_LABEL);
    assert(out.str().find(", p = previous, n = next, q = back:") != std::string::npos);
}

static void testPromptAndConfirm() {
    std::istringstream in("  Anna  \r\nYES\nno\n");
    std::ostringstream out;
    tui::LineConsole console(in, out);

    assert(console.prompt("Replica Name:") == "Anna");
    assert(console.confirm("Create?"));
    assert(!console.confirm("Delete?"));
    assert(out.str().find("Create? (y/N)") != std::string::npos);
}

static void testDrivesPaginatedList() {
    std::vector<nav::ListItem> items;
    for (int i = 1; i <= 12; ++i) {
        std::string id = "v" + std::to_string(i);
        items.push_back(nav::ListItem{id, "Video " + std::to_string(i), "details " + id});
    }
    // Page 0 rows: 1..10 then Next (11) and Go Back (12); page 1: Prev, 11, 12, Go Back.
    std::istringstream in("11\n3\n");
    std::ostringstream out;
    tui::LineConsole console(in, out);
    nav::PaginatedList list(console, items, 10);
    list.setPolicy(nav::SelectionPolicy::PICK);

    auto action = list.run();
    assert(action.type == nav::ActionType::ITEM_SELECTED);
    assert(action.value == "v12");
}

static void testNavigatorStopsAtEof() {
    std::istringstream in("");
    std::ostringstream out;
    tui::LineConsole console(in, out);
    nav::ModuleRegistry registry;
    registry.freeze();
    nav::NavigationContext context;

    nav::Navigator navigator(registry, console, context);
    navigator.run();
    assert(navigator.current() == nav::screens::EXIT);
    assert(out.str().find("Main Menu - API key: not set") != std::string::npos);
}

int main() {
    testNumberedMenu();
    testInvalidThenValid();
    testCancelAndEof();
    testPageShortcuts();
    testPromptAndConfirm();
    testDrivesPaginatedList();
    testNavigatorStopsAtEof();
    return 0;
}
