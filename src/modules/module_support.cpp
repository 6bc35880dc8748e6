#include "modules/module_support.h"
#include "utils/logger.h"

#include <algorithm>

namespace avatarcli {
namespace modules {

const char* const CLIENT_MISSING_MESSAGE = "Error: API client not initialized. Please set your API key first.";

nav::SelectionPolicy toSelectionPolicy(ItemPolicy policy) {
    return policy == ItemPolicy::SHOW_DETAILS ? nav::SelectionPolicy::SHOW_DETAILS : nav::SelectionPolicy::PICK;
}

bool requireClient(tui::Console& console, const nav::NavigationContext& context) {
    if (context.client) return true;
    LOG_WARN("screen entered without an API client");
    console.showError(CLIENT_MISSING_MESSAGE);
    return false;
}

void restorePage(nav::PaginatedList& list, int page) {
    list.setPage(std::max(0, std::min(page, list.totalPages())));
}

}
}
