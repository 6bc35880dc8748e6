#pragma once

#include "nav/module.h"
#include "nav/pagination.h"
#include "tui/console.h"

#include <string>

namespace avatarcli {
namespace modules {

// What a resource list does with the row the operator picks.
enum class ItemPolicy {
    SHOW_DETAILS,
    RENAME,
    DELETE,
    END,
    RETURN_ID
};

nav::SelectionPolicy toSelectionPolicy(ItemPolicy policy);

extern const char* const CLIENT_MISSING_MESSAGE;

// Reports the missing client; callers fall back to the main menu.
bool requireClient(tui::Console& console, const nav::NavigationContext& context);

// Clamps a remembered page into the list's current range.
void restorePage(nav::PaginatedList& list, int page);

}
}
