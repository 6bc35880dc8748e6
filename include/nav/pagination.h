#pragma once

#include "tui/console.h"

#include <optional>
#include <string>
#include <vector>

namespace avatarcli {
namespace nav {

struct ListItem {
    std::string id;
    std::string shortLabel;
    std::string longLabel;
};

// Builds a ListItem from any read model with id()/shortLabel()/longLabel().
template<typename T>
ListItem toListItem(const T& model) {
    return ListItem{model.id(), model.shortLabel(), model.longLabel()};
}

template<typename T>
std::vector<ListItem> toListItems(const std::vector<T>& models) {
    std::vector<ListItem> out;
    out.reserve(models.size());
    for (const auto& m : models) out.push_back(toListItem(m));
    return out;
}

enum class SelectionPolicy {
    SHOW_DETAILS,
    PICK
};

enum class ActionType {
    PREVIOUS_PAGE,
    NEXT_PAGE,
    GO_BACK,
    ITEM_SELECTED,
    FILTER_CHANGED,
    NO_ACTION
};

// page is set for PREVIOUS_PAGE/NEXT_PAGE/NO_ACTION; value carries the item
// id for ITEM_SELECTED and the active filter for FILTER_CHANGED.
struct PaginationAction {
    ActionType type = ActionType::NO_ACTION;
    int page = 0;
    std::string value;
    int item = -1;

    static PaginationAction previousPage(int page);
    static PaginationAction nextPage(int page);
    static PaginationAction goBack();
    static PaginationAction itemSelected(const std::string& id, int item);
    static PaginationAction filterChanged(const std::string& filter);
    static PaginationAction noAction(int page);
};

const char* actionTypeToString(ActionType type);

class PaginatedList {
public:
    // Throws std::invalid_argument when itemsPerPage is not positive.
    PaginatedList(tui::Console& console, std::vector<ListItem> items, int itemsPerPage);
    virtual ~PaginatedList() = default;

    void setTitle(const std::string& title);
    // Shows "Current filter: <filter>" as the first row when enabled.
    void setFilter(const std::string& filter, bool showToggle);
    void setPolicy(SelectionPolicy policy);

    const std::vector<ListItem>& items() const;
    size_t size() const;
    int itemsPerPage() const;
    // Index of the last page; 0 for an empty list.
    int totalPages() const;
    int currentPage() const;
    // Throws std::out_of_range outside [0, totalPages()].
    void setPage(int page);

    std::vector<ListItem> pageItems() const;
    std::vector<std::string> buildOptions() const;
    std::string menuTitle() const;
    std::string filterLabel() const;

    // Maps one menu outcome to an action, without side effects.
    PaginationAction interpret(const std::optional<std::string>& choice) const;
    // One render/interpret round. Applies the selection policy.
    PaginationAction renderAndInterpret();
    // Repeats rounds until GO_BACK, ITEM_SELECTED or FILTER_CHANGED.
    PaginationAction run();

    static std::string itemLabel(size_t index, const ListItem& item);

protected:
    virtual void appendItemRows(std::vector<std::string>& options, size_t begin, size_t end) const;

    tui::Console& console_;
    std::vector<ListItem> items_;
    int itemsPerPage_;
    int currentPage_ = 0;
    std::string title_ = "Items";
    std::string filter_ = "all";
    bool showFilterToggle_ = false;
    SelectionPolicy policy_ = SelectionPolicy::SHOW_DETAILS;
};

struct ListSection {
    std::string name;
    std::vector<ListItem> items;
};

class SectionedList : public PaginatedList {
public:
    SectionedList(tui::Console& console, std::vector<ListSection> sections, int itemsPerPage);

    size_t sectionCount() const;
    const std::string& sectionName(size_t section) const;
    std::vector<ListItem> sectionItems(size_t section) const;
    // Section holding the item at a global index, or -1.
    int sectionOf(size_t index) const;

    static std::string headerLabel(const std::string& name);

protected:
    void appendItemRows(std::vector<std::string>& options, size_t begin, size_t end) const override;

private:
    std::vector<std::string> names_;
    std::vector<size_t> sizes_;
};

// Asks for one of the filters; returns current when cancelled.
std::string selectFilter(tui::Console& console, const std::string& title,
                         const std::vector<std::string>& filters, const std::string& current);

}
}
