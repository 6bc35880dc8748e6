#include "nav/pagination.h"
#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace avatarcli {
namespace nav {

PaginationAction PaginationAction::previousPage(int page) {
    PaginationAction a;
    a.type = ActionType::PREVIOUS_PAGE;
    a.page = page;
    return a;
}

PaginationAction PaginationAction::nextPage(int page) {
    PaginationAction a;
    a.type = ActionType::NEXT_PAGE;
    a.page = page;
    return a;
}

PaginationAction PaginationAction::goBack() {
    PaginationAction a;
    a.type = ActionType::GO_BACK;
    return a;
}

PaginationAction PaginationAction::itemSelected(const std::string& id, int item) {
    PaginationAction a;
    a.type = ActionType::ITEM_SELECTED;
    a.value = id;
    a.item = item;
    return a;
}

PaginationAction PaginationAction::filterChanged(const std::string& filter) {
    PaginationAction a;
    a.type = ActionType::FILTER_CHANGED;
    a.value = filter;
    return a;
}

PaginationAction PaginationAction::noAction(int page) {
    PaginationAction a;
    a.type = ActionType::NO_ACTION;
    a.page = page;
    return a;
}

const char* actionTypeToString(ActionType type) {
    switch (type) {
        case ActionType::PREVIOUS_PAGE: return "PREVIOUS_PAGE";
        case ActionType::NEXT_PAGE: return "NEXT_PAGE";
        case ActionType::GO_BACK: return "GO_BACK";
        case ActionType::ITEM_SELECTED: return "ITEM_SELECTED";
        case ActionType::FILTER_CHANGED: return "FILTER_CHANGED";
        case ActionType::NO_ACTION: return "NO_ACTION";
    }
    return "UNKNOWN";
}

// "<n>. ..." -> n, or 0 when the row carries no index.
static size_t parseItemNumber(const std::string& label) {
    size_t pos = 0;
    size_t n = 0;
    while (pos < label.size() && std::isdigit(static_cast<unsigned char>(label[pos]))) {
        if (n > (static_cast<size_t>(-1) - 9) / 10) return 0;
        n = n * 10 + static_cast<size_t>(label[pos] - '0');
        ++pos;
    }
    if (pos == 0 || label.compare(pos, 2, ". ") != 0) return 0;
    return n;
}

PaginatedList::PaginatedList(tui::Console& console, std::vector<ListItem> items, int itemsPerPage)
    : console_(console), items_(std::move(items)), itemsPerPage_(itemsPerPage) {
    if (itemsPerPage_ <= 0) {
        throw std::invalid_argument("items per page must be positive");
    }
}

void PaginatedList::setTitle(const std::string& title) {
    title_ = title;
}

void PaginatedList::setFilter(const std::string& filter, bool showToggle) {
    filter_ = filter;
    showFilterToggle_ = showToggle;
}

void PaginatedList::setPolicy(SelectionPolicy policy) {
    policy_ = policy;
}

const std::vector<ListItem>& PaginatedList::items() const {
    return items_;
}

size_t PaginatedList::size() const {
    return items_.size();
}

int PaginatedList::itemsPerPage() const {
    return itemsPerPage_;
}

int PaginatedList::totalPages() const {
    if (items_.empty()) return 0;
    return static_cast<int>((items_.size() - 1) / static_cast<size_t>(itemsPerPage_));
}

int PaginatedList::currentPage() const {
    return currentPage_;
}

void PaginatedList::setPage(int page) {
    if (page < 0 || page > totalPages()) {
        throw std::out_of_range("page " + std::to_string(page) + " outside 0.." + std::to_string(totalPages()));
    }
    currentPage_ = page;
}

std::vector<ListItem> PaginatedList::pageItems() const {
    size_t begin = static_cast<size_t>(currentPage_) * static_cast<size_t>(itemsPerPage_);
    size_t end = std::min(begin + static_cast<size_t>(itemsPerPage_), items_.size());
    if (begin >= end) return {};
    return std::vector<ListItem>(items_.begin() + static_cast<long>(begin), items_.begin() + static_cast<long>(end));
}

std::string PaginatedList::filterLabel() const {
    return "Current filter: " + filter_;
}

std::string PaginatedList::itemLabel(size_t index, const ListItem& item) {
    return std::to_string(index + 1) + ". " + item.shortLabel;
}

std::string PaginatedList::menuTitle() const {
    if (items_.empty()) {
        return "No " + filter_ + " " + title_ + " found";
    }
    return title_ + " - Page " + std::to_string(currentPage_ + 1) + " of " + std::to_string(totalPages() + 1) +
           " (" + std::to_string(items_.size()) + " " + filter_ + ")";
}

void PaginatedList::appendItemRows(std::vector<std::string>& options, size_t begin, size_t end) const {
    for (size_t i = begin; i < end; ++i) {
        options.push_back(itemLabel(i, items_[i]));
    }
}

std::vector<std::string> PaginatedList::buildOptions() const {
    std::vector<std::string> options;
    if (showFilterToggle_) options.push_back(filterLabel());

    if (!items_.empty()) {
        if (currentPage_ > 0) options.push_back(tui::PREVIOUS_PAGE_LABEL);
        size_t begin = static_cast<size_t>(currentPage_) * static_cast<size_t>(itemsPerPage_);
        size_t end = std::min(begin + static_cast<size_t>(itemsPerPage_), items_.size());
        appendItemRows(options, begin, end);
        if (currentPage_ < totalPages()) options.push_back(tui::NEXT_PAGE_LABEL);
    }

    options.push_back(tui::GO_BACK_LABEL);
    return options;
}

PaginationAction PaginatedList::interpret(const std::optional<std::string>& choice) const {
    if (!choice) return PaginationAction::goBack();
    const std::string& picked = *choice;

    if (showFilterToggle_ && picked == filterLabel()) return PaginationAction::filterChanged(filter_);
    if (picked == tui::PREVIOUS_PAGE_LABEL) return PaginationAction::previousPage(currentPage_ - 1);
    if (picked == tui::NEXT_PAGE_LABEL) return PaginationAction::nextPage(currentPage_ + 1);
    if (picked == tui::GO_BACK_LABEL) return PaginationAction::goBack();

    size_t n = parseItemNumber(picked);
    if (n == 0 || n > items_.size()) return PaginationAction::noAction(currentPage_);
    const ListItem& item = items_[n - 1];
    return PaginationAction::itemSelected(item.id, static_cast<int>(n - 1));
}

PaginationAction PaginatedList::renderAndInterpret() {
    PaginationAction action = interpret(console_.menu(menuTitle(), buildOptions()));
    if (action.type == ActionType::ITEM_SELECTED && policy_ == SelectionPolicy::SHOW_DETAILS) {
        const ListItem& item = items_[static_cast<size_t>(action.item)];
        console_.showDetails(item.shortLabel, item.longLabel);
        return PaginationAction::noAction(currentPage_);
    }
    return action;
}

PaginationAction PaginatedList::run() {
    while (true) {
        PaginationAction action = renderAndInterpret();
        switch (action.type) {
            case ActionType::PREVIOUS_PAGE:
            case ActionType::NEXT_PAGE:
                setPage(action.page);
                break;
            case ActionType::NO_ACTION:
                break;
            default:
                LOG_DEBUG(std::string("list '") + title_ + "' -> " + actionTypeToString(action.type));
                return action;
        }
    }
}

SectionedList::SectionedList(tui::Console& console, std::vector<ListSection> sections, int itemsPerPage)
    : PaginatedList(console, {}, itemsPerPage) {
    for (auto& section : sections) {
        names_.push_back(section.name);
        sizes_.push_back(section.items.size());
        for (auto& item : section.items) items_.push_back(std::move(item));
    }
}

size_t SectionedList::sectionCount() const {
    return names_.size();
}

const std::string& SectionedList::sectionName(size_t section) const {
    return names_.at(section);
}

std::vector<ListItem> SectionedList::sectionItems(size_t section) const {
    size_t begin = 0;
    for (size_t i = 0; i < section && i < sizes_.size(); ++i) begin += sizes_[i];
    size_t end = begin + sizes_.at(section);
    return std::vector<ListItem>(items_.begin() + static_cast<long>(begin), items_.begin() + static_cast<long>(end));
}

int SectionedList::sectionOf(size_t index) const {
    size_t start = 0;
    for (size_t s = 0; s < sizes_.size(); ++s) {
        if (index >= start && index < start + sizes_[s]) return static_cast<int>(s);
        start += sizes_[s];
    }
    return -1;
}

std::string SectionedList::headerLabel(const std::string& name) {
    return "--- " + name + " ---";
}

void SectionedList::appendItemRows(std::vector<std::string>& options, size_t begin, size_t end) const {
    size_t sectionStart = 0;
    size_t s = 0;
    for (size_t i = begin; i < end; ++i) {
        while (s < sizes_.size() && i >= sectionStart + sizes_[s]) {
            sectionStart += sizes_[s];
            ++s;
        }
        if (s < sizes_.size() && i == sectionStart) {
            options.push_back(headerLabel(names_[s]));
        }
        options.push_back(itemLabel(i, items_[i]));
    }
}

std::string selectFilter(tui::Console& console, const std::string& title,
                         const std::vector<std::string>& filters, const std::string& current) {
    auto choice = console.menu(title, filters);
    if (!choice) return current;
    return *choice;
}

}
}
