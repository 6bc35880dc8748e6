#include "modules/replica_picker.h"
#include "modules/module_support.h"
#include "utils/logger.h"

namespace avatarcli {
namespace modules {

const std::vector<std::string>& replicaFilters() {
    static const std::vector<std::string> filters = {"user", "system", "all"};
    return filters;
}

std::unique_ptr<nav::PaginatedList> buildReplicaList(tui::Console& console,
                                                     const std::vector<model::Replica>& replicas,
                                                     const std::string& filter, int itemsPerPage) {
    std::vector<model::Replica> user;
    std::vector<model::Replica> system;
    for (const auto& r : replicas) {
        if (r.isUser()) user.push_back(r);
        else if (r.isSystem()) system.push_back(r);
    }

    if (filter == "user") {
        return std::make_unique<nav::PaginatedList>(console, nav::toListItems(user), itemsPerPage);
    }
    if (filter == "system") {
        return std::make_unique<nav::PaginatedList>(console, nav::toListItems(system), itemsPerPage);
    }

    std::vector<nav::ListSection> sections;
    sections.push_back(nav::ListSection{"User Replicas", nav::toListItems(user)});
    sections.push_back(nav::ListSection{"System Replicas", nav::toListItems(system)});
    return std::make_unique<nav::SectionedList>(console, std::move(sections), itemsPerPage);
}

ReplicaPicker::ReplicaPicker(tui::Console& console, int itemsPerPage)
    : console_(console), itemsPerPage_(itemsPerPage) {}

bool ReplicaPicker::refresh(api::ApiClient& client) {
    tui::BusyScope busy(console_, "Loading replicas");
    auto result = client.listReplicas();
    if (!result.ok) {
        cache_.clear();
        console_.showError(result.message);
        return false;
    }
    cache_.replace(std::move(result.data));
    return true;
}

std::optional<std::string> ReplicaPicker::pick(const std::shared_ptr<api::ApiClient>& client,
                                               const std::string& title) {
    if (!client) return std::nullopt;
    if (source_.lock() != client) {
        cache_.clear();
        source_ = client;
    }
    if ((!cache_.loaded() || cache_.empty()) && !refresh(*client)) return std::nullopt;
    if (cache_.empty()) {
        console_.showError("No replicas found. Please create a replica first.");
        return std::nullopt;
    }

    std::string filter = "all";
    int page = 0;
    while (true) {
        auto list = buildReplicaList(console_, cache_.items(), filter, itemsPerPage_);
        list->setTitle(title);
        list->setFilter(filter, true);
        list->setPolicy(nav::SelectionPolicy::PICK);
        restorePage(*list, page);

        nav::PaginationAction action = list->run();
        page = list->currentPage();
        switch (action.type) {
            case nav::ActionType::ITEM_SELECTED:
                LOG_DEBUG("picked replica " + action.value);
                return action.value;
            case nav::ActionType::FILTER_CHANGED:
                filter = nav::selectFilter(console_, "Select filter type:", replicaFilters(), filter);
                page = 0;
                break;
            default:
                return std::nullopt;
        }
    }
}

}
}
