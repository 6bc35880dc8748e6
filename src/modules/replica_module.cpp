#include "modules/replica_module.h"
#include "modules/replica_picker.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace avatarcli {
namespace modules {

using utils::Formatter;

const char* const ReplicaModule::WORK_WITH_REPLICAS = "work_with_replicas";
const char* const ReplicaModule::CREATE_REPLICA = "create_replica";
const char* const ReplicaModule::LIST_REPLICAS = "list_replicas";
const char* const ReplicaModule::RENAME_REPLICA = "rename_replica";
const char* const ReplicaModule::DELETE_REPLICA = "delete_replica";

ReplicaModule::ReplicaModule(tui::Console& console, int itemsPerPage)
    : console_(console), itemsPerPage_(itemsPerPage) {}

std::string ReplicaModule::name() const {
    return "replica";
}

std::vector<std::string> ReplicaModule::screens() const {
    return {WORK_WITH_REPLICAS, CREATE_REPLICA, LIST_REPLICAS, RENAME_REPLICA, DELETE_REPLICA};
}

std::vector<nav::MenuEntry> ReplicaModule::menuEntries() const {
    return {{"Work with Replicas", WORK_WITH_REPLICAS}};
}

std::string ReplicaModule::execute(const std::string& screen, nav::NavigationContext& context) {
    if (screen == WORK_WITH_REPLICAS) return workWithReplicas(context);
    if (!requireClient(console_, context)) return nav::screens::MAIN_MENU;
    if (screen == CREATE_REPLICA) return createReplica(context);
    if (screen == LIST_REPLICAS) return browse(context, ItemPolicy::SHOW_DETAILS, "all", true);
    if (screen == RENAME_REPLICA) return browse(context, ItemPolicy::RENAME, "user", false);
    if (screen == DELETE_REPLICA) return browse(context, ItemPolicy::DELETE, "user", false);
    return nav::screens::MAIN_MENU;
}

bool ReplicaModule::refresh(api::ApiClient& client) {
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

std::string ReplicaModule::workWithReplicas(nav::NavigationContext& context) {
    if (!requireClient(console_, context)) return nav::screens::MAIN_MENU;
    refresh(*context.client);

    static const std::vector<std::string> options = {
        "Create a Replica", "List Replicas", "Rename a Replica", "Delete a Replica", "Back to Main Menu"};
    auto choice = console_.menu("What would you like to do with Replicas?", options);
    if (!choice || *choice == "Back to Main Menu") return nav::screens::MAIN_MENU;
    if (*choice == "Create a Replica") return CREATE_REPLICA;
    if (*choice == "List Replicas") return LIST_REPLICAS;
    if (*choice == "Rename a Replica") return RENAME_REPLICA;
    if (*choice == "Delete a Replica") return DELETE_REPLICA;
    return WORK_WITH_REPLICAS;
}

std::string ReplicaModule::createReplica(nav::NavigationContext& context) {
    api::NewReplica fields;
    fields.name = console_.prompt("Replica Name:");
    if (Formatter::isBlank(fields.name)) {
        console_.showError("Replica name cannot be empty.");
        return WORK_WITH_REPLICAS;
    }
    fields.trainVideoUrl = console_.prompt("Training Video URL:");
    if (Formatter::isBlank(fields.trainVideoUrl)) {
        console_.showError("Video URL cannot be empty.");
        return WORK_WITH_REPLICAS;
    }
    fields.consentVideoUrl = console_.prompt("Consent Video URL:");
    if (Formatter::isBlank(fields.consentVideoUrl)) {
        console_.showError("Video URL cannot be empty.");
        return WORK_WITH_REPLICAS;
    }

    if (!console_.confirm("Create replica '" + fields.name + "' from " + fields.trainVideoUrl + "?")) {
        console_.showMessage("Replica creation cancelled.", tui::Color::YELLOW);
        return WORK_WITH_REPLICAS;
    }

    api::ApiResult<std::optional<model::Replica>> result;
    {
        tui::BusyScope busy(console_, "Creating replica");
        result = context.client->createReplica(fields);
    }
    if (!result.ok) {
        console_.showError(result.message);
        return WORK_WITH_REPLICAS;
    }

    std::string id = result.data ? result.data->replicaId : "N/A";
    std::string status = result.data && !result.data->status.empty() ? result.data->status : "N/A";
    console_.showMessage(result.message + " - ID: " + id + ", Status: " + status +
                         ". Training is now in progress.");
    return WORK_WITH_REPLICAS;
}

std::string ReplicaModule::browse(nav::NavigationContext& context, ItemPolicy policy, std::string filter,
                                  bool showFilterToggle) {
    if (policy != ItemPolicy::SHOW_DETAILS) {
        console_.showMessage("Only user replicas can be modified. System replicas are read-only.", tui::Color::CYAN);
    }

    int page = 0;
    while (true) {
        auto list = buildReplicaList(console_, cache_.items(), filter, itemsPerPage_);
        list->setTitle("Replicas");
        list->setFilter(filter, showFilterToggle);
        list->setPolicy(toSelectionPolicy(policy));
        restorePage(*list, page);

        nav::PaginationAction action = list->run();
        page = list->currentPage();

        switch (action.type) {
            case nav::ActionType::GO_BACK:
                return WORK_WITH_REPLICAS;
            case nav::ActionType::FILTER_CHANGED:
                filter = nav::selectFilter(console_, "Select filter type:", replicaFilters(), filter);
                page = 0;
                break;
            case nav::ActionType::ITEM_SELECTED: {
                const model::Replica* found = cache_.find(action.value);
                if (!found) break;
                model::Replica selected = *found;
                std::optional<std::string> next;
                switch (policy) {
                    case ItemPolicy::RENAME:
                        next = renameReplica(selected, context);
                        break;
                    case ItemPolicy::DELETE:
                        next = deleteReplica(selected, context);
                        break;
                    case ItemPolicy::END:
                    case ItemPolicy::RETURN_ID:
                    case ItemPolicy::SHOW_DETAILS:
                        break;
                }
                if (next) return *next;
                break;
            }
            default:
                break;
        }
    }
}

std::optional<std::string> ReplicaModule::renameReplica(const model::Replica& replica, nav::NavigationContext& context) {
    if (!replica.isUser()) {
        console_.showError("Error: Cannot rename system replicas. This replica is of type '" + replica.replicaType + "'.");
        return std::nullopt;
    }

    std::string newName = Formatter::trim(console_.prompt("New name for '" + replica.replicaName + "':"));
    if (newName.empty()) {
        console_.showError("Replica name cannot be empty.");
        return std::nullopt;
    }
    if (!console_.confirm("Rename '" + replica.replicaName + "' to '" + newName + "'?")) {
        console_.showMessage("Rename operation cancelled.", tui::Color::YELLOW);
        return std::nullopt;
    }

    api::ApiStatus status;
    {
        tui::BusyScope busy(console_, "Renaming replica");
        status = context.client->renameReplica(replica.replicaId, newName);
    }
    if (status.ok) {
        cache_.rename(replica.replicaId, newName);
        console_.showMessage("Replica renamed successfully to: " + newName);
    } else {
        console_.showError("Error renaming replica: " + status.message);
    }
    return std::string(WORK_WITH_REPLICAS);
}

std::optional<std::string> ReplicaModule::deleteReplica(const model::Replica& replica, nav::NavigationContext& context) {
    if (!replica.isUser()) {
        console_.showError("Error: Cannot delete system replicas. This replica is of type '" + replica.replicaType + "'.");
        return std::nullopt;
    }
    if (!console_.confirm("Delete replica '" + replica.replicaName + "' (" + replica.replicaId +
                          ")? This action cannot be undone!")) {
        console_.showMessage("Delete operation cancelled.", tui::Color::YELLOW);
        return std::nullopt;
    }

    api::ApiStatus status;
    {
        tui::BusyScope busy(console_, "Deleting replica");
        status = context.client->deleteReplica(replica.replicaId);
    }
    if (status.ok) {
        cache_.removeById(replica.replicaId);
        LOG_INFO("deleted replica " + replica.replicaId);
        console_.showMessage("Replica deleted successfully: " + replica.replicaName);
    } else {
        console_.showError("Error deleting replica: " + status.message);
    }
    return std::string(WORK_WITH_REPLICAS);
}

}
}
