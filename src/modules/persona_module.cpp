#include "modules/persona_module.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace avatarcli {
namespace modules {

using utils::Formatter;

const char* const PersonaModule::WORK_WITH_PERSONAS = "work_with_personas";
const char* const PersonaModule::CREATE_PERSONA = "create_persona";
const char* const PersonaModule::LIST_PERSONAS = "list_personas";
const char* const PersonaModule::RENAME_PERSONA = "rename_persona";
const char* const PersonaModule::DELETE_PERSONA = "delete_persona";

PersonaModule::PersonaModule(tui::Console& console, int itemsPerPage)
    : console_(console), itemsPerPage_(itemsPerPage), picker_(console, itemsPerPage) {}

const std::vector<std::string>& PersonaModule::filters() {
    static const std::vector<std::string> values = {"user", "system"};
    return values;
}

std::string PersonaModule::name() const {
    return "persona";
}

std::vector<std::string> PersonaModule::screens() const {
    return {WORK_WITH_PERSONAS, CREATE_PERSONA, LIST_PERSONAS, RENAME_PERSONA, DELETE_PERSONA};
}

std::vector<nav::MenuEntry> PersonaModule::menuEntries() const {
    return {{"Work with Personas", WORK_WITH_PERSONAS}};
}

std::string PersonaModule::execute(const std::string& screen, nav::NavigationContext& context) {
    if (!requireClient(console_, context)) return nav::screens::MAIN_MENU;
    if (screen == WORK_WITH_PERSONAS) {
        refresh(*context.client, "user");
        return workWithPersonas();
    }
    if (screen == CREATE_PERSONA) return createPersona(context);
    // Each list screen browses a fresh snapshot; a failed fetch never falls
    // back to personas loaded under an earlier key.
    if (screen == LIST_PERSONAS) {
        if (!refresh(*context.client, "user")) return WORK_WITH_PERSONAS;
        return browse(context, ItemPolicy::SHOW_DETAILS, true);
    }
    if (screen == RENAME_PERSONA) {
        if (!refresh(*context.client, "user")) return WORK_WITH_PERSONAS;
        return browse(context, ItemPolicy::RENAME, false);
    }
    if (screen == DELETE_PERSONA) {
        if (!refresh(*context.client, "user")) return WORK_WITH_PERSONAS;
        return browse(context, ItemPolicy::DELETE, false);
    }
    return nav::screens::MAIN_MENU;
}

bool PersonaModule::refresh(api::ApiClient& client, const std::string& personaType) {
    tui::BusyScope busy(console_, "Loading personas");
    api::PersonaFilter filter;
    filter.personaType = personaType;
    auto result = client.listPersonas(filter);
    cachedType_ = personaType;
    if (!result.ok) {
        cache_.clear();
        console_.showError(result.message);
        return false;
    }
    cache_.replace(std::move(result.data));
    return true;
}

std::string PersonaModule::workWithPersonas() {
    static const std::vector<std::string> options = {
        "Create a Persona", "List Personas", "Rename a Persona", "Delete a Persona", "Back to Main Menu"};
    auto choice = console_.menu("What would you like to do with Personas?", options);
    if (!choice || *choice == "Back to Main Menu") return nav::screens::MAIN_MENU;
    if (*choice == "Create a Persona") return CREATE_PERSONA;
    if (*choice == "List Personas") return LIST_PERSONAS;
    if (*choice == "Rename a Persona") return RENAME_PERSONA;
    if (*choice == "Delete a Persona") return DELETE_PERSONA;
    return WORK_WITH_PERSONAS;
}

std::string PersonaModule::createPersona(nav::NavigationContext& context) {
    api::NewPersona fields;
    fields.name = console_.prompt("Persona Name:");
    if (Formatter::isBlank(fields.name)) {
        console_.showError("Persona name cannot be empty.");
        return WORK_WITH_PERSONAS;
    }
    fields.systemPrompt = console_.prompt("System Prompt:");
    if (Formatter::isBlank(fields.systemPrompt)) {
        console_.showError("System prompt cannot be empty.");
        return WORK_WITH_PERSONAS;
    }
    fields.context = Formatter::trim(console_.prompt("Context (optional):"));

    if (console_.confirm("Select a default replica for this persona?")) {
        if (auto replicaId = picker_.pick(context.client, "Select Default Replica")) {
            fields.defaultReplicaId = *replicaId;
        } else {
            console_.showMessage("No default replica selected.", tui::Color::YELLOW);
        }
    }

    std::string summary = "Create persona '" + fields.name + "' (default replica: " +
                          (fields.defaultReplicaId.empty() ? "None" : fields.defaultReplicaId) + ")?";
    if (!console_.confirm(summary)) {
        console_.showMessage("Persona creation cancelled.", tui::Color::YELLOW);
        return WORK_WITH_PERSONAS;
    }

    api::ApiResult<std::optional<model::Persona>> result;
    {
        tui::BusyScope busy(console_, "Creating persona");
        result = context.client->createPersona(fields);
    }
    if (!result.ok) {
        console_.showError(result.message);
        return WORK_WITH_PERSONAS;
    }
    if (result.data && cachedType_ == "user") cache_.add(*result.data);
    std::string id = result.data ? result.data->personaId : "N/A";
    console_.showMessage(result.message + " - ID: " + id);
    return WORK_WITH_PERSONAS;
}

std::string PersonaModule::browse(nav::NavigationContext& context, ItemPolicy policy, bool showFilterToggle) {
    if (policy != ItemPolicy::SHOW_DETAILS) {
        console_.showMessage("Only user personas can be modified. System personas are read-only.", tui::Color::CYAN);
    }

    int page = 0;
    while (true) {
        nav::PaginatedList list(console_, nav::toListItems(cache_.items()), itemsPerPage_);
        list.setTitle("Personas");
        list.setFilter(cachedType_, showFilterToggle);
        list.setPolicy(toSelectionPolicy(policy));
        restorePage(list, page);

        nav::PaginationAction action = list.run();
        page = list.currentPage();

        switch (action.type) {
            case nav::ActionType::GO_BACK:
                return WORK_WITH_PERSONAS;
            case nav::ActionType::FILTER_CHANGED: {
                std::string next = nav::selectFilter(console_, "Select filter type:", filters(), cachedType_);
                if (next != cachedType_) refresh(*context.client, next);
                page = 0;
                break;
            }
            case nav::ActionType::ITEM_SELECTED: {
                const model::Persona* found = cache_.find(action.value);
                if (!found) break;
                model::Persona selected = *found;
                std::optional<std::string> next;
                switch (policy) {
                    case ItemPolicy::RENAME:
                        next = renamePersona(selected, context);
                        break;
                    case ItemPolicy::DELETE:
                        next = deletePersona(selected, context);
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

std::optional<std::string> PersonaModule::renamePersona(const model::Persona& persona, nav::NavigationContext& context) {
    std::string newName = Formatter::trim(console_.prompt("New name for '" + persona.personaName + "':"));
    if (newName.empty()) {
        console_.showError("Persona name cannot be empty.");
        return std::nullopt;
    }
    if (!console_.confirm("Rename '" + persona.personaName + "' to '" + newName + "'?")) {
        console_.showMessage("Rename operation cancelled.", tui::Color::YELLOW);
        return std::nullopt;
    }

    api::ApiStatus status;
    {
        tui::BusyScope busy(console_, "Renaming persona");
        status = context.client->renamePersona(persona.personaId, newName);
    }
    if (status.ok) {
        cache_.rename(persona.personaId, newName);
        console_.showMessage("Persona renamed successfully to: " + newName);
    } else {
        console_.showError("Error renaming persona: " + status.message);
    }
    return std::string(WORK_WITH_PERSONAS);
}

std::optional<std::string> PersonaModule::deletePersona(const model::Persona& persona, nav::NavigationContext& context) {
    if (!console_.confirm("Delete persona '" + persona.personaName + "' (" + persona.personaId +
                          ")? This action cannot be undone!")) {
        console_.showMessage("Delete operation cancelled.", tui::Color::YELLOW);
        return std::nullopt;
    }

    api::ApiStatus status;
    {
        tui::BusyScope busy(console_, "Deleting persona");
        status = context.client->deletePersona(persona.personaId);
    }
    if (status.ok) {
        cache_.removeById(persona.personaId);
        LOG_INFO("deleted persona " + persona.personaId);
        console_.showMessage("Persona deleted successfully: " + persona.personaName);
    } else {
        console_.showError("Error deleting persona: " + status.message);
    }
    return std::string(WORK_WITH_PERSONAS);
}

}
}
