#include "modules/conversation_module.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace avatarcli {
namespace modules {

using utils::Formatter;

const char* const ConversationModule::WORK_WITH_CONVERSATIONS = "work_with_conversations";
const char* const ConversationModule::CREATE_CONVERSATION = "create_conversation";
const char* const ConversationModule::LIST_CONVERSATIONS = "list_conversations";
const char* const ConversationModule::END_CONVERSATION = "end_conversation";
const char* const ConversationModule::DELETE_CONVERSATION = "delete_conversation";

ConversationModule::ConversationModule(tui::Console& console, int itemsPerPage)
    : console_(console), itemsPerPage_(itemsPerPage), picker_(console, itemsPerPage) {}

std::string ConversationModule::name() const {
    return "conversation";
}

std::vector<std::string> ConversationModule::screens() const {
    return {WORK_WITH_CONVERSATIONS, CREATE_CONVERSATION, LIST_CONVERSATIONS, END_CONVERSATION, DELETE_CONVERSATION};
}

std::vector<nav::MenuEntry> ConversationModule::menuEntries() const {
    return {{"Work with Conversations", WORK_WITH_CONVERSATIONS}};
}

std::string ConversationModule::execute(const std::string& screen, nav::NavigationContext& context) {
    if (!requireClient(console_, context)) return nav::screens::MAIN_MENU;
    if (screen == WORK_WITH_CONVERSATIONS) return workWithConversations(context);
    if (screen == CREATE_CONVERSATION) return createConversation(context);
    if (screen == LIST_CONVERSATIONS) return browse(context, ItemPolicy::SHOW_DETAILS);
    if (screen == END_CONVERSATION) return browse(context, ItemPolicy::END);
    if (screen == DELETE_CONVERSATION) return browse(context, ItemPolicy::DELETE);
    return nav::screens::MAIN_MENU;
}

bool ConversationModule::refresh(api::ApiClient& client) {
    tui::BusyScope busy(console_, "Loading conversations");
    auto result = client.listConversations();
    if (!result.ok) {
        cache_.clear();
        console_.showError("Warning: " + result.message);
        return false;
    }
    cache_.replace(std::move(result.data));
    return true;
}

std::string ConversationModule::workWithConversations(nav::NavigationContext& context) {
    refresh(*context.client);

    static const std::vector<std::string> options = {
        "Create a Conversation", "List Conversations", "End a Conversation", "Delete a Conversation",
        "Back to Main Menu"};
    auto choice = console_.menu("What would you like to do with Conversations?", options);
    if (!choice || *choice == "Back to Main Menu") return nav::screens::MAIN_MENU;
    if (*choice == "Create a Conversation") return CREATE_CONVERSATION;
    if (*choice == "List Conversations") return LIST_CONVERSATIONS;
    if (*choice == "End a Conversation") return END_CONVERSATION;
    if (*choice == "Delete a Conversation") return DELETE_CONVERSATION;
    return WORK_WITH_CONVERSATIONS;
}

std::optional<std::string> ConversationModule::pickPersona(nav::NavigationContext& context, bool& hasDefaultReplica) {
    hasDefaultReplica = false;
    api::ApiResult<std::vector<model::Persona>> personas;
    {
        tui::BusyScope busy(console_, "Loading personas");
        personas = context.client->listPersonas();
    }
    if (!personas.ok) {
        console_.showError(personas.message);
        return std::nullopt;
    }

    nav::PaginatedList list(console_, nav::toListItems(personas.data), itemsPerPage_);
    list.setTitle("Select Persona");
    list.setPolicy(nav::SelectionPolicy::PICK);
    nav::PaginationAction action = list.run();
    if (action.type != nav::ActionType::ITEM_SELECTED) return std::nullopt;

    const model::Persona& chosen = personas.data[static_cast<size_t>(action.item)];
    hasDefaultReplica = chosen.hasDefaultReplica();
    return chosen.personaId;
}

std::string ConversationModule::createConversation(nav::NavigationContext& context) {
    api::NewConversation fields;
    fields.name = Formatter::trim(console_.prompt("Conversation Name (optional):"));

    bool personaHasReplica = false;
    if (console_.confirm("Use a persona for this conversation?")) {
        if (auto personaId = pickPersona(context, personaHasReplica)) {
            fields.personaId = *personaId;
        } else {
            console_.showMessage("No persona selected.", tui::Color::YELLOW);
        }
    }

    bool wantReplica = !personaHasReplica || console_.confirm("Override the persona's default replica?");
    if (wantReplica) {
        auto replicaId = picker_.pick(context.client, "Select a replica for this conversation");
        if (replicaId) {
            fields.replicaId = *replicaId;
        } else if (!personaHasReplica) {
            console_.showMessage("Replica selection cancelled.", tui::Color::YELLOW);
            return WORK_WITH_CONVERSATIONS;
        }
    }

    std::string summary = "Start conversation '" + (fields.name.empty() ? std::string("(unnamed)") : fields.name) +
                          "' with replica " + (fields.replicaId.empty() ? "from persona" : fields.replicaId) +
                          (fields.personaId.empty() ? "" : " and persona " + fields.personaId) + "?";
    if (!console_.confirm(summary)) {
        console_.showMessage("Conversation creation cancelled.", tui::Color::YELLOW);
        return WORK_WITH_CONVERSATIONS;
    }

    api::ApiResult<std::optional<model::Conversation>> result;
    {
        tui::BusyScope busy(console_, "Creating conversation");
        result = context.client->createConversation(fields);
    }
    if (!result.ok) {
        console_.showError(result.message);
        return WORK_WITH_CONVERSATIONS;
    }

    if (result.data) {
        cache_.add(*result.data);
        console_.showDetails(result.message, result.data->longLabel());
    }
    console_.showMessage(result.message);
    return WORK_WITH_CONVERSATIONS;
}

std::string ConversationModule::browse(nav::NavigationContext& context, ItemPolicy policy) {
    int page = 0;
    while (true) {
        nav::PaginatedList list(console_, nav::toListItems(cache_.items()), itemsPerPage_);
        list.setTitle("Conversations");
        list.setFilter("all", false);
        list.setPolicy(toSelectionPolicy(policy));
        restorePage(list, page);

        nav::PaginationAction action = list.run();
        page = list.currentPage();

        switch (action.type) {
            case nav::ActionType::GO_BACK:
                return WORK_WITH_CONVERSATIONS;
            case nav::ActionType::ITEM_SELECTED: {
                const model::Conversation* found = cache_.find(action.value);
                if (!found) break;
                model::Conversation selected = *found;
                std::optional<std::string> next;
                switch (policy) {
                    case ItemPolicy::END:
                        next = endConversation(selected, context);
                        break;
                    case ItemPolicy::DELETE:
                        next = deleteConversation(selected, context);
                        break;
                    case ItemPolicy::RENAME:
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

std::optional<std::string> ConversationModule::endConversation(const model::Conversation& conversation,
                                                               nav::NavigationContext& context) {
    if (conversation.status == "ended") {
        console_.showError("Conversation '" + conversation.conversationName + "' has already ended.");
        return std::nullopt;
    }
    if (!console_.confirm("End conversation '" + conversation.conversationName + "' (" +
                          conversation.conversationId + ")?")) {
        console_.showMessage("End operation cancelled.", tui::Color::YELLOW);
        return std::nullopt;
    }

    api::ApiStatus status;
    {
        tui::BusyScope busy(console_, "Ending conversation");
        status = context.client->endConversation(conversation.conversationId);
    }
    if (status.ok) {
        cache_.update(conversation.conversationId, [](model::Conversation& c) { c.status = "ended"; });
        console_.showMessage("Conversation ended: " + conversation.conversationName);
    } else {
        console_.showError("Error ending conversation: " + status.message);
    }
    return std::string(WORK_WITH_CONVERSATIONS);
}

std::optional<std::string> ConversationModule::deleteConversation(const model::Conversation& conversation,
                                                                  nav::NavigationContext& context) {
    if (!console_.confirm("Delete conversation '" + conversation.conversationName + "' (" +
                          conversation.conversationId + ")? This action cannot be undone!")) {
        console_.showMessage("Delete operation cancelled.", tui::Color::YELLOW);
        return std::nullopt;
    }

    api::ApiStatus status;
    {
        tui::BusyScope busy(console_, "Deleting conversation");
        status = context.client->deleteConversation(conversation.conversationId);
    }
    if (status.ok) {
        cache_.removeById(conversation.conversationId);
        LOG_INFO("deleted conversation " + conversation.conversationId);
        console_.showMessage("Conversation deleted successfully: " + conversation.conversationName);
    } else {
        console_.showError("Error deleting conversation: " + status.message);
    }
    return std::string(WORK_WITH_CONVERSATIONS);
}

}
}
