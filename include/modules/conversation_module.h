#pragma once

#include "model/conversation.h"
#include "model/resource_cache.h"
#include "modules/module_support.h"
#include "modules/replica_picker.h"
#include "nav/module.h"
#include "tui/console.h"

#include <optional>
#include <string>
#include <vector>

namespace avatarcli {
namespace modules {

class ConversationModule : public nav::Module {
public:
    static const char* const WORK_WITH_CONVERSATIONS;
    static const char* const CREATE_CONVERSATION;
    static const char* const LIST_CONVERSATIONS;
    static const char* const END_CONVERSATION;
    static const char* const DELETE_CONVERSATION;

    ConversationModule(tui::Console& console, int itemsPerPage);

    std::string name() const override;
    std::vector<std::string> screens() const override;
    std::vector<nav::MenuEntry> menuEntries() const override;
    std::string execute(const std::string& screen, nav::NavigationContext& context) override;

    bool refresh(api::ApiClient& client);
    const model::ResourceCache<model::Conversation>& cache() const { return cache_; }

private:
    std::string workWithConversations(nav::NavigationContext& context);
    std::string createConversation(nav::NavigationContext& context);
    std::string browse(nav::NavigationContext& context, ItemPolicy policy);
    std::optional<std::string> pickPersona(nav::NavigationContext& context, bool& hasDefaultReplica);
    std::optional<std::string> endConversation(const model::Conversation& conversation, nav::NavigationContext& context);
    std::optional<std::string> deleteConversation(const model::Conversation& conversation,
                                                  nav::NavigationContext& context);

    tui::Console& console_;
    int itemsPerPage_;
    model::ResourceCache<model::Conversation> cache_;
    ReplicaPicker picker_;
};

}
}
