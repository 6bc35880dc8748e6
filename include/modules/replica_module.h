#pragma once

#include "model/replica.h"
#include "model/resource_cache.h"
#include "modules/module_support.h"
#include "nav/module.h"
#include "tui/console.h"

#include <optional>
#include <string>
#include <vector>

namespace avatarcli {
namespace modules {

class ReplicaModule : public nav::Module {
public:
    static const char* const WORK_WITH_REPLICAS;
    static const char* const CREATE_REPLICA;
    static const char* const LIST_REPLICAS;
    static const char* const RENAME_REPLICA;
    static const char* const DELETE_REPLICA;

    ReplicaModule(tui::Console& console, int itemsPerPage);

    std::string name() const override;
    std::vector<std::string> screens() const override;
    std::vector<nav::MenuEntry> menuEntries() const override;
    std::string execute(const std::string& screen, nav::NavigationContext& context) override;

    // Replaces the cache from the API; the message is shown on failure.
    bool refresh(api::ApiClient& client);
    const model::ResourceCache<model::Replica>& cache() const { return cache_; }

private:
    std::string workWithReplicas(nav::NavigationContext& context);
    std::string createReplica(nav::NavigationContext& context);
    std::string browse(nav::NavigationContext& context, ItemPolicy policy, std::string filter, bool showFilterToggle);
    std::optional<std::string> renameReplica(const model::Replica& replica, nav::NavigationContext& context);
    std::optional<std::string> deleteReplica(const model::Replica& replica, nav::NavigationContext& context);

    tui::Console& console_;
    int itemsPerPage_;
    model::ResourceCache<model::Replica> cache_;
};

}
}
