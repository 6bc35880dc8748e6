#pragma once

#include "api/api_client.h"
#include "model/replica.h"
#include "model/resource_cache.h"
#include "nav/pagination.h"
#include "tui/console.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace avatarcli {
namespace modules {

const std::vector<std::string>& replicaFilters();

// "all" puts user replicas before system replicas under section headers;
// "user" and "system" show one flat list.
std::unique_ptr<nav::PaginatedList> buildReplicaList(tui::Console& console,
                                                     const std::vector<model::Replica>& replicas,
                                                     const std::string& filter, int itemsPerPage);

class ReplicaPicker {
public:
    ReplicaPicker(tui::Console& console, int itemsPerPage);

    // Loads replicas when nothing is cached, the last load came back empty,
    // or the client was replaced since. std::nullopt when the operator backs
    // out or nothing could be loaded.
    std::optional<std::string> pick(const std::shared_ptr<api::ApiClient>& client,
                                    const std::string& title = "Select Replica");
    bool refresh(api::ApiClient& client);
    const model::ResourceCache<model::Replica>& cache() const { return cache_; }

private:
    tui::Console& console_;
    int itemsPerPage_;
    model::ResourceCache<model::Replica> cache_;
    std::weak_ptr<api::ApiClient> source_;
};

}
}
