#pragma once

#include "model/resource_cache.h"
#include "model/video.h"
#include "modules/module_support.h"
#include "modules/replica_picker.h"
#include "nav/module.h"
#include "tui/console.h"

#include <optional>
#include <string>
#include <vector>

namespace avatarcli {
namespace modules {

class VideoModule : public nav::Module {
public:
    static const char* const WORK_WITH_VIDEOS;
    static const char* const GENERATE_VIDEO;
    static const char* const LIST_VIDEOS;
    static const char* const RENAME_VIDEO;
    static const char* const DELETE_VIDEO;

    VideoModule(tui::Console& console, int itemsPerPage);

    std::string name() const override;
    std::vector<std::string> screens() const override;
    std::vector<nav::MenuEntry> menuEntries() const override;
    std::string execute(const std::string& screen, nav::NavigationContext& context) override;

    bool refresh(api::ApiClient& client);
    const model::ResourceCache<model::Video>& cache() const { return cache_; }

private:
    std::string workWithVideos(nav::NavigationContext& context);
    std::string generateVideo(nav::NavigationContext& context);
    std::string browse(nav::NavigationContext& context, ItemPolicy policy);
    std::optional<std::string> renameVideo(const model::Video& video, nav::NavigationContext& context);
    std::optional<std::string> deleteVideo(const model::Video& video, nav::NavigationContext& context);

    tui::Console& console_;
    int itemsPerPage_;
    model::ResourceCache<model::Video> cache_;
    ReplicaPicker picker_;
};

}
}
