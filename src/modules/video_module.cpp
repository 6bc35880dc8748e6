#include "modules/video_module.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace avatarcli {
namespace modules {

using utils::Formatter;

const char* const VideoModule::WORK_WITH_VIDEOS = "work_with_videos";
const char* const VideoModule::GENERATE_VIDEO = "generate_video";
const char* const VideoModule::LIST_VIDEOS = "list_videos";
const char* const VideoModule::RENAME_VIDEO = "rename_video";
const char* const VideoModule::DELETE_VIDEO = "delete_video";

VideoModule::VideoModule(tui::Console& console, int itemsPerPage)
    : console_(console), itemsPerPage_(itemsPerPage), picker_(console, itemsPerPage) {}

std::string VideoModule::name() const {
    return "video";
}

std::vector<std::string> VideoModule::screens() const {
    return {WORK_WITH_VIDEOS, GENERATE_VIDEO, LIST_VIDEOS, RENAME_VIDEO, DELETE_VIDEO};
}

std::vector<nav::MenuEntry> VideoModule::menuEntries() const {
    return {{"Work with Videos", WORK_WITH_VIDEOS}};
}

std::string VideoModule::execute(const std::string& screen, nav::NavigationContext& context) {
    if (!requireClient(console_, context)) return nav::screens::MAIN_MENU;
    if (screen == WORK_WITH_VIDEOS) return workWithVideos(context);
    if (screen == GENERATE_VIDEO) return generateVideo(context);
    if (screen == LIST_VIDEOS) return browse(context, ItemPolicy::SHOW_DETAILS);
    if (screen == RENAME_VIDEO) return browse(context, ItemPolicy::RENAME);
    if (screen == DELETE_VIDEO) return browse(context, ItemPolicy::DELETE);
    return nav::screens::MAIN_MENU;
}

bool VideoModule::refresh(api::ApiClient& client) {
    tui::BusyScope busy(console_, "Loading videos");
    auto result = client.listVideos();
    if (!result.ok) {
        cache_.clear();
        console_.showError(result.message);
        return false;
    }
    cache_.replace(std::move(result.data));
    return true;
}

std::string VideoModule::workWithVideos(nav::NavigationContext& context) {
    refresh(*context.client);

    static const std::vector<std::string> options = {
        "Generate a Video", "List Videos", "Rename a Video", "Delete a Video", "Back to Main Menu"};
    auto choice = console_.menu("What would you like to do with Videos?", options);
    if (!choice || *choice == "Back to Main Menu") return nav::screens::MAIN_MENU;
    if (*choice == "Generate a Video") return GENERATE_VIDEO;
    if (*choice == "List Videos") return LIST_VIDEOS;
    if (*choice == "Rename a Video") return RENAME_VIDEO;
    if (*choice == "Delete a Video") return DELETE_VIDEO;
    return WORK_WITH_VIDEOS;
}

std::string VideoModule::generateVideo(nav::NavigationContext& context) {
    api::NewVideo fields;
    fields.name = console_.prompt("Video Name:");
    if (Formatter::isBlank(fields.name)) {
        console_.showError("Video name cannot be empty.");
        return WORK_WITH_VIDEOS;
    }

    auto replicaId = picker_.pick(context.client, "Select a replica for this video");
    if (!replicaId) {
        console_.showMessage("Replica selection cancelled.", tui::Color::YELLOW);
        return WORK_WITH_VIDEOS;
    }
    fields.replicaId = *replicaId;

    fields.script = console_.prompt("Script:");
    if (Formatter::isBlank(fields.script)) {
        console_.showError("Script cannot be empty.");
        return WORK_WITH_VIDEOS;
    }

    if (!console_.confirm("Generate '" + fields.name + "' with replica " + fields.replicaId + ": \"" +
                          Formatter::truncate(fields.script, 100) + "\"?")) {
        console_.showMessage("Video generation cancelled.", tui::Color::YELLOW);
        return WORK_WITH_VIDEOS;
    }

    api::ApiResult<std::optional<model::Video>> result;
    {
        tui::BusyScope busy(console_, "Generating video");
        result = context.client->createVideo(fields);
    }
    if (!result.ok) {
        console_.showError(result.message);
        return WORK_WITH_VIDEOS;
    }

    if (result.data) cache_.add(*result.data);
    std::string id = result.data ? result.data->videoId : "N/A";
    std::string status = result.data && !result.data->status.empty() ? result.data->status : "N/A";
    console_.showMessage(result.message + " - ID: " + id + ", Status: " + status +
                         ". Generation is now in progress.");
    return WORK_WITH_VIDEOS;
}

std::string VideoModule::browse(nav::NavigationContext& context, ItemPolicy policy) {
    int page = 0;
    while (true) {
        nav::PaginatedList list(console_, nav::toListItems(cache_.items()), itemsPerPage_);
        list.setTitle("Videos");
        list.setFilter("all", false);
        list.setPolicy(toSelectionPolicy(policy));
        restorePage(list, page);

        nav::PaginationAction action = list.run();
        page = list.currentPage();

        switch (action.type) {
            case nav::ActionType::GO_BACK:
                return WORK_WITH_VIDEOS;
            case nav::ActionType::ITEM_SELECTED: {
                const model::Video* found = cache_.find(action.value);
                if (!found) break;
                model::Video selected = *found;
                std::optional<std::string> next;
                switch (policy) {
                    case ItemPolicy::RENAME:
                        next = renameVideo(selected, context);
                        break;
                    case ItemPolicy::DELETE:
                        next = deleteVideo(selected, context);
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

std::optional<std::string> VideoModule::renameVideo(const model::Video& video, nav::NavigationContext& context) {
    std::string newName = Formatter::trim(console_.prompt("New name for '" + video.videoName + "':"));
    if (newName.empty()) {
        console_.showError("Video name cannot be empty.");
        return std::nullopt;
    }
    if (!console_.confirm("Rename '" + video.videoName + "' to '" + newName + "'?")) {
        console_.showMessage("Rename operation cancelled.", tui::Color::YELLOW);
        return std::nullopt;
    }

    api::ApiStatus status;
    {
        tui::BusyScope busy(console_, "Renaming video");
        status = context.client->renameVideo(video.videoId, newName);
    }
    if (status.ok) {
        cache_.rename(video.videoId, newName);
        console_.showMessage("Video renamed successfully to: " + newName);
    } else {
        console_.showError("Error renaming video: " + status.message);
    }
    return std::string(WORK_WITH_VIDEOS);
}

std::optional<std::string> VideoModule::deleteVideo(const model::Video& video, nav::NavigationContext& context) {
    if (!console_.confirm("Delete video '" + video.videoName + "' (" + video.videoId + ", " + video.status +
                          ")? This action cannot be undone!")) {
        console_.showMessage("Delete operation cancelled.", tui::Color::YELLOW);
        return std::nullopt;
    }

    api::ApiStatus status;
    {
        tui::BusyScope busy(console_, "Deleting video");
        status = context.client->deleteVideo(video.videoId);
    }
    if (status.ok) {
        cache_.removeById(video.videoId);
        LOG_INFO("deleted video " + video.videoId);
        console_.showMessage("Video deleted successfully: " + video.videoName);
    } else {
        console_.showError("Error deleting video: " + status.message);
    }
    return std::string(WORK_WITH_VIDEOS);
}

}
}
