#include "model/video.h"
#include "model/json_fields.h"
#include "utils/utils.h"

#include <sstream>

namespace avatarcli {
namespace model {

Video Video::fromJson(const nlohmann::json& j) {
    Video v;
    v.videoId = stringField(j, "video_id");
    v.videoName = stringField(j, "video_name");
    v.status = stringField(j, "status");
    v.createdAt = stringField(j, "created_at");
    v.updatedAt = stringField(j, "updated_at");
    v.data = objectField(j, "data");
    v.downloadUrl = stringField(j, "download_url");
    v.streamUrl = stringField(j, "stream_url");
    v.hostedUrl = stringField(j, "hosted_url");
    v.statusDetails = stringField(j, "status_details");
    v.stillImageThumbnailUrl = stringField(j, "still_image_thumbnail_url");
    v.gifThumbnailUrl = stringField(j, "gif_thumbnail_url");
    return v;
}

std::string Video::script() const {
    return stringField(data, "script");
}

std::string Video::scriptPreview(size_t maxLen) const {
    return utils::Formatter::preview(script(), maxLen, "No script");
}

std::string Video::shortLabel() const {
    const char* mark = isReady() ? "[ok]" : isGenerating() ? "[..]" : isFailed() ? "[x]" : "[~]";
    std::ostringstream out;
    out << mark << " " << videoName << " (" << videoId << ") - " << status;
    return out.str();
}

std::string Video::longLabel() const {
    std::ostringstream out;
    out << "Video Details:\n";
    out << "  ID: " << videoId << "\n";
    out << "  Name: " << videoName << "\n";
    out << "  Status: " << status << "\n";
    out << "  Created: " << createdAt << "\n";
    out << "  Updated: " << updatedAt << "\n";
    if (!statusDetails.empty()) out << "  Status Details: " << statusDetails << "\n";
    if (!downloadUrl.empty()) out << "  Download URL: " << downloadUrl << "\n";
    if (!streamUrl.empty()) out << "  Stream URL: " << streamUrl << "\n";
    if (!hostedUrl.empty()) out << "  Hosted URL: " << hostedUrl << "\n";
    if (!stillImageThumbnailUrl.empty()) out << "  Still Image Thumbnail: " << stillImageThumbnailUrl << "\n";
    if (!gifThumbnailUrl.empty()) out << "  GIF Thumbnail: " << gifThumbnailUrl << "\n";
    if (data.empty()) {
        out << "  Data: None";
        return out.str();
    }
    out << "  Data: " << data.size() << " items";
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (it.key() == "script") {
            out << "\n    - Script: " << scriptPreview(10000);
        } else {
            out << "\n    - " << it.key() << ": " << valueText(*it);
        }
    }
    return out.str();
}

}
}
