#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace avatarcli {
namespace model {

struct Video {
    std::string videoId;
    std::string videoName;
    std::string status;
    std::string createdAt;
    std::string updatedAt;
    nlohmann::json data = nlohmann::json::object();
    std::string downloadUrl;
    std::string streamUrl;
    std::string hostedUrl;
    std::string statusDetails;
    std::string stillImageThumbnailUrl;
    std::string gifThumbnailUrl;

    static Video fromJson(const nlohmann::json& j);

    const std::string& id() const { return videoId; }
    const std::string& name() const { return videoName; }
    void setName(const std::string& name) { videoName = name; }

    bool isReady() const { return status == "ready"; }
    bool isGenerating() const { return status == "generating"; }
    bool isFailed() const { return status == "error"; }
    bool isQueued() const { return status == "queued"; }

    std::string script() const;
    std::string scriptPreview(size_t maxLen = 100) const;

    std::string shortLabel() const;
    std::string longLabel() const;
};

}
}
