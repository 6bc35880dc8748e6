#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace avatarcli {
namespace model {

struct Replica {
    std::string replicaId;
    std::string replicaName;
    std::string replicaType;
    std::string status;
    std::string trainingProgress;
    std::string createdAt;
    std::string updatedAt;
    std::string thumbnailVideoUrl;

    static Replica fromJson(const nlohmann::json& j);

    const std::string& id() const { return replicaId; }
    const std::string& name() const { return replicaName; }
    void setName(const std::string& name) { replicaName = name; }

    bool isCompleted() const { return status == "completed"; }
    bool isTraining() const { return status == "training"; }
    bool isUser() const { return replicaType == "user"; }
    bool isSystem() const { return replicaType == "system"; }

    // "current/total" as a whole percentage; 0 when unparseable.
    int trainingPercentage() const;

    std::string shortLabel() const;
    std::string longLabel() const;
};

}
}
