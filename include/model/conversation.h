#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace avatarcli {
namespace model {

struct Conversation {
    std::string conversationId;
    std::string conversationName;
    std::string conversationUrl;
    std::string callbackUrl;
    std::string status;
    std::string replicaId;
    std::string personaId;
    std::string createdAt;
    std::string updatedAt;

    static Conversation fromJson(const nlohmann::json& j);

    const std::string& id() const { return conversationId; }
    const std::string& name() const { return conversationName; }
    void setName(const std::string& name) { conversationName = name; }

    bool isActive() const { return status == "active"; }

    std::string shortLabel() const;
    std::string longLabel() const;
};

}
}
