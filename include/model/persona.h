#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace avatarcli {
namespace model {

struct Persona {
    std::string personaId;
    std::string personaName;
    std::string defaultReplicaId;
    std::string createdAt;
    std::string updatedAt;
    std::string systemPrompt;
    std::string context;
    nlohmann::json layers = nlohmann::json::object();

    static Persona fromJson(const nlohmann::json& j);

    const std::string& id() const { return personaId; }
    const std::string& name() const { return personaName; }
    void setName(const std::string& name) { personaName = name; }

    bool hasDefaultReplica() const;
    // Null when the layer is not configured.
    nlohmann::json layer(const std::string& name) const;

    std::string systemPromptPreview(size_t maxLen = 100) const;
    std::string contextPreview(size_t maxLen = 100) const;

    std::string shortLabel() const;
    std::string longLabel() const;
};

}
}
