#pragma once

#include "model/conversation.h"
#include "model/persona.h"
#include "model/replica.h"
#include "model/video.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace avatarcli {
namespace api {

template<typename T>
struct ApiResult {
    bool ok = false;
    std::string message;
    T data{};
};

struct ApiStatus {
    bool ok = false;
    std::string message;
};

struct ReplicaFilter {
    std::string replicaType;
    int limit = 0;
};

struct PersonaFilter {
    std::string personaType;
};

struct NewReplica {
    std::string name;
    std::string trainVideoUrl;
    std::string consentVideoUrl;
};

struct NewPersona {
    std::string name;
    std::string systemPrompt;
    std::string context;
    std::string defaultReplicaId;
};

struct NewVideo {
    std::string name;
    std::string replicaId;
    std::string script;
};

struct NewConversation {
    std::string name;
    std::string replicaId;
    std::string personaId;
};

// Remote service contract. Calls are synchronous and never throw; every
// failure comes back as ok == false with a one-line message.
class ApiClient {
public:
    virtual ~ApiClient() = default;

    virtual ApiResult<std::vector<model::Replica>> listReplicas(const ReplicaFilter& filter = ReplicaFilter()) = 0;
    virtual ApiResult<std::optional<model::Replica>> getReplica(const std::string& id) = 0;
    virtual ApiResult<std::optional<model::Replica>> createReplica(const NewReplica& fields) = 0;
    virtual ApiStatus deleteReplica(const std::string& id) = 0;
    virtual ApiStatus renameReplica(const std::string& id, const std::string& name) = 0;

    virtual ApiResult<std::vector<model::Persona>> listPersonas(const PersonaFilter& filter = PersonaFilter()) = 0;
    virtual ApiResult<std::optional<model::Persona>> getPersona(const std::string& id) = 0;
    virtual ApiResult<std::optional<model::Persona>> createPersona(const NewPersona& fields) = 0;
    virtual ApiStatus deletePersona(const std::string& id) = 0;
    virtual ApiStatus renamePersona(const std::string& id, const std::string& name) = 0;

    virtual ApiResult<std::vector<model::Video>> listVideos() = 0;
    virtual ApiResult<std::optional<model::Video>> getVideo(const std::string& id) = 0;
    virtual ApiResult<std::optional<model::Video>> createVideo(const NewVideo& fields) = 0;
    virtual ApiStatus deleteVideo(const std::string& id) = 0;
    virtual ApiStatus renameVideo(const std::string& id, const std::string& name) = 0;

    virtual ApiResult<std::vector<model::Conversation>> listConversations() = 0;
    virtual ApiResult<std::optional<model::Conversation>> getConversation(const std::string& id) = 0;
    virtual ApiResult<std::optional<model::Conversation>> createConversation(const NewConversation& fields) = 0;
    virtual ApiStatus endConversation(const std::string& id) = 0;
    virtual ApiStatus deleteConversation(const std::string& id) = 0;
};

using ApiClientFactory = std::function<std::shared_ptr<ApiClient>(const std::string& apiKey)>;

// Client over the curl transport.
std::shared_ptr<ApiClient> createHttpClient(const std::string& apiKey, const std::string& baseUrl,
                                            uint32_t timeoutSeconds);

}
}
