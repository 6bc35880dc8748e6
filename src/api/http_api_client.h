#pragma once

#include "api/api_client.h"
#include "infrastructure/error_handling.h"
#include "web/http_request.h"

#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace avatarcli {
namespace api {

class HttpApiClient : public ApiClient {
public:
    HttpApiClient(std::string apiKey, std::string baseUrl, std::shared_ptr<web::HttpTransport> transport);

    ApiResult<std::vector<model::Replica>> listReplicas(const ReplicaFilter& filter) override;
    ApiResult<std::optional<model::Replica>> getReplica(const std::string& id) override;
    ApiResult<std::optional<model::Replica>> createReplica(const NewReplica& fields) override;
    ApiStatus deleteReplica(const std::string& id) override;
    ApiStatus renameReplica(const std::string& id, const std::string& name) override;

    ApiResult<std::vector<model::Persona>> listPersonas(const PersonaFilter& filter) override;
    ApiResult<std::optional<model::Persona>> getPersona(const std::string& id) override;
    ApiResult<std::optional<model::Persona>> createPersona(const NewPersona& fields) override;
    ApiStatus deletePersona(const std::string& id) override;
    ApiStatus renamePersona(const std::string& id, const std::string& name) override;

    ApiResult<std::vector<model::Video>> listVideos() override;
    ApiResult<std::optional<model::Video>> getVideo(const std::string& id) override;
    ApiResult<std::optional<model::Video>> createVideo(const NewVideo& fields) override;
    ApiStatus deleteVideo(const std::string& id) override;
    ApiStatus renameVideo(const std::string& id, const std::string& name) override;

    ApiResult<std::vector<model::Conversation>> listConversations() override;
    ApiResult<std::optional<model::Conversation>> getConversation(const std::string& id) override;
    ApiResult<std::optional<model::Conversation>> createConversation(const NewConversation& fields) override;
    ApiStatus endConversation(const std::string& id) override;
    ApiStatus deleteConversation(const std::string& id) override;

    const std::string& baseUrl() const { return baseUrl_; }

private:
    // Non-2xx becomes HTTP_ERROR "Error: HTTP <code> - <body>"; an empty body
    // decodes to null.
    Result<nlohmann::json> call(const std::string& method, const std::string& path,
                                const nlohmann::json* body = nullptr);

    std::string apiKey_;
    std::string baseUrl_;
    std::shared_ptr<web::HttpTransport> transport_;
};

}
}
