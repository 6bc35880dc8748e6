#include "api/http_api_client.h"
#include "utils/logger.h"
#include "utils/utils.h"

#include <utility>

namespace avatarcli {
namespace api {

using nlohmann::json;
using utils::Formatter;

namespace {

std::string failureText(const Error& error, const std::string& action) {
    if (error.code == ErrorCode::HTTP_ERROR) return error.message;
    return "Error " + action + ": " + describeError(error);
}

void logFailure(const std::string& message) {
    utils::Logger::log(utils::LogLevel::WARN, "api", message);
}

template<typename T>
ApiResult<std::vector<T>> decodeList(const Result<json>& res, const std::string& noun, const std::string& action) {
    ApiResult<std::vector<T>> out;
    if (!res.ok()) {
        out.message = failureText(res.error(), action);
        logFailure(out.message);
        return out;
    }
    const json& body = res.value();
    if (body.is_object()) {
        auto data = body.find("data");
        if (data != body.end() && !data->is_null()) {
            if (!data->is_array()) {
                out.message = "Error " + action + ": field 'data' is not a list";
                logFailure(out.message);
                return out;
            }
            for (const auto& item : *data) out.data.push_back(T::fromJson(item));
        }
    }
    out.ok = true;
    out.message = "Successfully fetched " + std::to_string(out.data.size()) + " " + noun + "(s)";
    utils::Logger::log(utils::LogLevel::INFO, "api", out.message);
    return out;
}

template<typename T>
ApiResult<std::optional<T>> decodeOne(const Result<json>& res, const std::string& success, const std::string& action) {
    ApiResult<std::optional<T>> out;
    if (!res.ok()) {
        out.message = failureText(res.error(), action);
        logFailure(out.message);
        return out;
    }
    if (res.value().is_object()) out.data = T::fromJson(res.value());
    out.ok = true;
    out.message = success;
    return out;
}

ApiStatus decodeStatus(const Result<json>& res, const std::string& success, const std::string& action) {
    ApiStatus out;
    if (!res.ok()) {
        out.message = failureText(res.error(), action);
        logFailure(out.message);
        return out;
    }
    out.ok = true;
    out.message = success;
    utils::Logger::log(utils::LogLevel::INFO, "api", success);
    return out;
}

std::string idPath(const std::string& collection, const std::string& id) {
    return "/" + collection + "/" + Formatter::urlEncode(id);
}

}

HttpApiClient::HttpApiClient(std::string apiKey, std::string baseUrl, std::shared_ptr<web::HttpTransport> transport)
    : apiKey_(std::move(apiKey)), baseUrl_(std::move(baseUrl)), transport_(std::move(transport)) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

Result<json> HttpApiClient::call(const std::string& method, const std::string& path, const json* body) {
    if (!transport_) {
        return makeError(ErrorCode::INVALID_STATE, "no HTTP transport");
    }

    web::HttpRequest request;
    request.method = method;
    request.url = baseUrl_ + path;
    request.headers.emplace_back("x-api-key", apiKey_);
    if (body) request.body = body->dump();

    auto sent = transport_->send(request);
    if (!sent.ok()) return sent.error();

    const web::HttpResponse& response = sent.value();
    if (!response.success()) {
        return makeError(ErrorCode::HTTP_ERROR,
                         "Error: HTTP " + std::to_string(response.status) + " - " + response.body);
    }
    if (Formatter::isBlank(response.body)) return json();

    json parsed = json::parse(response.body, nullptr, false);
    if (parsed.is_discarded()) {
        return makeError(ErrorCode::PARSE_ERROR, "invalid JSON in response", method + " " + path);
    }
    return parsed;
}

ApiResult<std::vector<model::Replica>> HttpApiClient::listReplicas(const ReplicaFilter& filter) {
    std::string path = "/replicas?verbose=true";
    if (!filter.replicaType.empty()) path += "&replica_type=" + Formatter::urlEncode(filter.replicaType);
    if (filter.limit > 0) path += "&limit=" + std::to_string(filter.limit);
    return decodeList<model::Replica>(call("GET", path), "replica", "fetching replicas");
}

ApiResult<std::optional<model::Replica>> HttpApiClient::getReplica(const std::string& id) {
    return decodeOne<model::Replica>(call("GET", idPath("replicas", id) + "?verbose=true"),
                                     "Successfully fetched replica", "fetching replica");
}

ApiResult<std::optional<model::Replica>> HttpApiClient::createReplica(const NewReplica& fields) {
    json body = {
        {"replica_name", fields.name},
        {"train_video_url", fields.trainVideoUrl},
    };
    if (!fields.consentVideoUrl.empty()) body["consent_video_url"] = fields.consentVideoUrl;
    return decodeOne<model::Replica>(call("POST", "/replicas", &body),
                                     "Successfully created replica", "creating replica");
}

ApiStatus HttpApiClient::deleteReplica(const std::string& id) {
    return decodeStatus(call("DELETE", idPath("replicas", id)), "Successfully deleted replica", "deleting replica");
}

ApiStatus HttpApiClient::renameReplica(const std::string& id, const std::string& name) {
    json body = {{"replica_name", name}};
    return decodeStatus(call("PATCH", idPath("replicas", id) + "/name", &body),
                        "Successfully renamed replica", "renaming replica");
}

ApiResult<std::vector<model::Persona>> HttpApiClient::listPersonas(const PersonaFilter& filter) {
    std::string path = "/personas";
    if (!filter.personaType.empty()) path += "?persona_type=" + Formatter::urlEncode(filter.personaType);
    return decodeList<model::Persona>(call("GET", path), "persona", "fetching personas");
}

ApiResult<std::optional<model::Persona>> HttpApiClient::getPersona(const std::string& id) {
    return decodeOne<model::Persona>(call("GET", idPath("personas", id)),
                                     "Successfully fetched persona", "fetching persona");
}

ApiResult<std::optional<model::Persona>> HttpApiClient::createPersona(const NewPersona& fields) {
    json body = {
        {"persona_name", fields.name},
        {"system_prompt", fields.systemPrompt},
    };
    if (!fields.context.empty()) body["context"] = fields.context;
    if (!fields.defaultReplicaId.empty()) body["default_replica_id"] = fields.defaultReplicaId;
    return decodeOne<model::Persona>(call("POST", "/personas", &body),
                                     "Successfully created persona", "creating persona");
}

ApiStatus HttpApiClient::deletePersona(const std::string& id) {
    return decodeStatus(call("DELETE", idPath("personas", id)), "Successfully deleted persona", "deleting persona");
}

ApiStatus HttpApiClient::renamePersona(const std::string& id, const std::string& name) {
    json patch = json::array({
        {{"op", "replace"}, {"path", "/persona_name"}, {"value", name}},
    });
    return decodeStatus(call("PATCH", idPath("personas", id), &patch),
                        "Successfully renamed persona", "renaming persona");
}

ApiResult<std::vector<model::Video>> HttpApiClient::listVideos() {
    return decodeList<model::Video>(call("GET", "/videos"), "video", "fetching videos");
}

ApiResult<std::optional<model::Video>> HttpApiClient::getVideo(const std::string& id) {
    return decodeOne<model::Video>(call("GET", idPath("videos", id)), "Successfully fetched video", "fetching video");
}

ApiResult<std::optional<model::Video>> HttpApiClient::createVideo(const NewVideo& fields) {
    json body = {
        {"replica_id", fields.replicaId},
        {"script", fields.script},
    };
    if (!fields.name.empty()) body["video_name"] = fields.name;
    return decodeOne<model::Video>(call("POST", "/videos", &body), "Successfully created video", "creating video");
}

ApiStatus HttpApiClient::deleteVideo(const std::string& id) {
    return decodeStatus(call("DELETE", idPath("videos", id)), "Successfully deleted video", "deleting video");
}

ApiStatus HttpApiClient::renameVideo(const std::string& id, const std::string& name) {
    json body = {{"video_name", name}};
    return decodeStatus(call("PATCH", idPath("videos", id) + "/name", &body),
                        "Successfully renamed video", "renaming video");
}

ApiResult<std::vector<model::Conversation>> HttpApiClient::listConversations() {
    return decodeList<model::Conversation>(call("GET", "/conversations"), "conversation", "fetching conversations");
}

ApiResult<std::optional<model::Conversation>> HttpApiClient::getConversation(const std::string& id) {
    return decodeOne<model::Conversation>(call("GET", idPath("conversations", id)),
                                          "Successfully fetched conversation", "fetching conversation");
}

ApiResult<std::optional<model::Conversation>> HttpApiClient::createConversation(const NewConversation& fields) {
    json body = json::object();
    if (!fields.name.empty()) body["conversation_name"] = fields.name;
    if (!fields.replicaId.empty()) body["replica_id"] = fields.replicaId;
    if (!fields.personaId.empty()) body["persona_id"] = fields.personaId;
    return decodeOne<model::Conversation>(call("POST", "/conversations", &body),
                                          "Successfully created conversation", "creating conversation");
}

ApiStatus HttpApiClient::endConversation(const std::string& id) {
    return decodeStatus(call("POST", idPath("conversations", id) + "/end"),
                        "Successfully ended conversation", "ending conversation");
}

ApiStatus HttpApiClient::deleteConversation(const std::string& id) {
    return decodeStatus(call("DELETE", idPath("conversations", id)),
                        "Successfully deleted conversation", "deleting conversation");
}

std::shared_ptr<ApiClient> createHttpClient(const std::string& apiKey, const std::string& baseUrl,
                                            uint32_t timeoutSeconds) {
    web::CurlOptions options;
    options.timeoutSeconds = timeoutSeconds;
    return std::make_shared<HttpApiClient>(apiKey, baseUrl, std::make_shared<web::CurlTransport>(options));
}

}
}
