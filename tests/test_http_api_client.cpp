#include <gtest/gtest.h>
#include "api/http_api_client.h"
#include "web/http_request.h"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>

using namespace avatarcli;
using namespace avatarcli::api;
using nlohmann::json;

class RecordingTransport : public web::HttpTransport {
public:
    Result<web::HttpResponse> send(const web::HttpRequest& request) override {
        requests.push_back(request);
        if (replies.empty()) {
            return makeError(ErrorCode::NETWORK_ERROR, "no scripted reply");
        }
        Result<web::HttpResponse> next = replies.front();
        replies.pop_front();
        return next;
    }

    void reply(int status, const std::string& body) {
        web::HttpResponse response;
        response.status = status;
        response.body = body;
        replies.push_back(response);
    }

    void fail(ErrorCode code, const std::string& message) {
        replies.push_back(makeError(code, message));
    }

    std::string header(size_t index, const std::string& name) const {
        for (const auto& h : requests.at(index).headers) {
            if (h.first == name) return h.second;
        }
        return "";
    }

    std::deque<Result<web::HttpResponse>> replies;
    std::vector<web::HttpRequest> requests;
};

class HttpApiClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<RecordingTransport>();
        client = std::make_unique<HttpApiClient>("secret-key", "https://api.example.invalid/v2/", transport);
    }

    std::shared_ptr<RecordingTransport> transport;
    std::unique_ptr<HttpApiClient> client;
};

TEST_F(HttpApiClientTest, ListReplicasBuildsQueryAndDecodes) {
    json body = {{"data", json::array({
        {{"replica_id", "r1"}, {"replica_name", "Anna"}, {"replica_type", "user"}, {"status", "completed"}},
        {{"replica_id", "r2"}, {"replica_name", "Stock"}, {"replica_type", "system"}, {"status", "completed"}},
    })}};
    transport->reply(200, body.dump());

    ReplicaFilter filter;
    filter.replicaType = "user";
    filter.limit = 50;
    auto result = client->listReplicas(filter);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.message, "Successfully fetched 2 replica(s)");
    ASSERT_EQ(result.data.size(), 2u);
    EXPECT_EQ(result.data[1].replicaName, "Stock");

    ASSERT_EQ(transport->requests.size(), 1u);
    EXPECT_EQ(transport->requests[0].method, "GET");
    EXPECT_EQ(transport->requests[0].url,
              "https://api.example.invalid/v2/replicas?verbose=true&replica_type=user&limit=50");
    EXPECT_EQ(transport->header(0, "x-api-key"), "secret-key");
    EXPECT_TRUE(transport->requests[0].body.empty());
}

TEST_F(HttpApiClientTest, BaseUrlTrailingSlashStripped) {
    EXPECT_EQ(client->baseUrl(), "https://api.example.invalid/v2");
}

TEST_F(HttpApiClientTest, MissingDataMeansEmptyList) {
    transport->reply(200, "{}");
    auto result = client->listVideos();
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.data.empty());
    EXPECT_EQ(result.message, "Successfully fetched 0 video(s)");
}

TEST_F(HttpApiClientTest, HttpErrorMessageCarriesStatusAndBody) {
    transport->reply(401, "{\"message\":\"Invalid access token\"}");
    auto result = client->listPersonas(PersonaFilter());
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, "Error: HTTP 401 - {\"message\":\"Invalid access token\"}");
    EXPECT_EQ(transport->requests[0].url, "https://api.example.invalid/v2/personas");
}

TEST_F(HttpApiClientTest, TransportFailureIsReported) {
    transport->fail(ErrorCode::TIMEOUT, "request timed out");
    auto status = client->deleteVideo("v1");
    EXPECT_FALSE(status.ok);
    EXPECT_EQ(status.message.rfind("Error deleting video: request timed out", 0), 0u);
}

TEST_F(HttpApiClientTest, InvalidJsonIsParseFailure) {
    transport->reply(200, "<html>oops</html>");
    auto result = client->listConversations();
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message.rfind("Error fetching conversations: invalid JSON", 0), 0u);
}

TEST_F(HttpApiClientTest, NonListDataRejected) {
    transport->reply(200, "{\"data\": {\"replica_id\": \"r1\"}}");
    auto result = client->listReplicas(ReplicaFilter());
    EXPECT_FALSE(result.ok);
}

TEST_F(HttpApiClientTest, RenamePersonaSendsJsonPatch) {
    transport->reply(200, "");
    auto status = client->renamePersona("p 1", "Coach");
    ASSERT_TRUE(status.ok);
    EXPECT_EQ(status.message, "Successfully renamed persona");

    const auto& req = transport->requests[0];
    EXPECT_EQ(req.method, "PATCH");
    EXPECT_EQ(req.url, "https://api.example.invalid/v2/personas/p%201");
    json sent = json::parse(req.body);
    ASSERT_TRUE(sent.is_array());
    EXPECT_EQ(sent[0]["op"], "replace");
    EXPECT_EQ(sent[0]["path"], "/persona_name");
    EXPECT_EQ(sent[0]["value"], "Coach");
}

TEST_F(HttpApiClientTest, RenameReplicaAndVideoUseNameEndpoint) {
    transport->reply(200, "{}");
    transport->reply(204, "");
    EXPECT_TRUE(client->renameReplica("r1", "Anna").ok);
    EXPECT_TRUE(client->renameVideo("v1", "Promo").ok);

    EXPECT_EQ(transport->requests[0].url, "https://api.example.invalid/v2/replicas/r1/name");
    EXPECT_EQ(json::parse(transport->requests[0].body)["replica_name"], "Anna");
    EXPECT_EQ(transport->requests[1].url, "https://api.example.invalid/v2/videos/v1/name");
    EXPECT_EQ(json::parse(transport->requests[1].body)["video_name"], "Promo");
}

TEST_F(HttpApiClientTest, CreateVideoBody) {
    transport->reply(200, "{\"video_id\":\"v9\",\"status\":\"queued\"}");
    NewVideo fields;
    fields.name = "Promo";
    fields.replicaId = "r1";
    fields.script = "Hello";
    auto result = client->createVideo(fields);

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(result.data.has_value());
    EXPECT_EQ(result.data->videoId, "v9");
    json sent = json::parse(transport->requests[0].body);
    EXPECT_EQ(sent["video_name"], "Promo");
    EXPECT_EQ(sent["replica_id"], "r1");
    EXPECT_EQ(sent["script"], "Hello");
    EXPECT_EQ(transport->requests[0].method, "POST");
}

TEST_F(HttpApiClientTest, CreatePersonaOmitsEmptyOptionals) {
    transport->reply(200, "{\"persona_id\":\"p9\"}");
    NewPersona fields;
    fields.name = "Coach";
    fields.systemPrompt = "Be kind";
    auto result = client->createPersona(fields);

    ASSERT_TRUE(result.ok);
    json sent = json::parse(transport->requests[0].body);
    EXPECT_FALSE(sent.contains("context"));
    EXPECT_FALSE(sent.contains("default_replica_id"));
    EXPECT_EQ(sent["system_prompt"], "Be kind");
}

TEST_F(HttpApiClientTest, ConversationLifecycleEndpoints) {
    transport->reply(200, "{\"conversation_id\":\"c1\",\"status\":\"active\"}");
    transport->reply(200, "");
    transport->reply(204, "");

    NewConversation fields;
    fields.personaId = "p1";
    auto created = client->createConversation(fields);
    ASSERT_TRUE(created.ok);
    json sent = json::parse(transport->requests[0].body);
    EXPECT_EQ(sent["persona_id"], "p1");
    EXPECT_FALSE(sent.contains("replica_id"));
    EXPECT_FALSE(sent.contains("conversation_name"));

    auto ended = client->endConversation("c1");
    EXPECT_TRUE(ended.ok);
    EXPECT_EQ(ended.message, "Successfully ended conversation");
    EXPECT_EQ(transport->requests[1].method, "POST");
    EXPECT_EQ(transport->requests[1].url, "https://api.example.invalid/v2/conversations/c1/end");

    auto deleted = client->deleteConversation("c1");
    EXPECT_TRUE(deleted.ok);
    EXPECT_EQ(transport->requests[2].method, "DELETE");
}

TEST_F(HttpApiClientTest, GetWithEmptyBodyHasNoData) {
    transport->reply(200, "");
    auto result = client->getReplica("r1");
    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(result.data.has_value());
    EXPECT_EQ(transport->requests[0].url, "https://api.example.invalid/v2/replicas/r1?verbose=true");
}

TEST(HttpResponseTest, SuccessRange) {
    web::HttpResponse r;
    r.status = 204;
    EXPECT_TRUE(r.success());
    r.status = 302;
    EXPECT_FALSE(r.success());
    r.status = 0;
    EXPECT_FALSE(r.success());
}

TEST(CurlTransportTest, OversizedResponseReportsCap) {
    if (std::system("command -v curl >/dev/null 2>&1") != 0) {
        GTEST_SKIP() << "curl not installed";
    }
    auto stamp = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    auto path = std::filesystem::temp_directory_path() / ("avatarcli_big_" + stamp + ".json");
    {
        std::ofstream out(path, std::ios::binary);
        out << std::string(256 * 1024, 'x');
    }

    web::CurlOptions options;
    options.maxBytes = 1024;
    web::CurlTransport transport(options);
    web::HttpRequest request;
    request.url = "file://" + path.string();
    auto result = transport.send(request);

    std::error_code ec;
    std::filesystem::remove(path, ec);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::PARSE_ERROR);
    EXPECT_EQ(result.error().message, "response exceeded 1024 bytes");
}
