#include "model/conversation.h"
#include "model/persona.h"
#include "model/replica.h"
#include "model/video.h"
#include "nav/pagination.h"
#include "utils/utils.h"

#include <nlohmann/json.hpp>
#include <cassert>
#include <string>

using namespace avatarcli;
using nlohmann::json;

static void testReplicaFromJson() {
    json j = {
        {"replica_id", "r83e"},
        {"replica_name", "Anna"},
        {"replica_type", "user"},
        {"status", "training"},
        {"training_progress", "30/120"},
        {"created_at", "2024-05-01T12:30:00.123Z"},
        {"updated_at", nullptr},
        {"thumbnail_video_url", "https://cdn.example.invalid/anna.mp4"},
    };
    auto r = model::Replica::fromJson(j);
    assert(r.id() == "r83e");
    assert(r.isUser() && !r.isSystem());
    assert(r.isTraining() && !r.isCompleted());
    assert(r.updatedAt.empty());
    assert(r.trainingPercentage() == 25);
    assert(r.shortLabel() == "[..] Anna (r83e) - training - 30/120");

    std::string details = r.longLabel();
    assert(details.find("Created Date: 2024-05-01 12:30:00") != std::string::npos);
    assert(details.find("Updated Date") == std::string::npos);
    assert(details.find("Thumbnail URL: https://cdn.example.invalid/anna.mp4") != std::string::npos);
    assert(details.find("Training Percentage: 25%") != std::string::npos);
}

static void testTrainingPercentageFallbacks() {
    model::Replica r;
    r.trainingProgress = "";
    assert(r.trainingPercentage() == 0);
    r.trainingProgress = "5/0";
    assert(r.trainingPercentage() == 0);
    r.trainingProgress = "abc/10";
    assert(r.trainingPercentage() == 0);
    r.trainingProgress = "10/10";
    assert(r.trainingPercentage() == 100);

    r.status = "error";
    r.replicaName = "Broken";
    r.replicaId = "r1";
    assert(r.shortLabel().compare(0, 4, "[x] ") == 0);
}

static void testPersonaLayers() {
    json j = {
        {"persona_id", "p5"},
        {"persona_name", "Coach"},
        {"system_prompt", std::string(150, 'a')},
        {"layers", {{"llm", {{"model", "tavus-llama"}, {"speculative_inference", true}}}, {"tts", nullptr}}},
    };
    auto p = model::Persona::fromJson(j);
    assert(!p.hasDefaultReplica());
    assert(p.shortLabel() == "[-] Coach (p5) - Default Replica: None");
    assert(p.layer("llm")["model"] == "tavus-llama");
    assert(p.layer("stt").is_null());
    assert(p.systemPromptPreview().size() == 103);
    assert(p.contextPreview() == "No context");

    std::string details = p.longLabel();
    assert(details.find("Layers: 2 configured") != std::string::npos);
    assert(details.find("model: tavus-llama") != std::string::npos);
    assert(details.find("speculative_inference: true") != std::string::npos);

    model::Persona bare;
    bare.personaId = "p6";
    bare.personaName = "Plain";
    bare.defaultReplicaId = "r1";
    assert(bare.shortLabel() == "[+] Plain (p6) - Default Replica: r1");
    assert(bare.longLabel().find("Layers: None configured") != std::string::npos);
}

static void testVideoScript() {
    json j = {
        {"video_id", "v9"},
        {"video_name", "Promo"},
        {"status", "queued"},
        {"data", {{"script", "Hello there"}, {"background_url", "https://example.invalid/bg"}}},
    };
    auto v = model::Video::fromJson(j);
    assert(v.isQueued());
    assert(v.script() == "Hello there");
    assert(v.shortLabel() == "[~] Promo (v9) - queued");
    std::string details = v.longLabel();
    assert(details.find("Script: Hello there") != std::string::npos);
    assert(details.find("background_url: https://example.invalid/bg") != std::string::npos);

    model::Video empty;
    assert(empty.scriptPreview() == "No script");
    assert(empty.longLabel().find("Data: None") != std::string::npos);
}

static void testConversationLabels() {
    json j = {
        {"conversation_id", "c1"},
        {"conversation_name", "Standup"},
        {"conversation_url", "https://meet.example.invalid/c1"},
        {"status", "active"},
        {"replica_id", 42},
    };
    auto c = model::Conversation::fromJson(j);
    assert(c.isActive());
    assert(c.replicaId == "42");
    assert(c.shortLabel() == "Standup (c1) - active");
    assert(c.longLabel().find("URL: https://meet.example.invalid/c1") != std::string::npos);
}

static void testListItemAdapter() {
    model::Conversation c;
    c.conversationId = "c7";
    c.conversationName = "Sync";
    c.status = "ended";
    nav::ListItem item = nav::toListItem(c);
    assert(item.id == "c7");
    assert(item.shortLabel == "Sync (c7) - ended");
    assert(item.longLabel == c.longLabel());
}

static void testFormatterHelpers() {
    using utils::Formatter;
    assert(Formatter::formatIsoTimestamp("2024-01-02T03:04:05Z") == std::string("2024-01-02 03:04:05"));
    assert(!Formatter::formatIsoTimestamp("yesterday"));
    assert(Formatter::maskSecret("") == "not set");
    assert(Formatter::maskSecret("short") == "****");
    assert(Formatter::maskSecret("0123456789abcdef") == "0123...cdef");
    assert(Formatter::urlEncode("a b/c") == "a%20b%2Fc");
}

int main() {
    testReplicaFromJson();
    testTrainingPercentageFallbacks();
    testPersonaLayers();
    testVideoScript();
    testConversationLabels();
    testListItemAdapter();
    testFormatterHelpers();
    return 0;
}
