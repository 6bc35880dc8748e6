#pragma once

#include "api/api_client.h"
#include "tui/console.h"

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace avatarcli {
namespace test {

// Console driven by queued answers. Menu answers are option prefixes; a
// nullopt answer cancels. Once the menu queue runs dry the console reports
// closed() and cancels every further menu.
class ScriptedConsole : public tui::Console {
public:
    struct MenuCall {
        std::string title;
        std::vector<std::string> options;
    };

    ScriptedConsole& pick(const std::string& prefix) {
        menuAnswers.push_back(prefix);
        return *this;
    }
    ScriptedConsole& cancel() {
        menuAnswers.push_back(std::nullopt);
        return *this;
    }
    ScriptedConsole& type(const std::string& text) {
        promptAnswers.push_back(text);
        return *this;
    }
    ScriptedConsole& answer(bool yes) {
        confirmAnswers.push_back(yes);
        return *this;
    }

    bool init() override { return true; }
    void shutdown() override {}

    std::optional<std::string> menu(const std::string& title, const std::vector<std::string>& options) override {
        menus.push_back(MenuCall{title, options});
        if (menuAnswers.empty()) {
            exhausted = true;
            return std::nullopt;
        }
        std::optional<std::string> next = menuAnswers.front();
        menuAnswers.pop_front();
        if (!next) return std::nullopt;
        for (const auto& option : options) {
            if (option.compare(0, next->size(), *next) == 0) return option;
        }
        unmatched.push_back(*next);
        return next;
    }

    std::string prompt(const std::string& message) override {
        prompts.push_back(message);
        if (promptAnswers.empty()) return "";
        std::string text = promptAnswers.front();
        promptAnswers.pop_front();
        return text;
    }

    bool confirm(const std::string& message) override {
        confirms.push_back(message);
        if (confirmAnswers.empty()) return false;
        bool yes = confirmAnswers.front();
        confirmAnswers.pop_front();
        return yes;
    }

    void showMessage(const std::string& msg, tui::Color) override { messages.push_back(msg); }
    void showError(const std::string& err) override { errors.push_back(err); }
    void showDetails(const std::string& title, const std::string& text) override {
        details.push_back(title + "\n" + text);
    }
    void waitForKey(const std::string&) override {}
    void beginBusy(const std::string&) override { ++busyDepth; }
    void endBusy() override { --busyDepth; }
    bool closed() const override { return exhausted; }

    const MenuCall& lastMenu() const { return menus.back(); }

    bool sawMessage(const std::string& text) const {
        for (const auto& m : messages) {
            if (m == text) return true;
        }
        return false;
    }

    bool sawError(const std::string& text) const {
        for (const auto& e : errors) {
            if (e == text) return true;
        }
        return false;
    }

    std::deque<std::optional<std::string>> menuAnswers;
    std::deque<std::string> promptAnswers;
    std::deque<bool> confirmAnswers;

    std::vector<MenuCall> menus;
    std::vector<std::string> prompts;
    std::vector<std::string> confirms;
    std::vector<std::string> messages;
    std::vector<std::string> errors;
    std::vector<std::string> details;
    std::vector<std::string> unmatched;
    int busyDepth = 0;
    bool exhausted = false;
};

inline model::Replica makeReplica(const std::string& id, const std::string& name, const std::string& type,
                                  const std::string& status = "completed") {
    model::Replica r;
    r.replicaId = id;
    r.replicaName = name;
    r.replicaType = type;
    r.status = status;
    return r;
}

inline model::Persona makePersona(const std::string& id, const std::string& name,
                                  const std::string& defaultReplica = "") {
    model::Persona p;
    p.personaId = id;
    p.personaName = name;
    p.defaultReplicaId = defaultReplica;
    p.systemPrompt = "You are helpful.";
    return p;
}

inline model::Video makeVideo(const std::string& id, const std::string& name, const std::string& status = "ready") {
    model::Video v;
    v.videoId = id;
    v.videoName = name;
    v.status = status;
    return v;
}

inline model::Conversation makeConversation(const std::string& id, const std::string& name,
                                            const std::string& status = "active") {
    model::Conversation c;
    c.conversationId = id;
    c.conversationName = name;
    c.status = status;
    return c;
}

// In-memory service. Failures are switched on per operation kind.
class FakeApiClient : public api::ApiClient {
public:
    api::ApiResult<std::vector<model::Replica>> listReplicas(const api::ReplicaFilter& filter) override {
        ++replicaListCalls;
        lastReplicaFilter = filter;
        if (failLists) return listFailure<model::Replica>();
        return listOk(replicas, "replica");
    }
    api::ApiResult<std::optional<model::Replica>> getReplica(const std::string& id) override {
        return getOne(replicas, id);
    }
    api::ApiResult<std::optional<model::Replica>> createReplica(const api::NewReplica& fields) override {
        createdReplica = fields;
        api::ApiResult<std::optional<model::Replica>> out;
        if (failCreate) {
            out.message = failureMessage;
            return out;
        }
        model::Replica r = makeReplica("r-new", fields.name, "user", "training");
        replicas.push_back(r);
        out.ok = true;
        out.message = "Successfully created replica";
        out.data = r;
        return out;
    }
    api::ApiStatus deleteReplica(const std::string& id) override { return removeOne(replicas, id); }
    api::ApiStatus renameReplica(const std::string& id, const std::string& name) override {
        return renameOne(replicas, id, name);
    }

    api::ApiResult<std::vector<model::Persona>> listPersonas(const api::PersonaFilter& filter) override {
        ++personaListCalls;
        lastPersonaFilter = filter;
        if (failLists) return listFailure<model::Persona>();
        return listOk(personas, "persona");
    }
    api::ApiResult<std::optional<model::Persona>> getPersona(const std::string& id) override {
        return getOne(personas, id);
    }
    api::ApiResult<std::optional<model::Persona>> createPersona(const api::NewPersona& fields) override {
        createdPersona = fields;
        api::ApiResult<std::optional<model::Persona>> out;
        if (failCreate) {
            out.message = failureMessage;
            return out;
        }
        model::Persona p = makePersona("p-new", fields.name, fields.defaultReplicaId);
        p.systemPrompt = fields.systemPrompt;
        p.context = fields.context;
        personas.push_back(p);
        out.ok = true;
        out.message = "Successfully created persona";
        out.data = p;
        return out;
    }
    api::ApiStatus deletePersona(const std::string& id) override { return removeOne(personas, id); }
    api::ApiStatus renamePersona(const std::string& id, const std::string& name) override {
        return renameOne(personas, id, name);
    }

    api::ApiResult<std::vector<model::Video>> listVideos() override {
        ++videoListCalls;
        if (failLists) return listFailure<model::Video>();
        return listOk(videos, "video");
    }
    api::ApiResult<std::optional<model::Video>> getVideo(const std::string& id) override {
        return getOne(videos, id);
    }
    api::ApiResult<std::optional<model::Video>> createVideo(const api::NewVideo& fields) override {
        createdVideo = fields;
        api::ApiResult<std::optional<model::Video>> out;
        if (failCreate) {
            out.message = failureMessage;
            return out;
        }
        model::Video v = makeVideo("v-new", fields.name, "queued");
        videos.push_back(v);
        out.ok = true;
        out.message = "Successfully created video";
        out.data = v;
        return out;
    }
    api::ApiStatus deleteVideo(const std::string& id) override { return removeOne(videos, id); }
    api::ApiStatus renameVideo(const std::string& id, const std::string& name) override {
        return renameOne(videos, id, name);
    }

    api::ApiResult<std::vector<model::Conversation>> listConversations() override {
        ++conversationListCalls;
        if (failLists) return listFailure<model::Conversation>();
        return listOk(conversations, "conversation");
    }
    api::ApiResult<std::optional<model::Conversation>> getConversation(const std::string& id) override {
        return getOne(conversations, id);
    }
    api::ApiResult<std::optional<model::Conversation>> createConversation(const api::NewConversation& fields) override {
        createdConversation = fields;
        api::ApiResult<std::optional<model::Conversation>> out;
        if (failCreate) {
            out.message = failureMessage;
            return out;
        }
        model::Conversation c = makeConversation("c-new", fields.name.empty() ? "New Conversation" : fields.name);
        c.replicaId = fields.replicaId;
        c.personaId = fields.personaId;
        c.conversationUrl = "https://example.invalid/c-new";
        conversations.push_back(c);
        out.ok = true;
        out.message = "Successfully created conversation";
        out.data = c;
        return out;
    }
    api::ApiStatus endConversation(const std::string& id) override {
        endedIds.push_back(id);
        api::ApiStatus out;
        if (failMutations) {
            out.message = failureMessage;
            return out;
        }
        out.ok = true;
        out.message = "Successfully ended conversation";
        return out;
    }
    api::ApiStatus deleteConversation(const std::string& id) override { return removeOne(conversations, id); }

    std::vector<model::Replica> replicas;
    std::vector<model::Persona> personas;
    std::vector<model::Video> videos;
    std::vector<model::Conversation> conversations;

    bool failLists = false;
    bool failMutations = false;
    bool failCreate = false;
    std::string failureMessage = "Error: HTTP 500 - boom";

    int replicaListCalls = 0;
    int personaListCalls = 0;
    int videoListCalls = 0;
    int conversationListCalls = 0;
    api::ReplicaFilter lastReplicaFilter;
    api::PersonaFilter lastPersonaFilter;
    std::vector<std::string> deletedIds;
    std::vector<std::string> endedIds;
    std::vector<std::pair<std::string, std::string>> renames;
    api::NewReplica createdReplica;
    api::NewPersona createdPersona;
    api::NewVideo createdVideo;
    api::NewConversation createdConversation;

private:
    template<typename T>
    api::ApiResult<std::vector<T>> listFailure() {
        api::ApiResult<std::vector<T>> out;
        out.message = failureMessage;
        return out;
    }

    template<typename T>
    api::ApiResult<std::vector<T>> listOk(const std::vector<T>& items, const std::string& noun) {
        api::ApiResult<std::vector<T>> out;
        out.ok = true;
        out.data = items;
        out.message = "Successfully fetched " + std::to_string(items.size()) + " " + noun + "(s)";
        return out;
    }

    template<typename T>
    api::ApiResult<std::optional<T>> getOne(const std::vector<T>& items, const std::string& id) {
        api::ApiResult<std::optional<T>> out;
        for (const auto& item : items) {
            if (item.id() == id) {
                out.ok = true;
                out.data = item;
                return out;
            }
        }
        out.message = "Error: HTTP 404 - not found";
        return out;
    }

    template<typename T>
    api::ApiStatus removeOne(std::vector<T>& items, const std::string& id) {
        deletedIds.push_back(id);
        api::ApiStatus out;
        if (failMutations) {
            out.message = failureMessage;
            return out;
        }
        for (auto it = items.begin(); it != items.end(); ++it) {
            if (it->id() == id) {
                items.erase(it);
                break;
            }
        }
        out.ok = true;
        out.message = "Successfully deleted";
        return out;
    }

    template<typename T>
    api::ApiStatus renameOne(std::vector<T>& items, const std::string& id, const std::string& name) {
        renames.emplace_back(id, name);
        api::ApiStatus out;
        if (failMutations) {
            out.message = failureMessage;
            return out;
        }
        for (auto& item : items) {
            if (item.id() == id) item.setName(name);
        }
        out.ok = true;
        out.message = "Successfully renamed";
        return out;
    }
};

}
}
