#include "model/conversation.h"
#include "model/json_fields.h"

#include <sstream>

namespace avatarcli {
namespace model {

Conversation Conversation::fromJson(const nlohmann::json& j) {
    Conversation c;
    c.conversationId = stringField(j, "conversation_id");
    c.conversationName = stringField(j, "conversation_name");
    c.conversationUrl = stringField(j, "conversation_url");
    c.callbackUrl = stringField(j, "callback_url");
    c.status = stringField(j, "status");
    c.replicaId = stringField(j, "replica_id");
    c.personaId = stringField(j, "persona_id");
    c.createdAt = stringField(j, "created_at");
    c.updatedAt = stringField(j, "updated_at");
    return c;
}

std::string Conversation::shortLabel() const {
    return conversationName + " (" + conversationId + ") - " + status;
}

std::string Conversation::longLabel() const {
    std::ostringstream out;
    out << "Conversation Details:\n";
    out << "  ID: " << conversationId << "\n";
    out << "  Name: " << conversationName << "\n";
    out << "  URL: " << conversationUrl << "\n";
    out << "  Status: " << status << "\n";
    out << "  Replica ID: " << replicaId << "\n";
    out << "  Persona ID: " << personaId << "\n";
    out << "  Created: " << createdAt << "\n";
    out << "  Updated: " << updatedAt;
    if (!callbackUrl.empty()) out << "\n  Callback URL: " << callbackUrl;
    return out.str();
}

}
}
