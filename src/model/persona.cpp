#include "model/persona.h"
#include "model/json_fields.h"
#include "utils/utils.h"

#include <sstream>

namespace avatarcli {
namespace model {

Persona Persona::fromJson(const nlohmann::json& j) {
    Persona p;
    p.personaId = stringField(j, "persona_id");
    p.personaName = stringField(j, "persona_name");
    p.defaultReplicaId = stringField(j, "default_replica_id");
    p.createdAt = stringField(j, "created_at");
    p.updatedAt = stringField(j, "updated_at");
    p.systemPrompt = stringField(j, "system_prompt");
    p.context = stringField(j, "context");
    p.layers = objectField(j, "layers");
    return p;
}

bool Persona::hasDefaultReplica() const {
    return !utils::Formatter::isBlank(defaultReplicaId);
}

nlohmann::json Persona::layer(const std::string& name) const {
    auto it = layers.find(name);
    if (it == layers.end()) return nullptr;
    return *it;
}

std::string Persona::systemPromptPreview(size_t maxLen) const {
    return utils::Formatter::preview(systemPrompt, maxLen, "No system prompt");
}

std::string Persona::contextPreview(size_t maxLen) const {
    return utils::Formatter::preview(context, maxLen, "No context");
}

std::string Persona::shortLabel() const {
    std::ostringstream out;
    out << (hasDefaultReplica() ? "[+]" : "[-]") << " " << personaName << " (" << personaId
        << ") - Default Replica: " << (defaultReplicaId.empty() ? "None" : defaultReplicaId);
    return out.str();
}

std::string Persona::longLabel() const {
    std::ostringstream out;
    out << "Persona Details:\n";
    out << "  ID: " << personaId << "\n";
    out << "  Name: " << personaName << "\n";
    out << "  Default Replica ID: " << (defaultReplicaId.empty() ? "None" : defaultReplicaId) << "\n";
    if (auto created = utils::Formatter::formatIsoTimestamp(createdAt)) {
        out << "  Created Date: " << *created << "\n";
    }
    if (auto updated = utils::Formatter::formatIsoTimestamp(updatedAt)) {
        out << "  Updated Date: " << *updated << "\n";
    }
    out << "  System Prompt: " << systemPromptPreview(1000) << "\n";
    out << "  Context: " << contextPreview(1000) << "\n";
    if (layers.empty()) {
        out << "  Layers: None configured";
        return out.str();
    }
    out << "  Layers: " << layers.size() << " configured";
    for (auto it = layers.begin(); it != layers.end(); ++it) {
        out << "\n    - " << it.key() << ":";
        if (it->is_object()) {
            for (auto field = it->begin(); field != it->end(); ++field) {
                out << "\n      " << field.key() << ": " << valueText(*field);
            }
        } else {
            out << "\n      " << valueText(*it);
        }
    }
    return out.str();
}

}
}
