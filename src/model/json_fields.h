#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace avatarcli {
namespace model {

// Missing or null fields decode to "", non-string scalars to their JSON text.
inline std::string stringField(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return {};
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

inline nlohmann::json objectField(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return nlohmann::json::object();
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return nlohmann::json::object();
    return *it;
}

inline std::string valueText(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return "None";
    return v.dump();
}

}
}
