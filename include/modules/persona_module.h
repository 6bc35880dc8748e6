#pragma once

#include "model/persona.h"
#include "model/resource_cache.h"
#include "modules/module_support.h"
#include "modules/replica_picker.h"
#include "nav/module.h"
#include "tui/console.h"

#include <optional>
#include <string>
#include <vector>

namespace avatarcli {
namespace modules {

class PersonaModule : public nav::Module {
public:
    static const char* const WORK_WITH_PERSONAS;
    static const char* const CREATE_PERSONA;
    static const char* const LIST_PERSONAS;
    static const char* const RENAME_PERSONA;
    static const char* const DELETE_PERSONA;

    PersonaModule(tui::Console& console, int itemsPerPage);

    std::string name() const override;
    std::vector<std::string> screens() const override;
    std::vector<nav::MenuEntry> menuEntries() const override;
    std::string execute(const std::string& screen, nav::NavigationContext& context) override;

    // Fetches one persona type ("user" or "system") into the cache.
    bool refresh(api::ApiClient& client, const std::string& personaType = "user");
    const model::ResourceCache<model::Persona>& cache() const { return cache_; }
    const std::string& cachedType() const { return cachedType_; }

    static const std::vector<std::string>& filters();

private:
    std::string workWithPersonas();
    std::string createPersona(nav::NavigationContext& context);
    std::string browse(nav::NavigationContext& context, ItemPolicy policy, bool showFilterToggle);
    std::optional<std::string> renamePersona(const model::Persona& persona, nav::NavigationContext& context);
    std::optional<std::string> deletePersona(const model::Persona& persona, nav::NavigationContext& context);

    tui::Console& console_;
    int itemsPerPage_;
    model::ResourceCache<model::Persona> cache_;
    std::string cachedType_ = "user";
    ReplicaPicker picker_;
};

}
}
