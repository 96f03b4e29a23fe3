#include "module_catalog.hpp"

#include "logging/logger.hpp"

namespace kasa {
namespace device {

void ModuleCatalog::add(const std::string& name, const std::string& required_component, ModuleFactory factory) {
    for (auto& entry : entries_) {
        if (entry.name == name) {
            LOG_WARN("[ModuleCatalog] Replacing module registration: " << name);
            entry.required_component = required_component;
            entry.factory = std::move(factory);
            return;
        }
    }
    entries_.push_back(ModuleRegistration{name, required_component, std::move(factory)});
}

}  // namespace device
}  // namespace kasa
