#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kasa {
namespace device {

class Device;
class Module;

using ModuleFactory = std::function<std::shared_ptr<Module>(Device&)>;

struct ModuleRegistration {
    std::string name;
    std::string required_component;  // empty = always created
    ModuleFactory factory;
};

/**
 * @brief Component name -> module constructor table handed to a device
 *
 * Registration order is preserved and becomes the order of the device's
 * modules, their post-update hooks and their features.
 */
class ModuleCatalog {
public:
    void add(const std::string& name, const std::string& required_component, ModuleFactory factory);

    template <typename T>
    void add(const std::string& name, const std::string& required_component = "") {
        add(name, required_component, [name, required_component](Device& device) -> std::shared_ptr<Module> {
            return std::make_shared<T>(device, name, required_component);
        });
    }

    const std::vector<ModuleRegistration>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<ModuleRegistration> entries_;
};

}  // namespace device
}  // namespace kasa
