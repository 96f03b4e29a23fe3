#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "common/status.hpp"

namespace kasa {
namespace device {

class Device;
class Module;

enum class FeatureType { SENSOR, BINARY_SENSOR, SWITCH, NUMBER, CHOICE, ACTION, UNKNOWN };

enum class FeatureCategory { PRIMARY, INFO, CONFIG, DEBUG, UNSET };

const char* feature_type_to_string(FeatureType type);
const char* feature_category_to_string(FeatureCategory category);

using FeatureValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

std::string feature_value_to_string(const FeatureValue& value);

// Value read through a feature; value is empty when status is not OK
struct FeatureReading {
    Status status;
    FeatureValue value;

    bool ok() const { return status.ok(); }
};

using FeatureGetter = std::function<FeatureValue(const Module&)>;
using FeatureSetter = std::function<Status(Module&, const FeatureValue&)>;

// Everything a module declares about one of its features
struct FeatureDescriptor {
    std::string id;  // defaults to the lower-cased name with spaces replaced by '_'
    std::string name;
    FeatureType type = FeatureType::SENSOR;
    FeatureCategory category = FeatureCategory::UNSET;  // CONFIG when settable, INFO otherwise
    std::string unit;
    std::string icon;
    int precision_hint = 0;
    std::optional<double> minimum_value;  // NUMBER
    std::optional<double> maximum_value;  // NUMBER
    std::vector<std::string> choices;     // CHOICE
    FeatureGetter getter;
    FeatureSetter setter;
};

/**
 * @brief Uniform accessor over one module attribute
 *
 * A feature refers to its device weakly and to its module by name, looking
 * both up on every call. It never extends either lifetime and reports
 * NOT_FOUND once the device is destroyed or the module deactivated.
 *
 * Readers right after a failed refresh may observe the previous value.
 */
class Feature {
public:
    Feature(std::weak_ptr<Device> device, const std::string& module_name, FeatureDescriptor descriptor);

    const std::string& id() const { return descriptor_.id; }
    const std::string& name() const { return descriptor_.name; }
    FeatureType type() const { return descriptor_.type; }
    FeatureCategory category() const { return descriptor_.category; }
    const std::string& unit() const { return descriptor_.unit; }
    const std::string& icon() const { return descriptor_.icon; }
    int precision_hint() const { return descriptor_.precision_hint; }
    const std::optional<double>& minimum_value() const { return descriptor_.minimum_value; }
    const std::optional<double>& maximum_value() const { return descriptor_.maximum_value; }
    const std::vector<std::string>& choices() const { return descriptor_.choices; }
    const std::string& module_name() const { return module_name_; }

    bool is_settable() const { return static_cast<bool>(descriptor_.setter); }

    FeatureReading get_value() const;

    // Validates, writes through the module and refreshes before returning
    Status set_value(const FeatureValue& value);

private:
    std::weak_ptr<Device> device_;
    std::string module_name_;
    FeatureDescriptor descriptor_;

    Status validate(const FeatureValue& value) const;
};

std::ostream& operator<<(std::ostream& os, const Feature& feature);

}  // namespace device
}  // namespace kasa
