#include "feature.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <sstream>

#include "device.hpp"
#include "logging/logger.hpp"
#include "module.hpp"

namespace kasa {
namespace device {

const char* feature_type_to_string(FeatureType type) {
    switch (type) {
        case FeatureType::SENSOR:
            return "Sensor";
        case FeatureType::BINARY_SENSOR:
            return "BinarySensor";
        case FeatureType::SWITCH:
            return "Switch";
        case FeatureType::NUMBER:
            return "Number";
        case FeatureType::CHOICE:
            return "Choice";
        case FeatureType::ACTION:
            return "Action";
        default:
            return "Unknown";
    }
}

const char* feature_category_to_string(FeatureCategory category) {
    switch (category) {
        case FeatureCategory::PRIMARY:
            return "Primary";
        case FeatureCategory::INFO:
            return "Info";
        case FeatureCategory::CONFIG:
            return "Config";
        case FeatureCategory::DEBUG:
            return "Debug";
        default:
            return "Unset";
    }
}

std::string feature_value_to_string(const FeatureValue& value) {
    struct Visitor {
        std::string operator()(std::monostate) const { return "None"; }
        std::string operator()(bool v) const { return v ? "True" : "False"; }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        }
        std::string operator()(const std::string& v) const { return v; }
    };
    return std::visit(Visitor{}, value);
}

namespace {

std::string default_id(const std::string& name) {
    std::string id = name;
    std::transform(id.begin(), id.end(), id.begin(), [](unsigned char c) {
        return c == ' ' ? '_' : static_cast<char>(std::tolower(c));
    });
    return id;
}

}  // namespace

Feature::Feature(std::weak_ptr<Device> device, const std::string& module_name, FeatureDescriptor descriptor)
    : device_(std::move(device)), module_name_(module_name), descriptor_(std::move(descriptor)) {
    if (descriptor_.id.empty()) {
        descriptor_.id = default_id(descriptor_.name);
    }
    if (descriptor_.category == FeatureCategory::UNSET) {
        descriptor_.category = descriptor_.setter ? FeatureCategory::CONFIG : FeatureCategory::INFO;
    }
}

FeatureReading Feature::get_value() const {
    FeatureReading reading;
    std::shared_ptr<Device> device = device_.lock();
    if (!device) {
        reading.status = Status::error(StatusCode::NOT_FOUND, "Device of feature " + descriptor_.id + " is gone");
        return reading;
    }
    std::shared_ptr<Module> module = device->get_module(module_name_);
    if (!module) {
        reading.status = Status::error(StatusCode::NOT_FOUND, "Module " + module_name_ + " is not active");
        return reading;
    }
    if (descriptor_.type == FeatureType::ACTION) {
        reading.value = std::string("<Action>");
        return reading;
    }
    if (module->has_data_error()) {
        int code = module->data_error_code();
        reading.status = Status::device_error(StatusCode::DEVICE_ERROR,
                                              "Module " + module_name_ + " has no data for " + descriptor_.id, code);
        return reading;
    }
    if (!descriptor_.getter) {
        return reading;
    }
    try {
        reading.value = descriptor_.getter(*module);
    } catch (const nlohmann::json::exception& e) {
        reading.status = Status::error(StatusCode::INTERNAL, "Reading " + descriptor_.id + " failed: " + e.what());
    }
    return reading;
}

Status Feature::validate(const FeatureValue& value) const {
    switch (descriptor_.type) {
        case FeatureType::NUMBER: {
            double number;
            if (std::holds_alternative<int64_t>(value)) {
                number = static_cast<double>(std::get<int64_t>(value));
            } else if (std::holds_alternative<double>(value)) {
                number = std::get<double>(value);
            } else {
                return Status::error(StatusCode::INVALID_ARGUMENT, descriptor_.id + " expects a number");
            }
            if ((descriptor_.minimum_value && number < *descriptor_.minimum_value) ||
                (descriptor_.maximum_value && number > *descriptor_.maximum_value)) {
                std::ostringstream oss;
                oss << "Value " << number << " out of range for " << descriptor_.id << " [";
                if (descriptor_.minimum_value) oss << *descriptor_.minimum_value;
                oss << ", ";
                if (descriptor_.maximum_value) oss << *descriptor_.maximum_value;
                oss << "]";
                return Status::error(StatusCode::INVALID_ARGUMENT, oss.str());
            }
            return Status::success();
        }
        case FeatureType::CHOICE: {
            if (!std::holds_alternative<std::string>(value)) {
                return Status::error(StatusCode::INVALID_ARGUMENT, descriptor_.id + " expects a choice");
            }
            const auto& choice = std::get<std::string>(value);
            if (std::find(descriptor_.choices.begin(), descriptor_.choices.end(), choice) ==
                descriptor_.choices.end()) {
                return Status::error(StatusCode::INVALID_ARGUMENT,
                                     "Unexpected value '" + choice + "' for " + descriptor_.id);
            }
            return Status::success();
        }
        case FeatureType::SWITCH:
            if (!std::holds_alternative<bool>(value)) {
                return Status::error(StatusCode::INVALID_ARGUMENT, descriptor_.id + " expects a boolean");
            }
            return Status::success();
        case FeatureType::ACTION:
            if (!std::holds_alternative<std::monostate>(value)) {
                return Status::error(StatusCode::INVALID_ARGUMENT, descriptor_.id + " is an action and takes no value");
            }
            return Status::success();
        default:
            return Status::success();
    }
}

Status Feature::set_value(const FeatureValue& value) {
    if (!is_settable()) {
        return Status::error(StatusCode::INVALID_ARGUMENT, "Feature " + descriptor_.id + " is read-only");
    }
    Status status = validate(value);
    if (!status.ok()) {
        return status;
    }

    std::shared_ptr<Device> device = device_.lock();
    if (!device) {
        return Status::error(StatusCode::NOT_FOUND, "Device of feature " + descriptor_.id + " is gone");
    }
    std::shared_ptr<Module> module = device->get_module(module_name_);
    if (!module) {
        return Status::error(StatusCode::NOT_FOUND, "Module " + module_name_ + " is not active");
    }

    LOG_DEBUG("[Feature] Setting " << descriptor_.id << " on " << device->host() << " to "
                                   << feature_value_to_string(value));
    status = descriptor_.setter(*module, value);
    if (!status.ok()) {
        return status;
    }
    module->reset_update_time();

    RefreshDelegation delegation(*device);
    return device->refresh();
}

std::ostream& operator<<(std::ostream& os, const Feature& feature) {
    os << feature.name() << " (" << feature.id() << "): ";
    FeatureReading reading = feature.get_value();
    if (reading.ok()) {
        os << feature_value_to_string(reading.value);
        if (!feature.unit().empty()) {
            os << " " << feature.unit();
        }
    } else {
        os << "<error: " << reading.status.message << ">";
    }
    return os;
}

}  // namespace device
}  // namespace kasa
