#pragma once

#include "device/module_catalog.hpp"

namespace kasa {
namespace modules {

// Module sets handed to devices by the factory, in registration order
device::ModuleCatalog default_smart_catalog();
device::ModuleCatalog default_smartcam_catalog();
device::ModuleCatalog default_iot_catalog();

}  // namespace modules
}  // namespace kasa
