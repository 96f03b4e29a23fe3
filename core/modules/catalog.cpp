#include "catalog.hpp"

#include "iot/cloud_module.hpp"
#include "iot/emeter_module.hpp"
#include "iot/sysinfo_module.hpp"
#include "iot/time_module.hpp"
#include "smart/auto_off_module.hpp"
#include "smart/battery_sensor_module.hpp"
#include "smart/brightness_module.hpp"
#include "smart/cloud_module.hpp"
#include "smart/device_module.hpp"
#include "smart/energy_module.hpp"
#include "smart/firmware_module.hpp"
#include "smart/light_preset_module.hpp"
#include "smart/time_module.hpp"
#include "smartcam/camera_device_module.hpp"

namespace kasa {
namespace modules {

device::ModuleCatalog default_smart_catalog() {
    device::ModuleCatalog catalog;
    catalog.add<DeviceModule>("DeviceModule", "device");
    catalog.add<TimeModule>("Time", "time");
    catalog.add<CloudModule>("Cloud", "cloud_connect");
    catalog.add<EnergyModule>("Energy", "energy_monitoring");
    catalog.add<AutoOffModule>("AutoOff", "auto_off");
    catalog.add<BrightnessModule>("Brightness", "brightness");
    catalog.add<LightPresetModule>("LightPreset", "preset");
    catalog.add<BatterySensorModule>("BatterySensor", "battery_detect");
    catalog.add<FirmwareModule>("Firmware", "firmware");
    return catalog;
}

device::ModuleCatalog default_smartcam_catalog() {
    device::ModuleCatalog catalog;
    catalog.add<CameraDeviceModule>("DeviceModule");
    return catalog;
}

device::ModuleCatalog default_iot_catalog() {
    device::ModuleCatalog catalog;
    catalog.add<SysInfoModule>("sysinfo");
    catalog.add<EmeterModule>("emeter");
    catalog.add<IotTimeModule>("time");
    catalog.add<IotCloudModule>("cloud");
    return catalog;
}

}  // namespace modules
}  // namespace kasa
