#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "smart_module.hpp"

namespace kasa {
namespace modules {

// Device clock (get_device_time); not available on hub children
class TimeModule : public SmartModule {
public:
    TimeModule(device::Device& device, const std::string& name, const std::string& required_component);

    bool check_supported() override;
    void post_update_hook() override;

    // Device local time as "YYYY-MM-DD HH:MM:SS"
    std::string local_time() const;

    int utc_offset_minutes() const;
    std::string region() const;

    Status set_time(int64_t timestamp, int utc_offset_minutes, const std::string& region = "");

protected:
    void initialize_features() override;

private:
    mutable std::mutex mutex_;
    int utc_offset_minutes_ = 0;
    std::string region_;
};

}  // namespace modules
}  // namespace kasa
