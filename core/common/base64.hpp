#pragma once

#include <optional>
#include <string>

namespace kasa {

std::string base64_encode(const std::string& input);

// nullopt when the input is not valid base64
std::optional<std::string> base64_decode(const std::string& input);

}  // namespace kasa
