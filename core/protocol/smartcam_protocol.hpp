#pragma once

#include "smart_protocol.hpp"

namespace kasa {
namespace protocol {

// Camera flavour of SMART: every request travels as multipleRequest
class SmartCamProtocol : public SmartProtocol {
public:
    using SmartProtocol::SmartProtocol;

protected:
    bool always_multiple() const override { return true; }
};

}  // namespace protocol
}  // namespace kasa
