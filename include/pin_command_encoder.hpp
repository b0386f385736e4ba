#pragma once
#include "pin_command.hpp"
#include "types.hpp"
#include <stdint.h>

// Turns on/off commands addressed to a pin endpoint into remote AT commands
// ("D0" = 5 for high, "D0" = 4 for low). Performs no I/O.
class PinCommandEncoder {
public:
    explicit PinCommandEncoder(const PinNameMap& pin_names);
    ~PinCommandEncoder() = default;

    PinCommandResult encode(EndpointId endpoint_id, uint16_t command) const;

    bool hasPin(EndpointId endpoint_id) const;

private:
    const PinNameMap pin_names_;
};
