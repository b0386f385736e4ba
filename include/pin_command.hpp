#pragma once
#include <stdint.h>
#include <string>
#include "types.hpp"

// Generic on/off command ids that map onto a pin write
const uint8_t ON_OFF_COMMAND_OFF = 0x00;
const uint8_t ON_OFF_COMMAND_ON = 0x01;

enum class PinCommandStatus {
    ACCEPTED,                 // Remote AT command built and handed off
    UNSUPPORTED_ENDPOINT,     // Endpoint has no pin name, pass through
    UNSUPPORTED_COMMAND       // Not an off/on command, pass through
};

struct PinCommandResult {
    PinCommandStatus status;
    EndpointId endpoint_id;
    uint16_t command;         // Command as received
    RemoteCommand remote;     // Valid only when ACCEPTED

    bool isAccepted() const { return status == PinCommandStatus::ACCEPTED; }
};

inline const char* pinCommandStatusToString(PinCommandStatus status) {
    switch (status) {
        case PinCommandStatus::ACCEPTED: return "accepted";
        case PinCommandStatus::UNSUPPORTED_ENDPOINT: return "unsupported_endpoint";
        case PinCommandStatus::UNSUPPORTED_COMMAND: return "unsupported_command";
        default: return "unknown";
    }
}
