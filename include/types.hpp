#pragma once
#include <cstdint>
#include <array>
#include <map>
#include <string>
#include <vector>

using EndpointId = uint16_t;
using PinIndex = uint8_t;

const uint8_t NUM_DIGITAL_PINS = 13;
const uint8_t NUM_ANALOG_PINS = 8;

// Only inbound command on the XBee IO cluster
const uint16_t IO_SAMPLE_COMMAND = 0x0000;

// Remote AT parameter for the DIOx / Px commands
const uint8_t DIO_PIN_LOW = 0x04;
const uint8_t DIO_PIN_HIGH = 0x05;

// Digital pin index -> endpoint exposing that pin's on/off state
using PinIndexMap = std::map<PinIndex, EndpointId>;
// Endpoint -> native AT command name of the pin ("D0", "P1", ...)
using PinNameMap = std::map<EndpointId, std::string>;

// One decoded IO sample report
struct IoSample {
    std::array<bool, NUM_DIGITAL_PINS> digital_pin_enabled;
    std::array<bool, NUM_ANALOG_PINS> analog_pin_enabled;
    std::array<bool, NUM_DIGITAL_PINS> digital_pin_value;
    std::array<uint16_t, NUM_ANALOG_PINS> analog_pin_value;

    IoSample() {
        digital_pin_enabled.fill(false);
        analog_pin_enabled.fill(false);
        digital_pin_value.fill(false);
        analog_pin_value.fill(0);
    }

    bool operator==(const IoSample& other) const {
        return digital_pin_enabled == other.digital_pin_enabled &&
               analog_pin_enabled == other.analog_pin_enabled &&
               digital_pin_value == other.digital_pin_value &&
               analog_pin_value == other.analog_pin_value;
    }
    bool operator!=(const IoSample& other) const { return !(*this == other); }
};

// Directive for the host: set the on/off attribute of an endpoint
struct PinUpdate {
    EndpointId endpoint_id;
    uint8_t value;  // 0 or 1

    bool operator==(const PinUpdate& other) const {
        return endpoint_id == other.endpoint_id && value == other.value;
    }
};

// Outbound remote AT command, the destination address is filled in by the host
struct RemoteCommand {
    std::string pin_name;
    uint8_t opcode;
    bool apply_changes;
    bool encrypted;
};

// Inbound frame on the IO cluster as split by the host's ZCL header parser
struct IoFrame {
    uint8_t tsn;
    uint8_t frame_type;     // 0 = general, 1 = cluster specific
    bool is_reply;
    uint16_t command_id;
    std::vector<uint8_t> payload;
};
