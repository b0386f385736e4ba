#include "../include/pin_command_encoder.hpp"
#include "../include/logger.hpp"

PinCommandEncoder::PinCommandEncoder(const PinNameMap& pin_names)
    : pin_names_(pin_names) {
}

bool PinCommandEncoder::hasPin(EndpointId endpoint_id) const {
    return pin_names_.find(endpoint_id) != pin_names_.end();
}

PinCommandResult PinCommandEncoder::encode(EndpointId endpoint_id, uint16_t command) const {
    PinCommandResult result;
    result.endpoint_id = endpoint_id;
    result.command = command;
    result.remote.opcode = 0;
    result.remote.apply_changes = false;
    result.remote.encrypted = false;

    if (command != ON_OFF_COMMAND_OFF && command != ON_OFF_COMMAND_ON) {
        result.status = PinCommandStatus::UNSUPPORTED_COMMAND;
        Logger::debug("[PinCmd] Command 0x%02X on endpoint 0x%02X is not a pin write",
                      command, endpoint_id);
        return result;
    }

    PinNameMap::const_iterator it = pin_names_.find(endpoint_id);
    if (it == pin_names_.end()) {
        result.status = PinCommandStatus::UNSUPPORTED_ENDPOINT;
        Logger::debug("[PinCmd] Endpoint 0x%02X has no pin", endpoint_id);
        return result;
    }

    result.status = PinCommandStatus::ACCEPTED;
    result.remote.pin_name = it->second;
    result.remote.opcode = (command == ON_OFF_COMMAND_OFF) ? DIO_PIN_LOW : DIO_PIN_HIGH;
    result.remote.apply_changes = true;
    result.remote.encrypted = true;

    Logger::debug("[PinCmd] Endpoint 0x%02X -> %s=%u", endpoint_id,
                  result.remote.pin_name.c_str(), result.remote.opcode);
    return result;
}
