#include "../include/pin_state_propagator.hpp"
#include "../include/logger.hpp"

PinStatePropagator::PinStatePropagator(const PinIndexMap& pin_endpoints)
    : pin_endpoints_(pin_endpoints) {
}

std::vector<PinUpdate> PinStatePropagator::propagate(const IoSample& sample) const {
    std::vector<PinUpdate> updates;

    for (uint8_t pin = 0; pin < NUM_DIGITAL_PINS; ++pin) {
        if (!sample.digital_pin_enabled[pin]) {
            continue;
        }
        PinIndexMap::const_iterator it = pin_endpoints_.find(pin);
        if (it == pin_endpoints_.end()) {
            // Sampled on the device but not exposed to the host
            Logger::debug("[Propagator] Pin %u has no endpoint, skipped", pin);
            continue;
        }
        PinUpdate update;
        update.endpoint_id = it->second;
        update.value = sample.digital_pin_value[pin] ? 1 : 0;
        updates.push_back(update);
    }

    return updates;
}
