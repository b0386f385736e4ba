#include "../include/xbee_io_device.hpp"
#include "../include/logger.hpp"
#include <vector>

XBeeIoDevice::XBeeIoDevice(const ConfigManager& config, RemoteAtSender* sender)
    : propagator_(config.getPinIndexMap()),
      encoder_(config.getPinNameMap()),
      router_(propagator_),
      sender_(sender) {
    Logger::begin(config.getLoggingConfig());
}

XBeeIoDevice::~XBeeIoDevice() {
}

void XBeeIoDevice::onEndpointUpdate(std::function<void(const PinUpdate&)> callback) {
    onUpdateCallback_ = callback;
}

void XBeeIoDevice::onPassthroughCommand(std::function<void(EndpointId, uint16_t)> callback) {
    onPassthroughCallback_ = callback;
}

FrameRouteResult XBeeIoDevice::onFrame(const IoFrame& frame) {
    FrameRouteResult result = router_.route(frame);

    switch (result.status) {
        case FrameRouteStatus::UNKNOWN_COMMAND:
            Logger::warn("[XBeeIO] Ignoring frame: %s", result.error.c_str());
            return result;
        case FrameRouteStatus::MALFORMED_SAMPLE:
            Logger::error("[XBeeIO] Dropping malformed IO sample: %s", result.error.c_str());
            return result;
        case FrameRouteStatus::DECODED:
            break;
    }

    // route() resolves every decoded frame to the IO sample command
    std::vector<PinUpdate> updates = router_.handleClusterCommand(result.command_id, result.sample);

    Logger::debug("[XBeeIO] IO sample -> %u endpoint updates", (unsigned)updates.size());
    if (onUpdateCallback_) {
        for (const auto& update : updates) {
            onUpdateCallback_(update);
        }
    }
    return result;
}

PinCommandResult XBeeIoDevice::setPinState(EndpointId endpoint_id, uint16_t command) {
    PinCommandResult result = encoder_.encode(endpoint_id, command);

    if (!result.isAccepted()) {
        Logger::debug("[XBeeIO] Passing command %u on endpoint 0x%02X through: %s",
                      command, endpoint_id, pinCommandStatusToString(result.status));
        if (onPassthroughCallback_) {
            onPassthroughCallback_(endpoint_id, command);
        }
        return result;
    }

    if (!sender_) {
        Logger::warn("[XBeeIO] Remote AT command not supported by this coordinator");
        return result;
    }

    Logger::info("[XBeeIO] Remote AT %s=%u (endpoint 0x%02X)",
                 result.remote.pin_name.c_str(), result.remote.opcode, endpoint_id);
    if (!sender_->sendRemoteAt(result.remote)) {
        Logger::warn("[XBeeIO] Remote AT %s could not be queued", result.remote.pin_name.c_str());
    }
    return result;
}
