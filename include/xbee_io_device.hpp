#pragma once
#include "config_manager.hpp"
#include "io_frame_router.hpp"
#include "pin_command_encoder.hpp"
#include "pin_state_propagator.hpp"
#include "remote_at_sender.hpp"
#include <functional>
#include <stdint.h>

class XBeeIoDevice {
public:
    // Applies the logging section of config to Logger
    XBeeIoDevice(const ConfigManager& config, RemoteAtSender* sender = nullptr);
    ~XBeeIoDevice();

    // router_ refers to propagator_
    XBeeIoDevice(const XBeeIoDevice&) = delete;
    XBeeIoDevice& operator=(const XBeeIoDevice&) = delete;

    // Inbound frame on the IO cluster
    FrameRouteResult onFrame(const IoFrame& frame);

    // On/off command addressed to a pin endpoint
    PinCommandResult setPinState(EndpointId endpoint_id, uint16_t command);

    // Called once per endpoint whose on/off attribute should change
    void onEndpointUpdate(std::function<void(const PinUpdate&)> callback);

    // Called for commands that are not pin writes, with the untouched arguments
    void onPassthroughCommand(std::function<void(EndpointId, uint16_t)> callback);

private:
    PinStatePropagator propagator_;
    PinCommandEncoder encoder_;
    IoFrameRouter router_;
    RemoteAtSender* sender_ = nullptr;

    std::function<void(const PinUpdate&)> onUpdateCallback_;
    std::function<void(EndpointId, uint16_t)> onPassthroughCallback_;
};
