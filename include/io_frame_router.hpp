#pragma once
#include "types.hpp"
#include "pin_state_propagator.hpp"
#include <map>
#include <string>
#include <vector>

enum class FrameRouteStatus {
    DECODED,            // IO sample decoded, sample is valid
    UNKNOWN_COMMAND,    // Not an IO sample, host should log and ignore
    MALFORMED_SAMPLE    // IO sample that failed to decode
};

struct FrameRouteResult {
    FrameRouteStatus status;
    uint16_t command_id;     // Command the frame was resolved to
    IoSample sample;
    std::string error;
};

inline const char* frameRouteStatusToString(FrameRouteStatus status) {
    switch (status) {
        case FrameRouteStatus::DECODED: return "decoded";
        case FrameRouteStatus::UNKNOWN_COMMAND: return "unknown_command";
        case FrameRouteStatus::MALFORMED_SAMPLE: return "malformed_sample";
        default: return "unknown";
    }
}

/**
 * @brief Resolves inbound IO cluster frames to decoded samples
 *
 * XBee IO sample reports are sent without a ZCL header, so the host's
 * header parser takes the first two sample bytes as the sequence number and
 * command id. A cluster-specific frame whose command id is not in the
 * command table is therefore rebuilt as [tsn, command_id, payload...] and
 * decoded as an IO sample. General frames are never IO samples.
 */
class IoFrameRouter {
public:
    static const uint8_t FRAME_TYPE_GENERAL = 0x00;
    static const uint8_t FRAME_TYPE_CLUSTER = 0x01;

    // Command id -> name of the cluster commands this router accepts
    using CommandTable = std::map<uint16_t, std::string>;

    IoFrameRouter(const PinStatePropagator& propagator, bool header_fallback = true);
    IoFrameRouter(const PinStatePropagator& propagator, const CommandTable& commands,
                  bool header_fallback = true);
    ~IoFrameRouter() = default;

    // Holds a reference to the propagator
    IoFrameRouter(const IoFrameRouter&) = delete;
    IoFrameRouter& operator=(const IoFrameRouter&) = delete;

    // Command table used when none is given: the IO sample report only
    static CommandTable defaultCommands();

    // Never throws; failures are reported through the result status
    FrameRouteResult route(const IoFrame& frame) const;

    // Apply a resolved cluster command. Throws UnknownCommandException for
    // anything other than the IO sample command.
    std::vector<PinUpdate> handleClusterCommand(uint16_t command_id, const IoSample& sample) const;

    bool isKnownCommand(uint16_t command_id) const;

private:
    const PinStatePropagator& propagator_;
    bool header_fallback_;
    CommandTable commands_;

    FrameRouteResult decodePayload(uint16_t command_id, const uint8_t* data, size_t length) const;
    FrameRouteResult unknownCommand(uint16_t command_id, const char* kind) const;
};
