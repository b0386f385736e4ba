#include "../include/io_frame_router.hpp"
#include "../include/io_sample_decoder.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"

const uint8_t IoFrameRouter::FRAME_TYPE_GENERAL;
const uint8_t IoFrameRouter::FRAME_TYPE_CLUSTER;

IoFrameRouter::CommandTable IoFrameRouter::defaultCommands() {
    CommandTable commands;
    commands[IO_SAMPLE_COMMAND] = "io_sample";
    return commands;
}

IoFrameRouter::IoFrameRouter(const PinStatePropagator& propagator, bool header_fallback)
    : propagator_(propagator), header_fallback_(header_fallback), commands_(defaultCommands()) {
}

IoFrameRouter::IoFrameRouter(const PinStatePropagator& propagator, const CommandTable& commands,
                             bool header_fallback)
    : propagator_(propagator), header_fallback_(header_fallback), commands_(commands) {
}

bool IoFrameRouter::isKnownCommand(uint16_t command_id) const {
    return commands_.find(command_id) != commands_.end();
}

FrameRouteResult IoFrameRouter::decodePayload(uint16_t command_id, const uint8_t* data, size_t length) const {
    FrameRouteResult result;
    result.command_id = command_id;
    try {
        result.sample = decodeIoSample(data, length);
        result.status = FrameRouteStatus::DECODED;
    } catch (const MalformedSampleException& e) {
        result.status = FrameRouteStatus::MALFORMED_SAMPLE;
        result.error = e.what();
    }
    return result;
}

FrameRouteResult IoFrameRouter::unknownCommand(uint16_t command_id, const char* kind) const {
    Logger::warn("[Router] Unknown %s command %u", kind, command_id);
    FrameRouteResult result;
    result.status = FrameRouteStatus::UNKNOWN_COMMAND;
    result.command_id = command_id;
    result.error = std::string("Unknown ") + kind + " command " + std::to_string(command_id);
    return result;
}

FrameRouteResult IoFrameRouter::route(const IoFrame& frame) const {
    if (frame.frame_type != FRAME_TYPE_CLUSTER) {
        return unknownCommand(frame.command_id, "foundation");
    }

    // Step 1: the command id is one we know
    if (isKnownCommand(frame.command_id)) {
        return decodePayload(frame.command_id, frame.payload.data(), frame.payload.size());
    }

    // Step 2: header bytes were really the start of an IO sample
    if (!header_fallback_ || !isKnownCommand(IO_SAMPLE_COMMAND)) {
        return unknownCommand(frame.command_id, "cluster-specific");
    }

    std::vector<uint8_t> data;
    data.reserve(frame.payload.size() + 2);
    data.push_back(frame.tsn);
    data.push_back((uint8_t)(frame.command_id & 0xFF));
    data.insert(data.end(), frame.payload.begin(), frame.payload.end());

    Logger::debug("[Router] Reinterpreting command %u as IO sample (%u bytes)",
                  frame.command_id, (unsigned)data.size());
    return decodePayload(IO_SAMPLE_COMMAND, data.data(), data.size());
}

std::vector<PinUpdate> IoFrameRouter::handleClusterCommand(uint16_t command_id, const IoSample& sample) const {
    if (command_id != IO_SAMPLE_COMMAND) {
        throw UnknownCommandException("Unhandled cluster command " + std::to_string(command_id), command_id);
    }
    return propagator_.propagate(sample);
}
