#pragma once
#include "types.hpp"

// Host side of the remote AT path. The host addresses the command to the
// device's network address and owns delivery, retries and timeouts.
class RemoteAtSender {
public:
    virtual ~RemoteAtSender() {}

    // Returns false when the command could not be queued
    virtual bool sendRemoteAt(const RemoteCommand& command) = 0;
};
