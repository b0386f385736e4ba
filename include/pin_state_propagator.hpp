#pragma once
#include "types.hpp"
#include <vector>

class PinStatePropagator {
public:
    explicit PinStatePropagator(const PinIndexMap& pin_endpoints);
    ~PinStatePropagator() = default;

    // One update per enabled digital pin that has an endpoint, in ascending
    // pin order. Holds no endpoint state of its own.
    std::vector<PinUpdate> propagate(const IoSample& sample) const;

private:
    const PinIndexMap pin_endpoints_;
};
