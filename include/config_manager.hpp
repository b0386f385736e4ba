#pragma once
#include <stdint.h>
#include <vector>
#include <string>
#include "types.hpp"

struct LoggingConfig {
    std::string log_level;
    std::string log_file;
    bool flush_on_write;
};

// One digital pin exposed as an on/off endpoint
struct PinConfig {
    PinIndex index;
    EndpointId endpoint;
    std::string name;
};

class ConfigManager {
public:
    ConfigManager();
    explicit ConfigManager(const char* json);
    ~ConfigManager();

    // Replace pin and logging settings from a JSON document.
    // On any error the current configuration is kept and false is returned.
    bool loadFromJson(const char* json);

    PinIndexMap getPinIndexMap() const;
    PinNameMap getPinNameMap() const;
    std::vector<PinConfig> getPinConfigs() const;
    LoggingConfig getLoggingConfig() const;

    bool validatePins(const std::vector<PinConfig>& pins, std::string& reason) const;

private:
    std::vector<PinConfig> pin_configs_;
    LoggingConfig logging_config_;

    void initializeDefaults();
};
