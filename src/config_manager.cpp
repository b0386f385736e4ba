#include "../include/config_manager.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <set>

ConfigManager::ConfigManager() {
    initializeDefaults();
}

ConfigManager::ConfigManager(const char* json) {
    initializeDefaults();
    if (!loadFromJson(json)) {
        throw ConfigException("Invalid XBee IO configuration document");
    }
}

ConfigManager::~ConfigManager() {}

void ConfigManager::initializeDefaults() {
    // DIO6..DIO9 get no endpoint
    pin_configs_.clear();
    pin_configs_.push_back({0, 0xD0, "D0"});   // AD0/DIO0/Commissioning
    pin_configs_.push_back({1, 0xD1, "D1"});   // AD1/DIO1/SPI_nATTN
    pin_configs_.push_back({2, 0xD2, "D2"});   // AD2/DIO2/SPI_CLK
    pin_configs_.push_back({3, 0xD3, "D3"});   // AD3/DIO3
    pin_configs_.push_back({4, 0xD4, "D4"});   // DIO4/SPI_MOSI
    pin_configs_.push_back({5, 0xD5, "D5"});   // DIO5/Assoc
    pin_configs_.push_back({10, 0xDA, "P0"});  // DIO10/PWM0
    pin_configs_.push_back({11, 0xDB, "P1"});  // DIO11/PWM1
    pin_configs_.push_back({12, 0xDC, "P2"});  // DIO12/SPI_MISO

    logging_config_.log_level = "INFO";
    logging_config_.log_file = "";
    logging_config_.flush_on_write = true;
}

static PinConfig parsePinEntry(JsonObject entry) {
    if (!entry["index"].is<unsigned int>()) {
        throw ConfigException("Pin entry without numeric 'index'");
    }
    if (!entry["endpoint"].is<unsigned int>()) {
        throw ConfigException("Pin entry without numeric 'endpoint'");
    }
    if (!entry["name"].is<const char*>()) {
        throw ConfigException("Pin entry without 'name'");
    }
    unsigned int index = entry["index"].as<unsigned int>();
    unsigned int endpoint = entry["endpoint"].as<unsigned int>();
    if (index >= NUM_DIGITAL_PINS) {
        throw ConfigException("Pin index " + std::to_string(index) + " out of range (0-12)");
    }
    if (endpoint > 0xFFFF) {
        throw ConfigException("Endpoint " + std::to_string(endpoint) + " out of range (0-65535)");
    }
    PinConfig pin;
    pin.index = (PinIndex)index;
    pin.endpoint = (EndpointId)endpoint;
    pin.name = entry["name"].as<const char*>();
    return pin;
}

bool ConfigManager::loadFromJson(const char* json) {
    if (!json) {
        Logger::error("[ConfigMgr] No configuration document");
        return false;
    }

    DynamicJsonDocument doc(4096);
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        Logger::error("[ConfigMgr] JSON parse error: %s", error.c_str());
        return false;
    }

    std::vector<PinConfig> pins = pin_configs_;
    LoggingConfig logging = logging_config_;

    try {
        if (doc.containsKey("pins")) {
            if (!doc["pins"].is<JsonArray>()) {
                throw ConfigException("'pins' must be an array");
            }
            pins.clear();
            JsonArray entries = doc["pins"].as<JsonArray>();
            for (JsonVariant entry : entries) {
                if (!entry.is<JsonObject>()) {
                    throw ConfigException("Pin entry must be an object");
                }
                pins.push_back(parsePinEntry(entry.as<JsonObject>()));
            }
        }

        if (doc.containsKey("logging")) {
            JsonObject log_obj = doc["logging"].as<JsonObject>();
            if (log_obj.containsKey("log_level")) {
                logging.log_level = log_obj["log_level"].as<std::string>();
            }
            if (log_obj.containsKey("log_file")) {
                logging.log_file = log_obj["log_file"].as<std::string>();
            }
            if (log_obj.containsKey("flush_on_write")) {
                logging.flush_on_write = log_obj["flush_on_write"].as<bool>();
            }
        }
    } catch (const ConfigException& e) {
        Logger::error("[ConfigMgr] Rejected configuration: %s", e.what());
        return false;
    }

    std::string reason;
    if (!validatePins(pins, reason)) {
        Logger::error("[ConfigMgr] Rejected configuration: %s", reason.c_str());
        return false;
    }

    pin_configs_ = pins;
    logging_config_ = logging;
    Logger::info("[ConfigMgr] Loaded %u pin endpoints, log level %s",
                 (unsigned)pin_configs_.size(), logging_config_.log_level.c_str());
    return true;
}

bool ConfigManager::validatePins(const std::vector<PinConfig>& pins, std::string& reason) const {
    std::set<PinIndex> indexes;
    std::set<EndpointId> endpoints;
    for (const auto& pin : pins) {
        if (pin.index >= NUM_DIGITAL_PINS) {
            reason = "Pin index " + std::to_string(pin.index) + " out of range (0-12)";
            return false;
        }
        if (pin.name.empty()) {
            reason = "Pin " + std::to_string(pin.index) + " has an empty name";
            return false;
        }
        if (!indexes.insert(pin.index).second) {
            reason = "Duplicate pin index: " + std::to_string(pin.index);
            return false;
        }
        if (!endpoints.insert(pin.endpoint).second) {
            reason = "Duplicate endpoint: " + std::to_string(pin.endpoint);
            return false;
        }
    }
    return true;
}

PinIndexMap ConfigManager::getPinIndexMap() const {
    PinIndexMap map;
    for (const auto& pin : pin_configs_) {
        map[pin.index] = pin.endpoint;
    }
    return map;
}

PinNameMap ConfigManager::getPinNameMap() const {
    PinNameMap map;
    for (const auto& pin : pin_configs_) {
        map[pin.endpoint] = pin.name;
    }
    return map;
}

std::vector<PinConfig> ConfigManager::getPinConfigs() const { return pin_configs_; }

LoggingConfig ConfigManager::getLoggingConfig() const { return logging_config_; }
