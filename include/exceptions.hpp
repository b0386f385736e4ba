#pragma once

#include <cstdint>
#include <string>
#include <exception>

enum ErrorCode {
    ERR_NONE = 0,
    ERR_MALFORMED_SAMPLE,
    ERR_UNKNOWN_COMMAND,
    ERR_CONFIG,
    ERR_UNKNOWN
};

class MalformedSampleException : public std::exception {
public:
    MalformedSampleException(const std::string& msg, ErrorCode code = ERR_MALFORMED_SAMPLE) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~MalformedSampleException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};

class UnknownCommandException : public std::exception {
public:
    UnknownCommandException(const std::string& msg, uint16_t command_id, ErrorCode code = ERR_UNKNOWN_COMMAND)
        : message_(msg), command_id_(command_id), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    uint16_t commandId() const { return command_id_; }
    virtual ~UnknownCommandException() noexcept {}
private:
    std::string message_;
    uint16_t command_id_;
    ErrorCode code_;
};

class ConfigException : public std::exception {
public:
    ConfigException(const std::string& msg, ErrorCode code = ERR_CONFIG) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~ConfigException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};
