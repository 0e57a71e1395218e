#pragma once

#include <stdexcept>
#include <string>
#include <utility>

constexpr const char* kErrorServiceUnknown = "org.freedesktop.DBus.Error.ServiceUnknown";
constexpr const char* kErrorNoReply = "org.freedesktop.DBus.Error.NoReply";
constexpr const char* kErrorAlreadyExists = "org.bluez.Error.AlreadyExists";
constexpr const char* kErrorDoesNotExist = "org.bluez.Error.DoesNotExist";

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Fault reply from a bus method call, or failure to reach the bus at all.
class BusError : public std::runtime_error {
public:
    BusError(std::string name, const std::string& message)
        : std::runtime_error(name + ": " + message)
        , name_(std::move(name))
    {
    }

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

// The object path is already registered with the manager.
class ConflictError : public BusError {
public:
    explicit ConflictError(const std::string& message)
        : BusError(kErrorAlreadyExists, message)
    {
    }
};

class AdapterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConnectionError : public std::runtime_error {
public:
    ConnectionError(const std::string& message, unsigned attempts)
        : std::runtime_error(message)
        , attempts_(attempts)
    {
    }

    unsigned attempts() const noexcept { return attempts_; }

private:
    unsigned attempts_;
};

class RegistrationError : public std::runtime_error {
public:
    RegistrationError(std::string entity, const std::string& message, unsigned attempts)
        : std::runtime_error(entity + " registration failed after " + std::to_string(attempts) + " attempt(s): " + message)
        , entity_(std::move(entity))
        , attempts_(attempts)
    {
    }

    const std::string& entity() const noexcept { return entity_; }
    unsigned attempts() const noexcept { return attempts_; }

private:
    std::string entity_;
    unsigned attempts_;
};
