#pragma once

#include <stdexcept>
#include <string>

namespace evdevkit {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// The operation needs a backing file descriptor that this device does not
// have, or a descriptor was assigned to a device that must not have one.
class InvalidFileError : public Error {
public:
    explicit InvalidFileError(const std::string& what = "invalid file") : Error(what) {}
};

class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& what = "invalid argument") : Error(what) {}
};

// EVIOCGRAB was refused. The caller must not assume exclusive access.
class DeviceGrabError : public Error {
public:
    explicit DeviceGrabError(const std::string& what = "device grab failed") : Error(what) {}
};

// Thrown by the next pull after an EV_SYN/SYN_DROPPED event was delivered.
// Recoverable: call Device::sync() and process the returned events.
class EventsDroppedError : public Error {
public:
    explicit EventsDroppedError(const std::string& what = "events dropped") : Error(what) {}
};

} // namespace evdevkit
