// src/Errors.hpp

// ---- Error taxonomy ---- //

// ConfigError      => configuration missing or invalid, fatal at startup
// ProtocolError    => malformed or unexpected netlink exchange, the in-flight
//                     exchange is aborted but the socket stays usable
// KernelRejection  => the kernel answered a request with an error code
// ChannelError     => a control message was published with nobody listening
// SystemBusError   => a D-Bus method call failed

#pragma once

#include <cstring>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ProtocolError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class KernelRejection : public ProtocolError {
public:
  // error is the positive errno value reported by the kernel
  KernelRejection(int error, const std::string &context)
      : ProtocolError(context + ": " + std::strerror(error)), error_(error) {}

  int error() const noexcept { return error_; }

private:
  int error_;
};

class ChannelError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class SystemBusError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
