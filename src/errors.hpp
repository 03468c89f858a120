#pragma once

#include <stdexcept>
#include <string>

namespace pwrctrl {

// Configuration file could not be read, parsed, validated or written.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A device with the same address is already registered.
class DuplicateAddress : public std::runtime_error {
public:
  explicit DuplicateAddress(const std::string &address)
      : std::runtime_error("duplicate device address: " + address),
        address_(address) {}

  const std::string &address() const { return address_; }

private:
  std::string address_;
};

// Two plug definitions of one device share a slot index.
class DuplicatePlugIndex : public std::runtime_error {
public:
  DuplicatePlugIndex(const std::string &address, int index)
      : std::runtime_error("duplicate plug index " + std::to_string(index) +
                           " on device " + address),
        index_(index) {}

  int index() const { return index_; }

private:
  int index_;
};

// Device unreachable, timed out or refused the credentials.
class NetworkFailure : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace pwrctrl
