#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "protocol_client.hpp"

namespace pwrctrl {

// Number of outlets reported by a NET-PwrCtrl status datagram
constexpr int kNetPwrCtrlPlugCount = 8;

// Discovery request, broadcast to the devices' command port
constexpr const char *kNetPwrCtrlDiscoverRequest = "wer da?\r\n";

// Parses a status datagram of the form
//   NET-PwrCtrl:<name>:<ip>:<mask>:<gateway>:<mac>:<plug1>,<0|1>:...:<plug8>,<0|1>:...
// Returns nullopt for anything else. The address is the <ip> field.
std::optional<DiscoveredDevice>
parse_status_reply(const std::string &datagram);

// Command datagrams
std::string make_switch_command(int index, PlugState desired,
                                const Credentials &credentials);
std::string make_reset_command(const Credentials &credentials);

// ProtocolClient for ANEL NET-PwrCtrl strips speaking the ASCII UDP
// protocol. Requests go to <device>:ports.out, answers are collected on
// ports.in.
class NetPwrCtrlClient : public ProtocolClient {
public:
  explicit NetPwrCtrlClient(
      std::chrono::milliseconds discovery_window = std::chrono::seconds(2),
      std::chrono::milliseconds reply_timeout = std::chrono::seconds(1),
      std::string broadcast_address = "255.255.255.255");

  std::vector<DiscoveredDevice> discover(const Credentials &credentials,
                                         const Ports &ports) override;

  PlugState switch_plug(const std::string &address, int index,
                        std::optional<PlugState> desired,
                        const Credentials &credentials,
                        const Ports &ports) override;

  void reset(const std::string &address, const Credentials &credentials,
             const Ports &ports) override;

private:
  // Sends request to address and waits for that device's status reply.
  // Throws NetworkFailure on socket errors, rejection or timeout.
  DiscoveredDevice exchange(const std::string &address,
                            const std::string &request, const Ports &ports);

  std::chrono::milliseconds discovery_window_;
  std::chrono::milliseconds reply_timeout_;
  std::string broadcast_address_;
};

} // namespace pwrctrl
