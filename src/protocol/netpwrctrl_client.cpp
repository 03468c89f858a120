#include "netpwrctrl_client.hpp"

#include <iostream>
#include <set>
#include <sstream>
#include <utility>

#include "../errors.hpp"
#include "../transport/udp_socket.hpp"

namespace pwrctrl {

namespace {

constexpr const char *kReplyTag = "NET-PwrCtrl";

// Field positions inside a status datagram
constexpr std::size_t kFieldName = 1;
constexpr std::size_t kFieldAddress = 2;
constexpr std::size_t kFieldFirstPlug = 6;

std::vector<std::string> split(const std::string &s, char sep) {
  std::vector<std::string> parts;
  std::string part;
  std::istringstream in(s);
  while (std::getline(in, part, sep)) {
    parts.push_back(part);
  }
  return parts;
}

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  const auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

bool is_rejection(const std::string &payload) {
  return payload.compare(0, 6, "NoPass") == 0 ||
         payload.compare(0, 3, "Err") == 0;
}

// Opens a socket listening for device answers
void open_listener(transport::UdpSocket &socket, const Ports &ports,
                   bool broadcast) {
  std::string err;
  if (!socket.open(err) || !socket.bind(ports.in, err)) {
    throw NetworkFailure("cannot listen on port " + std::to_string(ports.in) +
                         ": " + err);
  }
  if (broadcast && !socket.enable_broadcast(err)) {
    throw NetworkFailure(err);
  }
}

} // namespace

std::optional<DiscoveredDevice>
parse_status_reply(const std::string &datagram) {
  const auto fields = split(trim(datagram), ':');
  if (fields.size() < kFieldFirstPlug + kNetPwrCtrlPlugCount ||
      fields[0] != kReplyTag) {
    return std::nullopt;
  }

  DiscoveredDevice device;
  device.name = trim(fields[kFieldName]);
  device.address = trim(fields[kFieldAddress]);
  if (device.address.empty()) {
    return std::nullopt;
  }

  for (int i = 0; i < kNetPwrCtrlPlugCount; ++i) {
    const std::string &field = fields[kFieldFirstPlug + i];
    const auto comma = field.rfind(',');
    if (comma == std::string::npos) {
      return std::nullopt;
    }

    DiscoveredPlug plug;
    plug.index = i + 1;
    plug.name = trim(field.substr(0, comma));

    const std::string flag = trim(field.substr(comma + 1));
    if (flag == "1") {
      plug.state = PlugState::On;
    } else if (flag == "0") {
      plug.state = PlugState::Off;
    } else {
      plug.state = PlugState::Unknown;
    }
    device.plugs.push_back(plug);
  }

  return device;
}

std::string make_switch_command(int index, PlugState desired,
                                const Credentials &credentials) {
  const char *verb = desired == PlugState::On ? "Sw_on" : "Sw_off";
  return verb + std::to_string(index) + credentials.user +
         credentials.password;
}

std::string make_reset_command(const Credentials &credentials) {
  return "Reset:" + credentials.user + credentials.password;
}

NetPwrCtrlClient::NetPwrCtrlClient(std::chrono::milliseconds discovery_window,
                                   std::chrono::milliseconds reply_timeout,
                                   std::string broadcast_address)
    : discovery_window_(discovery_window), reply_timeout_(reply_timeout),
      broadcast_address_(std::move(broadcast_address)) {}

std::vector<DiscoveredDevice>
NetPwrCtrlClient::discover(const Credentials &credentials,
                           const Ports &ports) {
  (void)credentials; // discovery is unauthenticated

  transport::UdpSocket socket;
  open_listener(socket, ports, true);

  std::string err;
  if (!socket.send_to(broadcast_address_, ports.out,
                      kNetPwrCtrlDiscoverRequest, err)) {
    throw NetworkFailure("discovery broadcast failed: " + err);
  }

  std::vector<DiscoveredDevice> found;
  std::set<std::string> seen;

  const auto deadline = std::chrono::steady_clock::now() + discovery_window_;
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      break;
    }

    transport::Datagram datagram;
    if (!socket.receive(datagram, remaining, err)) {
      if (err.empty()) {
        break; // window closed
      }
      throw NetworkFailure("discovery receive failed: " + err);
    }

    auto device = parse_status_reply(datagram.payload);
    if (!device) {
      std::cerr << "[NetPwrCtrl] Ignoring datagram from " << datagram.sender
                << std::endl;
      continue;
    }
    if (seen.insert(device->address).second) {
      found.push_back(*device);
    }
  }

  return found;
}

DiscoveredDevice NetPwrCtrlClient::exchange(const std::string &address,
                                            const std::string &request,
                                            const Ports &ports) {
  transport::UdpSocket socket;
  open_listener(socket, ports, false);

  std::string err;
  if (!socket.send_to(address, ports.out, request, err)) {
    throw NetworkFailure("cannot reach " + address + ": " + err);
  }

  const auto deadline = std::chrono::steady_clock::now() + reply_timeout_;
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      break;
    }

    transport::Datagram datagram;
    if (!socket.receive(datagram, remaining, err)) {
      if (!err.empty()) {
        throw NetworkFailure("receive from " + address + " failed: " + err);
      }
      break;
    }

    if (datagram.sender == address && is_rejection(datagram.payload)) {
      throw NetworkFailure(address + " rejected the credentials");
    }

    auto reply = parse_status_reply(datagram.payload);
    if (reply && (reply->address == address || datagram.sender == address)) {
      return *reply;
    }
  }

  throw NetworkFailure("no answer from " + address + " within " +
                       std::to_string(reply_timeout_.count()) + " ms");
}

PlugState NetPwrCtrlClient::switch_plug(const std::string &address, int index,
                                        std::optional<PlugState> desired,
                                        const Credentials &credentials,
                                        const Ports &ports) {
  const std::string request =
      desired ? make_switch_command(index, *desired, credentials)
              : std::string(kNetPwrCtrlDiscoverRequest);

  const DiscoveredDevice status = exchange(address, request, ports);
  for (const auto &plug : status.plugs) {
    if (plug.index == index) {
      return plug.state;
    }
  }
  return PlugState::Unknown;
}

void NetPwrCtrlClient::reset(const std::string &address,
                             const Credentials &credentials,
                             const Ports &ports) {
  // The device reboots without answering; make sure it is there first
  exchange(address, kNetPwrCtrlDiscoverRequest, ports);

  transport::UdpSocket socket;
  std::string err;
  if (!socket.open(err) ||
      !socket.send_to(address, ports.out, make_reset_command(credentials),
                      err)) {
    throw NetworkFailure("cannot reset " + address + ": " + err);
  }
}

} // namespace pwrctrl
