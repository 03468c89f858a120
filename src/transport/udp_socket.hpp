// src/transport/udp_socket.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace transport
{

    // Largest datagram accepted by receive()
    constexpr size_t kMaxDatagramBytes = 2048;

    struct Datagram
    {
        std::string payload;
        std::string sender; // dotted IPv4 address of the peer
    };

    // Thin RAII wrapper over an IPv4 datagram socket.
    // All calls return false on error and set err.
    class UdpSocket
    {
    public:
        UdpSocket() = default;
        ~UdpSocket();

        UdpSocket(const UdpSocket &) = delete;
        UdpSocket &operator=(const UdpSocket &) = delete;

        bool open(std::string &err);
        void close();
        bool is_open() const { return fd_ >= 0; }

        // Binds to INADDR_ANY:port with SO_REUSEADDR set
        bool bind(uint16_t port, std::string &err);

        bool enable_broadcast(std::string &err);

        // host is a dotted address or a resolvable name
        bool send_to(const std::string &host, uint16_t port, const std::string &payload, std::string &err);

        // Waits up to timeout for one datagram.
        // Returns:
        //  - true  => datagram stored in out
        //  - false => timeout (err empty) or socket error (err non-empty)
        bool receive(Datagram &out, std::chrono::milliseconds timeout, std::string &err);

    private:
        int fd_ = -1;
    };

} // namespace transport
