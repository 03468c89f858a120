// src/transport/udp_socket.cpp
#include "udp_socket.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace transport
{

    static inline std::string errno_message(const char *what)
    {
        return std::string(what) + ": " + std::strerror(errno);
    }

    UdpSocket::~UdpSocket()
    {
        close();
    }

    bool UdpSocket::open(std::string &err)
    {
        err.clear();
        close();

        fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (fd_ < 0)
        {
            err = errno_message("socket");
            return false;
        }
        return true;
    }

    void UdpSocket::close()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool UdpSocket::bind(uint16_t port, std::string &err)
    {
        err.clear();

        int yes = 1;
        if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0)
        {
            err = errno_message("setsockopt(SO_REUSEADDR)");
            return false;
        }

        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(port);

        if (::bind(fd_, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) != 0)
        {
            err = errno_message("bind");
            return false;
        }
        return true;
    }

    bool UdpSocket::enable_broadcast(std::string &err)
    {
        err.clear();

        int yes = 1;
        if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &yes, sizeof(yes)) != 0)
        {
            err = errno_message("setsockopt(SO_BROADCAST)");
            return false;
        }
        return true;
    }

    bool UdpSocket::send_to(const std::string &host, uint16_t port, const std::string &payload, std::string &err)
    {
        err.clear();

        addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;

        addrinfo *res = nullptr;
        const std::string service = std::to_string(port);
        const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
        if (rc != 0 || res == nullptr)
        {
            err = "cannot resolve '" + host + "': " + ::gai_strerror(rc);
            return false;
        }

        const ssize_t sent = ::sendto(fd_, payload.data(), payload.size(), 0, res->ai_addr, res->ai_addrlen);
        ::freeaddrinfo(res);

        if (sent < 0)
        {
            err = errno_message("sendto");
            return false;
        }
        if (static_cast<size_t>(sent) != payload.size())
        {
            err = "short datagram write";
            return false;
        }
        return true;
    }

    bool UdpSocket::receive(Datagram &out, std::chrono::milliseconds timeout, std::string &err)
    {
        err.clear();

        if (timeout.count() < 0)
        {
            timeout = std::chrono::milliseconds(0);
        }

        pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc;
        do
        {
            rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (rc < 0 && errno == EINTR);

        if (rc < 0)
        {
            err = errno_message("poll");
            return false;
        }
        if (rc == 0)
        {
            // Timeout
            return false;
        }

        char buf[kMaxDatagramBytes];
        sockaddr_in from;
        socklen_t from_len = sizeof(from);
        const ssize_t n = ::recvfrom(fd_, buf, sizeof(buf), 0, reinterpret_cast<sockaddr *>(&from), &from_len);
        if (n < 0)
        {
            err = errno_message("recvfrom");
            return false;
        }

        char addr[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &from.sin_addr, addr, sizeof(addr));

        out.payload.assign(buf, static_cast<size_t>(n));
        out.sender = addr;
        return true;
    }

} // namespace transport
