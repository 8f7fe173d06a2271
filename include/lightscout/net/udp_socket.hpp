/**
 * @file udp_socket.hpp
 * @brief Cross-platform IPv4 UDP socket used for bulb discovery.
 *
 * Provides a RAII wrapper around a datagram socket with broadcast
 * support and timeout-based receive. The socket is opened on
 * construction and released on destruction or close().
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#pragma once

#include "lightscout/net/export.hpp"
#include "lightscout/net/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace lightscout {
namespace net {

/**
 * @struct SocketAddress
 * @brief IP address and port pair.
 */
struct LIGHTSCOUT_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
    bool operator!=(const SocketAddress& other) const { return !(*this == other); }
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.bind(1982);
 * sock.setBroadcast(true);
 * sock.sendTo(SocketAddress("239.255.255.250", 1982), probe.data(), probe.size());
 *
 * std::vector<char> buffer(65535);
 * SocketAddress sender;
 * int received = sock.receiveFrom(buffer.data(), buffer.size(), 100, sender);
 * @endcode
 */
class LIGHTSCOUT_NET_API UdpSocket {
public:
    /**
     * @brief Create an unbound UDP socket.
     */
    UdpSocket();

    /**
     * @brief Destructor - closes the socket.
     */
    ~UdpSocket();

    // Non-copyable, but movable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    /**
     * @brief Check if the socket is valid/open.
     */
    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for auto-assign).
     * @param address The local address to bind to (empty or "0.0.0.0" = any).
     * @return True on success.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Get the local port the socket is bound to (0 if unbound).
     */
    uint16_t getLocalPort() const;

    /**
     * @brief Enable broadcast sending (SO_BROADCAST).
     */
    bool setBroadcast(bool enable);

    /**
     * @brief Send a datagram.
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive a datagram with timeout.
     * @param buffer Buffer to receive into.
     * @param bufferSize Size of the buffer.
     * @param timeoutMs Timeout in milliseconds (0 = poll, -1 = infinite).
     * @param sender Output: address of the sender.
     * @return Number of bytes received, 0 on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    /**
     * @brief Close the socket. Safe to call repeatedly.
     */
    void close();

    /**
     * @brief Get the last socket error code.
     */
    int getLastError() const { return lastError_; }

    std::string getLastErrorString() const { return socketErrorString(lastError_); }

private:
    SocketHandle socket_;
    int lastError_;

    void setLastError();
};

}  // namespace net
}  // namespace lightscout
