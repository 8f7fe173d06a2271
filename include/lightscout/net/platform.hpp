/**
 * @file platform.hpp
 * @brief Cross-platform socket type definitions and includes.
 *
 * Abstracts Windows Winsock2 and POSIX socket APIs into a common interface
 * used by the UDP socket wrapper.
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#pragma once

#include <string>

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>

    #pragma comment(lib, "Ws2_32.lib")

    namespace lightscout {
    namespace net {
        using SocketHandle = SOCKET;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;

        inline int getLastSocketError() { return WSAGetLastError(); }
        inline void closeSocket(SocketHandle s) { ::closesocket(s); }

        inline bool isAddressInUse(int error) { return error == WSAEADDRINUSE; }

        inline std::string socketErrorString(int error) {
            return "WSA error " + std::to_string(error);
        }

        // Initialize Winsock (call once at startup)
        inline bool initializeSockets() {
            WSADATA wsaData;
            return WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
        }

        inline void cleanupSockets() {
            WSACleanup();
        }
    }  // namespace net
    }  // namespace lightscout

#else
    #include <arpa/inet.h>
    #include <errno.h>
    #include <netinet/in.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>

    #include <cstring>

    namespace lightscout {
    namespace net {
        using SocketHandle = int;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

        inline int getLastSocketError() { return errno; }
        inline void closeSocket(SocketHandle s) { ::close(s); }

        inline bool isAddressInUse(int error) { return error == EADDRINUSE; }

        inline std::string socketErrorString(int error) {
            return std::string(std::strerror(error)) + " (" + std::to_string(error) + ")";
        }

        // No initialization needed on POSIX
        inline bool initializeSockets() { return true; }
        inline void cleanupSockets() {}
    }  // namespace net
    }  // namespace lightscout

#endif

namespace lightscout {
namespace net {

/**
 * @brief RAII helper for socket initialization.
 *
 * Create one instance at program startup to ensure
 * proper Winsock initialization on Windows.
 */
class SocketInitializer {
public:
    SocketInitializer() : initialized_(initializeSockets()) {}
    ~SocketInitializer() { if (initialized_) cleanupSockets(); }

    bool isInitialized() const { return initialized_; }

    SocketInitializer(const SocketInitializer&) = delete;
    SocketInitializer& operator=(const SocketInitializer&) = delete;

private:
    bool initialized_;
};

}  // namespace net
}  // namespace lightscout
