// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup tcp_socket TCP Sockets
 * @brief Defines and implements TCP stream socket routines.
 * @ingroup network_core
 *
 * @file Socket.h
 * @ingroup tcp_socket
 * @file Socket.cpp
 * @ingroup tcp_socket
 */
#if !defined(__TCP_SOCKET_H__)
#define __TCP_SOCKET_H__

#include "common/Defines.h"
#include "common/Log.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <ctime>

namespace network
{
    namespace tcp
    {
        // ---------------------------------------------------------------------------
        //  Constants
        // ---------------------------------------------------------------------------

        /** @brief Result of readExact() when no byte arrived before the timeout. */
        const ssize_t SOCKET_READ_TIMEOUT = 0;
        /** @brief Result of readExact() on a socket error or peer close. */
        const ssize_t SOCKET_READ_ERROR = -1;
        /** @brief Result of readExact() when the timeout expired after part of the buffer was read. */
        const ssize_t SOCKET_READ_PARTIAL = -2;

        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief Implements a low-level TCP stream socket.
         * @ingroup tcp_socket
         */
        class CPS_SW_API Socket
        {
        public:
            auto operator=(Socket&) -> Socket& = delete;
            auto operator=(Socket&&) -> Socket& = delete;
            Socket(Socket&) = delete;

            /**
             * @brief Initializes a new instance of the Socket class.
             */
            Socket();
            /**
             * @brief Initializes a new instance of the Socket class.
             * @param fd Already connected socket file descriptor.
             */
            Socket(const int fd) noexcept;
            /**
             * @brief Initializes a new instance of the Socket class.
             * @param domain Address family.
             * @param type Socket type.
             * @param protocol Protocol.
             */
            Socket(const int domain, const int type, const int protocol);
            /**
             * @brief Finalizes a instance of the Socket class.
             */
            virtual ~Socket();

            /**
             * @brief Connects the socket to a remote TCP host.
             * @param ipAddr IP address of the remote host.
             * @param port Port number of the remote host.
             * @param timeoutMs Milliseconds to wait for the connection to be established.
             * @returns bool True, if connected, otherwise false.
             */
            virtual bool connect(const std::string& ipAddr, const uint16_t port, uint32_t timeoutMs);

            /**
             * @brief Reads exactly the requested number of bytes from the socket.
             * @param buffer Buffer to read data into.
             * @param length Number of bytes to read.
             * @param timeoutMs Milliseconds to wait for the whole buffer.
             * @returns ssize_t Number of bytes read (always length), SOCKET_READ_TIMEOUT if nothing arrived,
             *  SOCKET_READ_PARTIAL if the timeout expired mid-buffer or SOCKET_READ_ERROR.
             */
            [[nodiscard]] ssize_t readExact(uint8_t* buffer, size_t length, uint32_t timeoutMs) noexcept;
            /**
             * @brief Writes the whole buffer to the socket.
             * @param buffer Buffer containing data to write.
             * @param length Length of data to write.
             * @returns bool True, if every byte was written, otherwise false.
             */
            bool writeAll(const uint8_t* buffer, size_t length) noexcept;

            /**
             * @brief Shuts down both directions of the socket, waking any blocked reader.
             */
            void shutdown() noexcept;
            /**
             * @brief Closes the socket.
             */
            void close() noexcept;
            /**
             * @brief Flag indicating whether the socket is open.
             * @returns bool True, if the socket is open and not shut down, otherwise false.
             */
            bool isOpen() const noexcept;

            /**
             * @brief Gets the remote address this socket was connected to.
             * @returns std::string Remote address.
             */
            std::string getRemoteAddress() const { return m_remoteAddress; }
            /**
             * @brief Gets the remote port this socket was connected to.
             * @returns uint16_t Remote port.
             */
            uint16_t getRemotePort() const { return m_remotePort; }

        protected:
            std::string m_remoteAddress;
            uint16_t m_remotePort;

            int m_fd;
            std::atomic<bool> m_shutdown;

            /**
             * @brief Internal helper to initialize the socket.
             * @param domain Address family.
             * @param type Socket type.
             * @param protocol Protocol.
             * @returns bool True, if socket initialized, otherwise false.
             */
            bool initSocket(const int domain, const int type, const int protocol);

            /**
             * @brief Initialize the sockaddr_in structure with the provided IP and port.
             * @param ipAddr IP address.
             * @param port Port.
             * @param addr sockaddr_in structure.
             * @returns bool True, if the address was parsed, otherwise false.
             */
            static bool initAddr(const std::string& ipAddr, const int port, sockaddr_in& addr);
        };
    } // namespace tcp
} // namespace network

#endif // __TCP_SOCKET_H__
