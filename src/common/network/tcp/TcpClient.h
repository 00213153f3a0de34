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
 * @file TcpClient.h
 * @ingroup tcp_socket
 */
#if !defined(__TCP_CLIENT_H__)
#define __TCP_CLIENT_H__

#include "common/Defines.h"
#include "common/network/tcp/Socket.h"
#include "common/Exception.h"
#include "common/Log.h"

#include <cerrno>
#include <cstring>

namespace network
{
    namespace tcp
    {
        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief Implements a TCP client stream used as the radio transport.
         * @ingroup tcp_socket
         *
         * Send coalescing (Nagle) is always disabled, on created and adopted sockets alike. XNL
         * frames are small and the radio is sensitive to their timing.
         */
        class CPS_SW_API TcpClient : public Socket
        {
        public:
            auto operator=(TcpClient&) -> TcpClient& = delete;
            auto operator=(TcpClient&&) -> TcpClient& = delete;
            TcpClient(TcpClient&) = delete;

            /**
             * @brief Initializes a new instance of the TcpClient class.
             */
            TcpClient() noexcept(false) : Socket(AF_INET, SOCK_STREAM, 0)
            {
                init(false);
            }
            /**
             * @brief Initializes a new instance of the TcpClient class around an already connected stream.
             * @param fd Connected stream file descriptor (a TCP socket or one end of a socketpair).
             */
            explicit TcpClient(const int fd) noexcept(false) : Socket(fd)
            {
                init(true);
            }
            /**
             * @brief Initializes a new instance of the TcpClient class and connects it.
             * @param address Remote address.
             * @param port Remote port.
             * @param timeoutMs Milliseconds to wait for the connection.
             */
            TcpClient(const std::string& address, const uint16_t port, uint32_t timeoutMs) noexcept(false) : TcpClient()
            {
                if (address.empty() || port == 0U)
                    throw cps::TransportError("Invalid remote address or port");

                if (!connect(address, port, timeoutMs)) {
                    throw cps::TransportError("Failed to connect to " + address + ":" + std::to_string(port));
                }

                LogMessage(LOG_NET, "Connected to %s:%u", address.c_str(), port);
            }

        protected:
            /**
             * @brief Internal helper to configure the stream for low-latency delivery.
             * @param adopted Flag indicating the descriptor was handed in, and may be a non-TCP stream.
             */
            void init(bool adopted) noexcept(false)
            {
                if (m_fd < 0)
                    throw cps::TransportError("Cannot create the TCP socket");

                int nodelay = 1;
                if (::setsockopt(m_fd, IPPROTO_TCP, TCP_NODELAY, (char*)& nodelay, sizeof(nodelay)) != 0) {
                    // local stream sockets have no TCP options
                    if (adopted && (errno == EOPNOTSUPP || errno == ENOPROTOOPT))
                        return;

                    LogError(LOG_NET, "Cannot set the TCP socket option, err: %d (%s)", errno, strerror(errno));
                    throw cps::TransportError("Cannot set the TCP socket option");
                }
            }
        };
    } // namespace tcp
} // namespace network

#endif // __TCP_CLIENT_H__
