// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Test Suite
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "Defines.h"
#include "common/Exception.h"
#include "common/Log.h"
#include "common/network/tcp/TcpClient.h"

#include <catch2/catch_test_macros.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <memory>

/* Helper to read back the send coalescing option of a socket. */

static int noDelay(int fd)
{
    int value = 0;
    socklen_t len = sizeof(value);
    if (::getsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &value, &len) != 0)
        return -1;

    return value;
}

TEST_CASE("TCP Client", "[TCP Client Test]") {
    SECTION("Adopted_NoDelay_Test") {
        bool failed = false;

        INFO("TCP Client Adopted NoDelay Test");

        int listener = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(listener >= 0);

        sockaddr_in addr;
        ::memset(&addr, 0x00U, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0U;

        socklen_t addrLen = sizeof(addr);
        REQUIRE(::bind(listener, (sockaddr*)&addr, sizeof(addr)) == 0);
        REQUIRE(::listen(listener, 1) == 0);
        REQUIRE(::getsockname(listener, (sockaddr*)&addr, &addrLen) == 0);

        int connected = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(connected >= 0);
        REQUIRE(::connect(connected, (sockaddr*)&addr, sizeof(addr)) == 0);

        int accepted = ::accept(listener, nullptr, nullptr);
        REQUIRE(accepted >= 0);
        ::close(listener);

        // plain sockets start with coalescing enabled
        REQUIRE(noDelay(connected) == 0);

        {
            network::tcp::TcpClient client(connected);
            if (noDelay(connected) == 0) {
                ::LogDebug("T", "Adopted_NoDelay_Test, CONNECTED SOCKET NOT NODELAY\n");
                failed = true;
            }

            network::tcp::TcpClient server(accepted);
            if (noDelay(accepted) == 0) {
                ::LogDebug("T", "Adopted_NoDelay_Test, ACCEPTED SOCKET NOT NODELAY\n");
                failed = true;
            }

            uint8_t data[] = { 0x00U, 0x0CU, 0x00U, 0x04U };
            uint8_t received[sizeof(data)];
            if (!client.writeAll(data, sizeof(data)))
                failed = true;
            if (server.readExact(received, sizeof(received), 1000U) != (ssize_t)sizeof(received) || ::memcmp(received, data, sizeof(data)) != 0)
                failed = true;
        }

        REQUIRE(failed==false);
    }

    SECTION("Adopted_Local_Stream_Test") {
        INFO("TCP Client Adopted Local Stream Test");

        int fds[2U] = { -1, -1 };
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

        // local streams carry no TCP options and are still accepted
        std::unique_ptr<network::tcp::TcpClient> left;
        std::unique_ptr<network::tcp::TcpClient> right;
        REQUIRE_NOTHROW(left = std::make_unique<network::tcp::TcpClient>(fds[0U]));
        REQUIRE_NOTHROW(right = std::make_unique<network::tcp::TcpClient>(fds[1U]));

        uint8_t data[] = { 0xB4U, 0x00U };
        uint8_t received[sizeof(data)];
        REQUIRE(left->writeAll(data, sizeof(data)));
        REQUIRE(right->readExact(received, sizeof(received), 1000U) == (ssize_t)sizeof(received));
    }
}
