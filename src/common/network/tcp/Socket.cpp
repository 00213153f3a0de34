// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024 Bryan Biedenkapp, N2PLL
 *
 */
#include "Defines.h"
#include "network/tcp/Socket.h"
#include "Log.h"
#include "StopWatch.h"

using namespace network;
using namespace network::tcp;

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Socket class. */

Socket::Socket() :
    m_remoteAddress(),
    m_remotePort(0U),
    m_fd(-1),
    m_shutdown(false)
{
    /* stub */
}

/* Initializes a new instance of the Socket class. */

Socket::Socket(const int fd) noexcept :
    m_remoteAddress(),
    m_remotePort(0U),
    m_fd(fd),
    m_shutdown(false)
{
    /* stub */
}

/* Initializes a new instance of the Socket class. */

Socket::Socket(const int domain, const int type, const int protocol) : Socket()
{
    initSocket(domain, type, protocol);
}

/* Finalizes a instance of the Socket class. */

Socket::~Socket()
{
    close();
}

/* Connects the socket to a remote TCP host. */

bool Socket::connect(const std::string& ipAddr, const uint16_t port, uint32_t timeoutMs)
{
    if (m_fd < 0)
        return false;

    sockaddr_in addr = {};
    if (!initAddr(ipAddr, port, addr)) {
        LogError(LOG_NET, "Cannot resolve the remote address %s", ipAddr.c_str());
        return false;
    }

    m_remoteAddress = ipAddr;
    m_remotePort = port;

    // connect non-blocking so the attempt can be bounded
    int flags = ::fcntl(m_fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(m_fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        LogError(LOG_NET, "Cannot set the TCP socket non-blocking, err: %d (%s)", errno, strerror(errno));
        return false;
    }

    int ret = ::connect(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        LogError(LOG_NET, "Failed to connect to %s:%u, err: %d (%s)", ipAddr.c_str(), port, errno, strerror(errno));
        return false;
    }

    if (ret < 0) {
        struct pollfd pfd;
        pfd.fd = m_fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        ret = ::poll(&pfd, 1, (int)timeoutMs);
        if (ret <= 0) {
            LogError(LOG_NET, "Timed out connecting to %s:%u", ipAddr.c_str(), port);
            return false;
        }

        int err = 0;
        socklen_t errLen = sizeof(err);
        if (::getsockopt(m_fd, SOL_SOCKET, SO_ERROR, &err, &errLen) < 0 || err != 0) {
            LogError(LOG_NET, "Failed to connect to %s:%u, err: %d (%s)", ipAddr.c_str(), port, err, strerror(err));
            return false;
        }
    }

    if (::fcntl(m_fd, F_SETFL, flags) < 0) {
        LogError(LOG_NET, "Cannot restore the TCP socket flags, err: %d (%s)", errno, strerror(errno));
        return false;
    }

    return true;
}

/* Reads exactly the requested number of bytes from the socket. */

[[nodiscard]] ssize_t Socket::readExact(uint8_t* buffer, size_t length, uint32_t timeoutMs) noexcept
{
    if (buffer == nullptr || length == 0U)
        return SOCKET_READ_ERROR;
    if (m_fd < 0 || m_shutdown)
        return SOCKET_READ_ERROR;

    ulong64_t deadline = StopWatch::now() + timeoutMs;

    size_t offset = 0U;
    while (offset < length) {
        ulong64_t now = StopWatch::now();
        if (now >= deadline)
            return (offset == 0U) ? SOCKET_READ_TIMEOUT : SOCKET_READ_PARTIAL;

        // check that the read() won't block
        struct pollfd pfd;
        pfd.fd = m_fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = ::poll(&pfd, 1, (int)(deadline - now));
        if (ret < 0) {
            if (errno == EINTR)
                continue;

            LogError(LOG_NET, "Error returned from TCP poll, err: %d (%s)", errno, strerror(errno));
            return SOCKET_READ_ERROR;
        }

        if (ret == 0)
            continue;

        if (m_shutdown)
            return SOCKET_READ_ERROR;

        if ((pfd.revents & (POLLIN | POLLHUP | POLLERR)) == 0)
            continue;

        ssize_t len = ::recv(m_fd, buffer + offset, length - offset, 0);
        if (len < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;

            LogError(LOG_NET, "Error returned from recv, err: %d (%s)", errno, strerror(errno));
            return SOCKET_READ_ERROR;
        }

        // orderly shutdown by the peer
        if (len == 0)
            return SOCKET_READ_ERROR;

        offset += (size_t)len;
    }

    return (ssize_t)length;
}

/* Writes the whole buffer to the socket. */

bool Socket::writeAll(const uint8_t* buffer, size_t length) noexcept
{
    if (buffer == nullptr || length == 0U)
        return false;
    if (m_fd < 0 || m_shutdown)
        return false;

    size_t offset = 0U;
    while (offset < length) {
        ssize_t sent = ::send(m_fd, buffer + offset, length - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR)
                continue;

            LogError(LOG_NET, "Error returned from send, err: %d (%s)", errno, strerror(errno));
            return false;
        }

        offset += (size_t)sent;
    }

    return true;
}

/* Shuts down both directions of the socket, waking any blocked reader. */

void Socket::shutdown() noexcept
{
    if (m_fd < 0)
        return;

    m_shutdown = true;
    static_cast<void>(::shutdown(m_fd, SHUT_RDWR));
}

/* Closes the socket. */

void Socket::close() noexcept
{
    if (m_fd < 0)
        return;

    shutdown();
    static_cast<void>(::close(m_fd));
    m_fd = -1;
}

/* Flag indicating whether the socket is open. */

bool Socket::isOpen() const noexcept
{
    return m_fd >= 0 && !m_shutdown;
}

// ---------------------------------------------------------------------------
//  Protected Class Members
// ---------------------------------------------------------------------------

/* Internal helper to initialize the socket. */

bool Socket::initSocket(const int domain, const int type, const int protocol)
{
    m_fd = ::socket(domain, type, protocol);
    if (m_fd < 0) {
        LogError(LOG_NET, "Cannot create the TCP socket, err: %d (%s)", errno, strerror(errno));
        return false;
    }

    return true;
}

/* Initialize the sockaddr_in structure with the provided IP and port. */

bool Socket::initAddr(const std::string& ipAddr, const int port, sockaddr_in& addr)
{
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (::inet_pton(AF_INET, ipAddr.c_str(), &addr.sin_addr) > 0)
        return true;

    // fall back to a host name lookup
    struct addrinfo hints;
    ::memset(&hints, 0x00U, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    if (::getaddrinfo(ipAddr.c_str(), nullptr, &hints, &res) != 0 || res == nullptr)
        return false;

    addr.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    ::freeaddrinfo(res);
    return true;
}
