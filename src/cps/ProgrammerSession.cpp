// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Codeplug Access
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "common/Defines.h"
#include "common/Log.h"
#include "cps/ProgrammerSession.h"

using namespace cps;
using namespace network::tcp;

#include <cassert>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the ProgrammerSession class. */

ProgrammerSession::ProgrammerSession(std::unique_ptr<TcpClient> channel, const xcmp::DispatcherConfig& config, bool debug) :
    m_channel(std::move(channel)),
    m_session(nullptr),
    m_dispatcher(nullptr),
    m_reader(nullptr),
    m_writer(nullptr),
    m_opLock(),
    m_closeLock(),
    m_closed(false),
    m_debug(debug)
{
    assert(m_channel != nullptr);

    m_session = std::make_unique<xnl::SessionManager>(m_channel.get(), debug);
    m_dispatcher = std::make_unique<xcmp::CommandDispatcher>(m_session.get(), config, debug);
    m_reader = std::make_unique<CodeplugReader>(m_dispatcher.get(), debug);
    m_writer = std::make_unique<CodeplugWriter>(m_dispatcher.get(), debug);
}

/* Finalizes a instance of the ProgrammerSession class. */

ProgrammerSession::~ProgrammerSession()
{
    close();
}

/* Connects to a radio. */

std::unique_ptr<ProgrammerSession> ProgrammerSession::connect(const std::string& address, uint16_t port, const xcmp::DispatcherConfig& config,
    bool debug)
{
    LogMessage(LOG_CPS, "Connecting to %s:%u", address.c_str(), port);

    std::unique_ptr<TcpClient> channel = std::make_unique<TcpClient>(address, port, config.timeoutMs);
    return std::make_unique<ProgrammerSession>(std::move(channel), config, debug);
}

/* Authenticates and waits for the radio to report ready. */

void ProgrammerSession::authenticate(uint32_t authTimeoutMs, uint32_t readyTimeoutMs)
{
    std::lock_guard<std::mutex> lock(m_opLock);
    if (isClosed())
        throw TransportError("Programming session is closed");

    try {
        m_session->authenticate(authTimeoutMs);

        if (!m_dispatcher->start()) {
            throw TransportError("Failed to start the command dispatcher");
        }

        if (!m_dispatcher->getReadiness()->waitUntilReady(readyTimeoutMs)) {
            LogError(LOG_CPS, "Radio did not report ready within %u ms", readyTimeoutMs);
            close();
            throw NotReady("Radio did not complete its readiness handshake");
        }
    }
    catch (const Exception& e) {
        onError(e);
        throw;
    }

    LogMessage(LOG_CPS, "Programming session ready, local address $%04X", m_session->getLocalAddress());
}

/* Queries the radio identity. */

RadioIdentity ProgrammerSession::identify()
{
    std::lock_guard<std::mutex> lock(m_opLock);
    try {
        IdentityQuery query(m_dispatcher.get());
        return query.query();
    }
    catch (const Exception& e) {
        onError(e);
        throw;
    }
}

/* Discovers the records available on the radio. */

std::vector<RecordDescriptor> ProgrammerSession::listRecords()
{
    std::lock_guard<std::mutex> lock(m_opLock);
    try {
        std::vector<uint16_t> ids = m_reader->listAvailableRecords();

        std::vector<RecordDescriptor> records;
        for (uint16_t id : ids) {
            records.push_back(RecordDescriptor(id));
        }

        return records;
    }
    catch (const Exception& e) {
        onError(e);
        throw;
    }
}

/* Reads records. */

RecordMap ProgrammerSession::readRecords(const std::vector<RecordDescriptor>& records, ReadProgressCallback progress)
{
    std::lock_guard<std::mutex> lock(m_opLock);
    try {
        return m_reader->readRecords(records, xcmp::defines::MAX_READ_BATCH, progress);
    }
    catch (const Exception& e) {
        onError(e);
        throw;
    }
}

/* Writes a codeplug image. */

void ProgrammerSession::writeCodeplug(const ByteBuffer& data, WriteProgressCallback progress, const WriteOptions& options)
{
    std::lock_guard<std::mutex> lock(m_opLock);
    try {
        m_writer->write(data, options, progress);
    }
    catch (const Exception& e) {
        onError(e);
        throw;
    }
}

/* Closes the session. */

void ProgrammerSession::close()
{
    std::lock_guard<std::mutex> lock(m_closeLock);
    if (m_closed)
        return;

    m_closed = true;

    if (m_dispatcher != nullptr)
        m_dispatcher->stop();
    if (m_session != nullptr)
        m_session->close();
    if (m_channel != nullptr)
        m_channel->close();

    LogMessage(LOG_CPS, "Programming session closed");
}

/* Flag indicating whether the session is closed. */

bool ProgrammerSession::isClosed() const
{
    return m_session == nullptr || m_session->isClosed();
}

/* Flag indicating whether the radio has reported ready. */

bool ProgrammerSession::isReady() const
{
    return !isClosed() && m_dispatcher->getReadiness()->isReady();
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to close the session if the error leaves it unusable. */

void ProgrammerSession::onError(const Exception& e)
{
    LogError(LOG_CPS, "%s", e.what());

    if (e.isFatal())
        close();
}
