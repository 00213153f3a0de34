// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - XNL Session Layer
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "common/Defines.h"
#include "common/Exception.h"
#include "common/Log.h"
#include "common/StopWatch.h"
#include "common/Timer.h"
#include "common/Utils.h"
#include "xnl/SessionManager.h"

using namespace xnl;
using namespace xnl::defines;
using namespace network::tcp;

#include <algorithm>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

const uint32_t AUTH_POLL_MS = 100U;
const uint32_t MAX_UNEXPECTED_FRAMES = 1U;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the SessionManager class. */

SessionManager::SessionManager(TcpClient* channel, bool debug) :
    m_channel(channel),
    m_reader(channel, debug),
    m_tea(),
    m_lock(),
    m_writeLock(),
    m_state(SessionState::CONNECTING),
    m_nextSequence(1U),
    m_nextTxSeq(1U),
    m_tempPrefix(0U),
    m_debug(debug),
    m_localAddress(0U),
    m_peerAddress(0U),
    m_sessionPrefix(0U)
{
    /* stub */
}

/* Finalizes a instance of the SessionManager class. */

SessionManager::~SessionManager() = default;

/* Runs the authentication handshake on the calling thread. */

void SessionManager::authenticate(uint32_t timeoutMs)
{
    if (getState() != SessionState::CONNECTING) {
        throw cps::ProtocolViolation("Session has already been authenticated or closed");
    }

    Timer timeoutTimer(timeoutMs);
    timeoutTimer.start();
    StopWatch stopWatch;

    uint32_t unexpected = 0U;
    SessionState::E lastState = SessionState::CONNECTING;

    while (getState() != SessionState::HANDSHAKE_READY) {
        timeoutTimer.clock(stopWatch.elapsed());
        stopWatch.start();

        if (timeoutTimer.hasExpired()) {
            LogError(LOG_XNL, "Authentication timed out in state %u", getState());
            close();
            throw cps::CommandTimeout("Timed out waiting for XNL authentication");
        }

        uint32_t slice = AUTH_POLL_MS;
        if (timeoutTimer.isRunning())
            slice = std::min(AUTH_POLL_MS, std::max(1U, timeoutTimer.getRemaining()));

        Frame frame;
        bool ret = false;
        try {
            ret = m_reader.read(frame, slice);
        }
        catch (const cps::Exception& e) {
            LogError(LOG_XNL, "Authentication aborted, %s", e.what());
            close();
            throw;
        }

        if (!ret)
            continue;

        if (m_debug) {
            LogDebugEx(LOG_XNL, "SessionManager::authenticate()", "state = %u, %s", getState(), frame.toString().c_str());
        }

        bool advanced = processAuthFrame(frame);
        if (getState() != lastState) {
            lastState = getState();
            unexpected = 0U;
            continue;
        }

        if (!advanced) {
            unexpected++;
            LogWarning(LOG_XNL, "Unexpected XNL frame during authentication, state = %u, opcode = $%04X", getState(), frame.getOpcode());

            if (unexpected > MAX_UNEXPECTED_FRAMES) {
                close();
                throw cps::ProtocolViolation("Peer strayed from the XNL authentication sequence, opcode $" +
                    __INT_HEX_STR(frame.getOpcode()));
            }
        }
    }

    LogMessage(LOG_XNL, "Authenticated, local address = $%04X, master address = $%04X, session prefix = $%02X",
        m_localAddress, m_peerAddress, m_sessionPrefix);
}

/* Reads the next frame from the transport. */

bool SessionManager::readFrame(Frame& frame, uint32_t timeoutMs)
{
    return m_reader.read(frame, timeoutMs);
}

/* Writes a frame to the transport. */

void SessionManager::sendFrame(const Frame& frame)
{
    if (isClosed())
        throw cps::TransportError("Session is closed");

    std::lock_guard<std::mutex> lock(m_writeLock);
    m_reader.write(frame);
}

/* Allocates the next command sequence number. */

uint8_t SessionManager::nextSequence()
{
    std::lock_guard<std::mutex> lock(m_lock);
    uint8_t seq = m_nextSequence;
    m_nextSequence = (uint8_t)(m_nextSequence + 1U);
    return seq;
}

/* Allocates the next transaction id. */

uint16_t SessionManager::allocateTransactionId(const std::function<bool(uint16_t)>& isReserved)
{
    std::lock_guard<std::mutex> lock(m_lock);

    // at most one full lap of the transaction sequence space
    for (uint32_t i = 0U; i < 256U; i++) {
        uint16_t txId = (uint16_t)((m_sessionPrefix << 8) | m_nextTxSeq);
        m_nextTxSeq = (uint8_t)(m_nextTxSeq + 1U);

        if (isReserved == nullptr || !isReserved(txId))
            return txId;

        if (m_debug) {
            LogDebugEx(LOG_XNL, "SessionManager::allocateTransactionId()", "skipping reserved txId = $%04X", txId);
        }
    }

    throw cps::ProtocolViolation("No free XNL transaction ids");
}

/* Builds a counted XCMP command frame addressed to the master. */

Frame SessionManager::buildCommandFrame(const ByteBuffer& xcmp, uint16_t txId, uint8_t seq) const
{
    Frame frame(Opcode::DATA_MSG, m_peerAddress, m_localAddress, txId, xcmp);
    frame.setXCMP(true);
    frame.setSequence(seq);
    return frame;
}

/* Builds an uncounted XCMP frame addressed to the master. */

Frame SessionManager::buildDataFrame(const ByteBuffer& xcmp, uint16_t txId) const
{
    Frame frame(Opcode::DATA_MSG, m_peerAddress, m_localAddress, txId, xcmp);
    frame.setXCMP(true);
    frame.setSequence(0U);
    return frame;
}

/* Gets the session state. */

SessionState::E SessionManager::getState() const
{
    std::lock_guard<std::mutex> lock(m_lock);
    return m_state;
}

/* Sets the session state. */

void SessionManager::setState(SessionState::E state)
{
    std::lock_guard<std::mutex> lock(m_lock);
    if (m_state == SessionState::CLOSED)
        return;

    m_state = state;
}

/* Closes the session and shuts down the transport. */

void SessionManager::close()
{
    {
        std::lock_guard<std::mutex> lock(m_lock);
        if (m_state == SessionState::CLOSED)
            return;
        m_state = SessionState::CLOSED;
    }

    if (m_channel != nullptr)
        m_channel->shutdown();

    LogMessage(LOG_XNL, "Session closed");
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to handle a frame received while authenticating. */

bool SessionManager::processAuthFrame(const Frame& frame)
{
    const ByteBuffer& payload = frame.getPayload();

    if (frame.getOpcode() == Opcode::DEVICE_CONN_REPLY && getState() != SessionState::CONNECTING) {
        LogMessage(LOG_XNL, "Device connection reply, src = $%04X, len = %u", frame.getSrc(), frame.getPayloadLength());
        return true;
    }

    switch (getState()) {
    case SessionState::CONNECTING:
        {
            if (frame.getOpcode() != Opcode::MASTER_STATUS_BRDCST)
                return false;

            // master address is the broadcast's source
            m_peerAddress = frame.getSrc();
            LogMessage(LOG_XNL, "Master status broadcast, master address = $%04X", m_peerAddress);

            writeMasterQuery();
            setState(SessionState::AUTHENTICATING);
            return true;
        }

    case SessionState::AUTHENTICATING:
        {
            if (frame.getOpcode() == Opcode::DEVICE_SYSMAP_BRDCST) {
                if (payload.size() < XNL_SYSMAP_PAYLOAD_LEN || payload[0U] != XNL_SYSMAP_MARKER) {
                    LogWarning(LOG_XNL, "Malformed system map broadcast, len = %u", (uint32_t)payload.size());
                    return false;
                }

                m_tempPrefix = payload[1U];
                LogMessage(LOG_XNL, "System map broadcast, temporary prefix = $%02X", m_tempPrefix);

                writeAuthKey(payload.data() + 2U);
                return true;
            }

            if (frame.getOpcode() == Opcode::DEVICE_AUTH_KEY_REPLY) {
                if (payload.size() < XNL_AUTH_REPLY_MIN_LEN) {
                    close();
                    throw cps::AuthenticationFailed("Truncated authentication key reply");
                }

                uint8_t result = payload[0U];
                if (result != XNL_AUTH_RESULT_SUCCESS) {
                    LogError(LOG_XNL, "Authentication rejected, result = $%02X", result);
                    close();
                    throw cps::AuthenticationFailed("Authentication rejected by radio, result $" + __INT_HEX_STR(result, 2U));
                }

                const uint8_t* data = payload.data();
                {
                    std::lock_guard<std::mutex> lock(m_lock);
                    m_sessionPrefix = data[1U];
                    m_localAddress = GET_UINT16(data, 2U);
                    m_nextSequence = 1U;
                    m_nextTxSeq = 1U;
                }

                setState(SessionState::HANDSHAKE_READY);
                return true;
            }

            return false;
        }

    default:
        return false;
    }
}

/* Internal helper to send the device master query. */

void SessionManager::writeMasterQuery()
{
    Frame frame(Opcode::DEVICE_MASTER_QUERY, XNL_QUERY_ADDRESS, 0x0000U, 0x0000U, ByteBuffer());
    m_reader.write(frame);
}

/* Internal helper to send the device authentication key. */

void SessionManager::writeAuthKey(const uint8_t* seed)
{
    uint8_t encrypted[XNL_AUTH_SEED_LEN];
    m_tea.encryptBlock(seed, encrypted);

    if (m_debug) {
        Utils::dump(1U, "XNL auth seed", seed, XNL_AUTH_SEED_LEN);
        Utils::dump(1U, "XNL auth key", encrypted, XNL_AUTH_SEED_LEN);
    }

    ByteBuffer payload(XNL_AUTH_KEY_PREAMBLE, XNL_AUTH_KEY_PREAMBLE + sizeof(XNL_AUTH_KEY_PREAMBLE));
    payload.insert(payload.end(), encrypted, encrypted + XNL_AUTH_SEED_LEN);

    Frame frame(Opcode::DEVICE_AUTH_KEY, m_peerAddress, (uint16_t)(XNL_TEMP_ADDRESS_BASE | m_tempPrefix), 0x0000U, payload);
    frame.setSequence(XNL_AUTH_KEY_FLAGS);
    m_reader.write(frame);
}
