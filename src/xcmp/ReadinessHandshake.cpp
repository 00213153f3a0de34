// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - XCMP Command Layer
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "common/Defines.h"
#include "common/Log.h"
#include "xcmp/ReadinessHandshake.h"
#include "xcmp/CommandDispatcher.h"

using namespace xcmp;
using namespace xcmp::defines;

#include <chrono>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the ReadinessHandshake class. */

ReadinessHandshake::ReadinessHandshake(CommandDispatcher* dispatcher, xnl::SessionManager* session, bool debug) :
    m_dispatcher(dispatcher),
    m_session(session),
    m_lock(),
    m_cond(),
    m_state(ReadyState::AWAITING_QUERY),
    m_aborted(false),
    m_debug(debug)
{
    /* stub */
}

/* Processes a device initialization status broadcast. */

void ReadinessHandshake::onBroadcast(const xnl::Frame& frame)
{
    const ByteBuffer& payload = frame.getPayload();
    if (payload.size() <= XCMP_DEV_INIT_STATUS_OFFS) {
        LogWarning(LOG_XCMP, "Short device init status broadcast, len = %u", (uint32_t)payload.size());
        return;
    }

    uint8_t initStatus = payload[XCMP_DEV_INIT_STATUS_OFFS];
    if (m_debug) {
        LogDebugEx(LOG_XCMP, "ReadinessHandshake::onBroadcast()", "init status = $%02X, txId = $%04X, state = %u", initStatus, frame.getTxId(), getState());
    }

    switch (initStatus) {
    case InitStatus::STATUS_QUERY:
        {
            // reply mirrors the radio's transaction id
            ByteBuffer reply(XCMP_DEV_INIT_REPLY, XCMP_DEV_INIT_REPLY + sizeof(XCMP_DEV_INIT_REPLY));
            m_dispatcher->sendBroadcast(reply, frame.getTxId());

            std::lock_guard<std::mutex> lock(m_lock);
            if (m_state == ReadyState::AWAITING_QUERY)
                m_state = ReadyState::RESPONDED;

            LogMessage(LOG_XCMP, "Device status query answered, txId = $%04X", frame.getTxId());
        }
        break;

    case InitStatus::TRANSITIONAL:
        LogMessage(LOG_XCMP, "Device initialization in progress");
        break;

    case InitStatus::COMPLETE:
        {
            {
                std::lock_guard<std::mutex> lock(m_lock);
                if (m_state == ReadyState::AWAITING_QUERY) {
                    LogWarning(LOG_XCMP, "Device reported ready before its status query");
                }

                m_state = ReadyState::READY;
            }

            m_session->setState(xnl::defines::SessionState::COMMANDS_ALLOWED);
            LogMessage(LOG_XCMP, "Device ready, commands allowed");
            m_cond.notify_all();
        }
        break;

    default:
        LogWarning(LOG_XCMP, "Unknown device init status $%02X", initStatus);
        break;
    }
}

/* Blocks until the device reports ready. */

bool ReadinessHandshake::waitUntilReady(uint32_t timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_lock);
    m_cond.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
        return m_state == ReadyState::READY || m_aborted;
    });

    return m_state == ReadyState::READY && !m_aborted;
}

/* Flag indicating whether the device reported ready. */

bool ReadinessHandshake::isReady() const
{
    std::lock_guard<std::mutex> lock(m_lock);
    return m_state == ReadyState::READY && !m_aborted;
}

/* Gets the readiness state. */

ReadyState::E ReadinessHandshake::getState() const
{
    std::lock_guard<std::mutex> lock(m_lock);
    return m_state;
}

/* Wakes any waiter; the session has failed. */

void ReadinessHandshake::abort()
{
    {
        std::lock_guard<std::mutex> lock(m_lock);
        m_aborted = true;
    }

    m_cond.notify_all();
}
