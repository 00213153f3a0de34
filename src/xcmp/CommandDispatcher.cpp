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
#include "common/StopWatch.h"
#include "common/Utils.h"
#include "xcmp/CommandDispatcher.h"

using namespace xcmp;
using namespace xcmp::defines;

#include <algorithm>
#include <cassert>
#include <chrono>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

const uint32_t READER_POLL_MS = 100U;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the CommandDispatcher class. */

CommandDispatcher::CommandDispatcher(xnl::SessionManager* session, const DispatcherConfig& config, bool debug) :
    m_session(session),
    m_config(config),
    m_readiness(this, session, debug),
    m_thread(nullptr),
    m_running(false),
    m_sendLock(),
    m_slotLock(),
    m_slotFreed(),
    m_slots(),
    m_failed(false),
    m_failType(cps::Exception::TRANSPORT),
    m_failMessage(),
    m_listenerLock(),
    m_listeners(),
    m_nextListenerId(1U),
    m_debug(debug)
{
    assert(session != nullptr);

    if (m_config.pendingSlots == 0U)
        m_config.pendingSlots = 1U;
    if (m_config.retries == 0U)
        m_config.retries = 1U;

    for (uint32_t i = 0U; i < m_config.pendingSlots; i++) {
        std::unique_ptr<PendingSlot> slot = std::make_unique<PendingSlot>();
        slot->inUse = false;
        slot->abandoned = false;
        slot->completed = false;
        slot->txId = 0U;
        slot->opcode = 0U;
        slot->expiresAt = 0U;
        m_slots.push_back(std::move(slot));
    }
}

/* Finalizes a instance of the CommandDispatcher class. */

CommandDispatcher::~CommandDispatcher()
{
    stop();
}

/* Starts the reader thread. */

bool CommandDispatcher::start()
{
    if (m_running)
        return true;

    m_running = true;
    m_thread = std::make_unique<ThreadFunc>("xcmp:reader", [this]() { readerLoop(); });
    if (!m_thread->start()) {
        LogError(LOG_XCMP, "Failed to start the XCMP reader thread");
        m_running = false;
        m_thread.reset();
        return false;
    }

    return true;
}

/* Stops and joins the reader thread. */

void CommandDispatcher::stop()
{
    m_running = false;

    // the reader cannot join itself; a listener stopping the dispatcher leaves the join to the destructor
    if (m_thread != nullptr && !m_thread->isCurrent()) {
        m_thread->wait();
        m_thread.reset();
    }

    // wake any caller still waiting on a reply
    fail(cps::TransportError("Command dispatcher stopped"));
}

/* Sends a command using the configured timeout and retries. */

CommandReply CommandDispatcher::send(uint16_t opcode, const ByteBuffer& payload)
{
    return send(opcode, payload, m_config.timeoutMs, m_config.retries);
}

/* Sends a command and waits for its reply. */

CommandReply CommandDispatcher::send(uint16_t opcode, const ByteBuffer& payload, uint32_t timeoutMs, uint32_t retries)
{
    {
        std::lock_guard<std::mutex> lock(m_slotLock);
        if (m_failed)
            throwFailure();
    }

    if (m_session->isClosed())
        throw cps::TransportError("XNL session is closed");

    if (!m_readiness.isReady()) {
        LogError(LOG_XCMP, "Command $%04X issued before the device reported ready", opcode);
        throw cps::NotReady("Device has not completed its readiness handshake, opcode $" + __INT_HEX_STR(opcode));
    }

    if (retries == 0U)
        retries = 1U;

    ByteBuffer xcmp(XCMP_OPCODE_LEN, 0x00U);
    uint8_t* header = xcmp.data();
    SET_UINT16(opcode, header, 0U);
    xcmp.insert(xcmp.end(), payload.begin(), payload.end());

    for (uint32_t attempt = 1U; attempt <= retries; attempt++) {
        int index = -1;
        uint16_t txId = 0U;
        uint8_t seq = 0U;
        ulong64_t deadline = StopWatch::now() + timeoutMs;

        {
            std::lock_guard<std::mutex> sendLock(m_sendLock);
            {
                std::unique_lock<std::mutex> lock(m_slotLock);
                while (true) {
                    if (m_failed)
                        throwFailure();

                    ulong64_t now = StopWatch::now();
                    reapExpired(now);

                    for (uint32_t i = 0U; i < m_slots.size(); i++) {
                        if (!m_slots[i]->inUse) {
                            index = (int)i;
                            break;
                        }
                    }

                    if (index >= 0 || now >= deadline)
                        break;

                    // every slot holds an abandoned reply; wait for one to expire
                    uint32_t wait = (uint32_t)(deadline - now);
                    m_slotFreed.wait_for(lock, std::chrono::milliseconds(std::min(wait, READER_POLL_MS)));
                }

                if (index < 0) {
                    LogWarning(LOG_XCMP, "No free pending reply slot for opcode $%04X, attempt %u of %u", opcode, attempt, retries);
                    continue;
                }

                txId = m_session->allocateTransactionId([this](uint16_t id) { return findSlot(id) >= 0; });
                seq = m_session->nextSequence();

                PendingSlot* slot = m_slots[index].get();
                slot->inUse = true;
                slot->abandoned = false;
                slot->completed = false;
                slot->txId = txId;
                slot->opcode = opcode;
                slot->expiresAt = 0U;
            }

            xnl::Frame frame = m_session->buildCommandFrame(xcmp, txId, seq);
            if (m_debug) {
                LogDebugEx(LOG_XCMP, "CommandDispatcher::send()", "opcode = $%04X, attempt = %u, %s", opcode, attempt, frame.toString().c_str());
            }

            try {
                m_session->sendFrame(frame);
            }
            catch (const cps::Exception& e) {
                {
                    std::lock_guard<std::mutex> lock(m_slotLock);
                    releaseSlot(index);
                }

                LogError(LOG_XCMP, "Failed to send opcode $%04X, %s", opcode, e.what());
                m_session->close();
                throw;
            }
        }

        std::unique_lock<std::mutex> lock(m_slotLock);
        PendingSlot* slot = m_slots[index].get();
        while (!slot->completed && !m_failed) {
            ulong64_t now = StopWatch::now();
            if (now >= deadline)
                break;

            slot->cond.wait_for(lock, std::chrono::milliseconds(deadline - now));
        }

        if (slot->completed) {
            CommandReply reply = slot->reply;
            releaseSlot(index);
            lock.unlock();

            if (reply.getRequestOpcode() != opcode) {
                LogError(LOG_XCMP, "Reply opcode $%04X does not answer request $%04X, txId = $%04X", reply.getOpcode(), opcode, txId);
                m_session->close();
                throw cps::ProtocolViolation("Reply opcode $" + __INT_HEX_STR(reply.getOpcode()) + " does not answer request $" +
                    __INT_HEX_STR(opcode));
            }

            return reply;
        }

        if (m_failed) {
            releaseSlot(index);
            throwFailure();
        }

        // keep the id reserved so a late reply cannot complete a newer command
        slot->abandoned = true;
        slot->expiresAt = StopWatch::now() + m_config.slotExpiryMs;

        LogWarning(LOG_XCMP, "Timed out waiting for reply to opcode $%04X, txId = $%04X, seq = %u, attempt %u of %u",
            opcode, txId, seq, attempt, retries);
    }

    throw cps::CommandTimeout("No reply to opcode $" + __INT_HEX_STR(opcode) + " after " + std::to_string(retries) + " attempts");
}

/* Sends an uncounted XCMP message to the master. */

void CommandDispatcher::sendBroadcast(const ByteBuffer& xcmp, uint16_t txId)
{
    xnl::Frame frame = m_session->buildDataFrame(xcmp, txId);
    if (m_debug) {
        LogDebugEx(LOG_XCMP, "CommandDispatcher::sendBroadcast()", "%s", frame.toString().c_str());
    }

    m_session->sendFrame(frame);
}

/* Registers a listener for an unsolicited XCMP broadcast. */

uint32_t CommandDispatcher::addBroadcastListener(uint16_t opcode, BroadcastCallback callback)
{
    std::lock_guard<std::mutex> lock(m_listenerLock);
    uint32_t id = m_nextListenerId++;
    m_listeners[id] = std::make_pair(opcode, callback);
    return id;
}

/* Removes a broadcast listener. */

void CommandDispatcher::removeBroadcastListener(uint32_t id)
{
    std::lock_guard<std::mutex> lock(m_listenerLock);
    m_listeners.erase(id);
}

/* Gets the number of pending reply slots currently reserved. */

uint32_t CommandDispatcher::getReservedSlots() const
{
    std::lock_guard<std::mutex> lock(m_slotLock);

    uint32_t count = 0U;
    for (const auto& slot : m_slots) {
        if (slot->inUse)
            count++;
    }

    return count;
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Reader thread main. */

void CommandDispatcher::readerLoop()
{
    LogMessage(LOG_XCMP, "Reader started");

    while (m_running) {
        try {
            xnl::Frame frame;
            if (!m_session->readFrame(frame, READER_POLL_MS)) {
                std::lock_guard<std::mutex> lock(m_slotLock);
                reapExpired(StopWatch::now());
                continue;
            }

            processFrame(frame);
        }
        catch (const cps::Exception& e) {
            if (m_running) {
                LogError(LOG_XCMP, "Reader stopped, %s", e.what());
            }

            fail(e);
            break;
        }
    }

    LogMessage(LOG_XCMP, "Reader stopped");
}

/* Internal helper to route a received frame. */

void CommandDispatcher::processFrame(const xnl::Frame& frame)
{
    if (m_debug) {
        LogDebugEx(LOG_XCMP, "CommandDispatcher::processFrame()", "%s", frame.toString().c_str());
    }

    switch (frame.getOpcode()) {
    case xnl::defines::Opcode::DATA_MSG:
        {
            if (!frame.getXCMP() || frame.getPayloadLength() < XCMP_OPCODE_LEN) {
                LogWarning(LOG_XCMP, "Discarding data message without XCMP payload, %s", frame.toString().c_str());
                return;
            }

            uint16_t opcode = frame.getXCMPOpcode();
            if (opcode == Opcode::DEV_INIT_STATUS_BRDCST) {
                m_readiness.onBroadcast(frame);
                return;
            }

            if ((opcode & XCMP_BRDCST_MASK) == XCMP_BRDCST_PREFIX) {
                dispatchBroadcast(opcode, frame);
                return;
            }

            if ((opcode & XCMP_REPLY_FLAG) != 0U) {
                routeReply(frame);
                return;
            }

            LogWarning(LOG_XCMP, "Discarding unsolicited XCMP request $%04X, txId = $%04X", opcode, frame.getTxId());
        }
        break;

    case xnl::defines::Opcode::DATA_MSG_ACK:
    case xnl::defines::Opcode::DEVICE_CONN_REPLY:
    case xnl::defines::Opcode::DEVICE_SYSMAP_BRDCST:
        if (m_debug) {
            LogDebugEx(LOG_XCMP, "CommandDispatcher::processFrame()", "ignoring XNL opcode $%04X, txId = $%04X", frame.getOpcode(), frame.getTxId());
        }
        break;

    default:
        LogWarning(LOG_XCMP, "Discarding unexpected XNL frame, %s", frame.toString().c_str());
        break;
    }
}

/* Internal helper to complete the pending slot matching a reply. */

void CommandDispatcher::routeReply(const xnl::Frame& frame)
{
    CommandReply reply;
    if (!CommandReply::decode(frame.getPayload(), reply)) {
        LogWarning(LOG_XCMP, "Discarding malformed XCMP reply, %s", frame.toString().c_str());
        return;
    }

    std::lock_guard<std::mutex> lock(m_slotLock);
    int index = findSlot(frame.getTxId());
    if (index < 0) {
        LogWarning(LOG_XCMP, "Discarding reply $%04X with no pending command, txId = $%04X", reply.getOpcode(), frame.getTxId());
        return;
    }

    PendingSlot* slot = m_slots[index].get();
    if (slot->abandoned) {
        LogWarning(LOG_XCMP, "Discarding late reply $%04X, txId = $%04X", reply.getOpcode(), frame.getTxId());
        return;
    }

    if (slot->completed) {
        LogWarning(LOG_XCMP, "Discarding duplicate reply $%04X, txId = $%04X", reply.getOpcode(), frame.getTxId());
        return;
    }

    slot->reply = reply;
    slot->completed = true;
    slot->cond.notify_all();
}

/* Internal helper to hand a broadcast to its listeners. */

void CommandDispatcher::dispatchBroadcast(uint16_t opcode, const xnl::Frame& frame)
{
    std::vector<BroadcastCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_listenerLock);
        for (const auto& entry : m_listeners) {
            if (entry.second.first == opcode)
                callbacks.push_back(entry.second.second);
        }
    }

    if (callbacks.empty()) {
        if (m_debug) {
            LogDebugEx(LOG_XCMP, "CommandDispatcher::dispatchBroadcast()", "no listener for broadcast $%04X", opcode);
        }
        return;
    }

    const ByteBuffer& payload = frame.getPayload();
    ByteBuffer data(payload.begin() + XCMP_OPCODE_LEN, payload.end());
    for (auto& callback : callbacks) {
        callback(opcode, data);
    }
}

/* Internal helper to record a session failure and wake every waiter. */

void CommandDispatcher::fail(const cps::Exception& e)
{
    m_session->close();

    {
        std::lock_guard<std::mutex> lock(m_slotLock);
        if (!m_failed) {
            m_failed = true;
            m_failType = e.type();
            m_failMessage = e.what();
        }

        for (auto& slot : m_slots) {
            slot->cond.notify_all();
        }
    }

    m_slotFreed.notify_all();
    m_readiness.abort();
}

/* Internal helper to rethrow the recorded session failure. */

void CommandDispatcher::throwFailure() const
{
    if (m_failType == cps::Exception::FRAMING)
        throw cps::FramingError(m_failMessage);

    throw cps::TransportError(m_failMessage);
}

/* Internal helper to find a slot reserving the given transaction id. */

int CommandDispatcher::findSlot(uint16_t txId) const
{
    for (uint32_t i = 0U; i < m_slots.size(); i++) {
        if (m_slots[i]->inUse && m_slots[i]->txId == txId)
            return (int)i;
    }

    return -1;
}

/* Internal helper to release abandoned slots past their expiry. */

void CommandDispatcher::reapExpired(ulong64_t now)
{
    bool freed = false;
    for (uint32_t i = 0U; i < m_slots.size(); i++) {
        PendingSlot* slot = m_slots[i].get();
        if (slot->inUse && slot->abandoned && now >= slot->expiresAt) {
            if (m_debug) {
                LogDebugEx(LOG_XCMP, "CommandDispatcher::reapExpired()", "releasing abandoned txId = $%04X", slot->txId);
            }

            releaseSlot((int)i);
            freed = true;
        }
    }

    if (freed)
        m_slotFreed.notify_all();
}

/* Internal helper to release a slot. */

void CommandDispatcher::releaseSlot(int index)
{
    PendingSlot* slot = m_slots[index].get();
    slot->inUse = false;
    slot->abandoned = false;
    slot->completed = false;
    slot->txId = 0U;
    slot->opcode = 0U;
    slot->expiresAt = 0U;
    slot->reply = CommandReply();
}
