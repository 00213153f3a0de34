// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - XCMP Command Layer
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @file CommandDispatcher.h
 * @ingroup xcmp
 * @file CommandDispatcher.cpp
 * @ingroup xcmp
 */
#if !defined(__XCMP_COMMAND_DISPATCHER_H__)
#define __XCMP_COMMAND_DISPATCHER_H__

#include "common/Defines.h"
#include "common/Exception.h"
#include "common/ThreadFunc.h"
#include "xcmp/XCMPDefines.h"
#include "xcmp/CommandReply.h"
#include "xcmp/ReadinessHandshake.h"
#include "xnl/Frame.h"
#include "xnl/SessionManager.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace xcmp
{
    // ---------------------------------------------------------------------------
    //  Structure Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Command dispatcher timing and sizing.
     * @ingroup xcmp
     */
    struct DispatcherConfig {
    public:
        /**
         * @brief Initializes a new instance of the DispatcherConfig struct.
         */
        DispatcherConfig() :
            timeoutMs(DEFAULT_COMMAND_TIMEOUT_MS),
            retries(DEFAULT_COMMAND_RETRIES),
            pendingSlots(16U),
            slotExpiryMs(DEFAULT_COMMAND_TIMEOUT_MS * 2U)
        {
            /* stub */
        }

        uint32_t timeoutMs;         //! Per attempt reply timeout.
        uint32_t retries;           //! Attempts per command.
        uint32_t pendingSlots;      //! Size of the pending reply arena.
        uint32_t slotExpiryMs;      //! Lifetime of an abandoned slot.
    };

    /**
     * @brief Callback for unsolicited XCMP broadcasts.
     *  Invoked on the reader thread with the broadcast opcode and the bytes following it.
     */
    typedef std::function<void(uint16_t opcode, const ByteBuffer& data)> BroadcastCallback;

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Sends XCMP commands and correlates their replies by transaction id.
     * @ingroup xcmp
     *
     * A single reader thread decodes every inbound frame and routes it to the readiness
     * handshake, to broadcast listeners or to the pending reply arena. Senders are
     * serialized only while the transaction id and sequence are allocated and the frame
     * is written; waiting for the reply happens outside of the send lock.
     */
    class CPS_SW_API CommandDispatcher {
    public:
        /**
         * @brief Initializes a new instance of the CommandDispatcher class.
         * @param session Authenticated XNL session.
         * @param config Dispatcher configuration.
         * @param debug Flag indicating whether debug logging is enabled.
         */
        CommandDispatcher(xnl::SessionManager* session, const DispatcherConfig& config, bool debug = false);
        /**
         * @brief Finalizes a instance of the CommandDispatcher class.
         */
        ~CommandDispatcher();

        /**
         * @brief Starts the reader thread.
         * @returns bool True, if the reader thread started, otherwise false.
         */
        bool start();
        /**
         * @brief Stops and joins the reader thread, then closes the session.
         */
        void stop();
        /**
         * @brief Flag indicating whether the reader thread is running.
         * @returns bool True, if running, otherwise false.
         */
        bool isRunning() const { return m_running; }

        /**
         * @brief Sends a command using the configured timeout and retries.
         * @param opcode XCMP request opcode.
         * @param payload Command bytes following the opcode.
         * @returns CommandReply Matching reply.
         */
        CommandReply send(uint16_t opcode, const ByteBuffer& payload);
        /**
         * @brief Sends a command and waits for its reply.
         * @param opcode XCMP request opcode.
         * @param payload Command bytes following the opcode.
         * @param timeoutMs Milliseconds to wait for each attempt.
         * @param retries Number of attempts.
         * @returns CommandReply Matching reply.
         * @throws cps::NotReady if the device has not reported ready.
         * @throws cps::CommandTimeout if no attempt was answered.
         * @throws cps::ProtocolViolation if the reply opcode does not answer the request.
         * @throws cps::TransportError / cps::FramingError if the session failed.
         */
        CommandReply send(uint16_t opcode, const ByteBuffer& payload, uint32_t timeoutMs, uint32_t retries);

        /**
         * @brief Sends an uncounted XCMP message to the master.
         * @param xcmp XCMP payload, including the opcode.
         * @param txId Transaction id to use.
         */
        void sendBroadcast(const ByteBuffer& xcmp, uint16_t txId);

        /**
         * @brief Registers a listener for an unsolicited XCMP broadcast.
         * @param opcode Broadcast opcode.
         * @param callback Listener.
         * @returns uint32_t Listener id.
         */
        uint32_t addBroadcastListener(uint16_t opcode, BroadcastCallback callback);
        /**
         * @brief Removes a broadcast listener.
         * @param id Listener id.
         */
        void removeBroadcastListener(uint32_t id);

        /**
         * @brief Gets the readiness handshake controller.
         * @returns ReadinessHandshake* Readiness handshake controller.
         */
        ReadinessHandshake* getReadiness() { return &m_readiness; }
        /**
         * @brief Gets the XNL session.
         * @returns xnl::SessionManager* XNL session.
         */
        xnl::SessionManager* getSession() const { return m_session; }
        /**
         * @brief Gets the dispatcher configuration.
         * @returns const DispatcherConfig& Dispatcher configuration.
         */
        const DispatcherConfig& getConfig() const { return m_config; }

        /**
         * @brief Gets the number of pending reply slots currently reserved.
         * @returns uint32_t Reserved slots.
         */
        uint32_t getReservedSlots() const;

    private:
        /**
         * @brief Represents a reserved pending reply.
         */
        struct PendingSlot {
            bool inUse;
            bool abandoned;
            bool completed;
            uint16_t txId;
            uint16_t opcode;
            ulong64_t expiresAt;
            CommandReply reply;
            std::condition_variable cond;
        };

        xnl::SessionManager* m_session;
        DispatcherConfig m_config;

        ReadinessHandshake m_readiness;

        std::unique_ptr<ThreadFunc> m_thread;
        std::atomic<bool> m_running;

        std::mutex m_sendLock;

        mutable std::mutex m_slotLock;
        std::condition_variable m_slotFreed;
        std::vector<std::unique_ptr<PendingSlot>> m_slots;

        bool m_failed;
        cps::Exception::eType m_failType;
        std::string m_failMessage;

        std::mutex m_listenerLock;
        std::map<uint32_t, std::pair<uint16_t, BroadcastCallback>> m_listeners;
        uint32_t m_nextListenerId;

        bool m_debug;

        /**
         * @brief Reader thread main.
         */
        void readerLoop();
        /**
         * @brief Internal helper to route a received frame.
         * @param frame Received frame.
         */
        void processFrame(const xnl::Frame& frame);
        /**
         * @brief Internal helper to complete the pending slot matching a reply.
         * @param frame Data message carrying a reply.
         */
        void routeReply(const xnl::Frame& frame);
        /**
         * @brief Internal helper to hand a broadcast to its listeners.
         * @param opcode Broadcast opcode.
         * @param frame Data message carrying the broadcast.
         */
        void dispatchBroadcast(uint16_t opcode, const xnl::Frame& frame);

        /**
         * @brief Internal helper to record a session failure and wake every waiter.
         * @param e Failure.
         */
        void fail(const cps::Exception& e);
        /**
         * @brief Internal helper to rethrow the recorded session failure.
         */
        [[noreturn]] void throwFailure() const;

        /**
         * @brief Internal helper to find a slot reserving the given transaction id. Caller holds the slot lock.
         * @param txId Transaction id.
         * @returns int Slot index, or -1.
         */
        int findSlot(uint16_t txId) const;
        /**
         * @brief Internal helper to release abandoned slots past their expiry. Caller holds the slot lock.
         * @param now Current monotonic time.
         */
        void reapExpired(ulong64_t now);
        /**
         * @brief Internal helper to release a slot. Caller holds the slot lock.
         * @param index Slot index.
         */
        void releaseSlot(int index);
    };
} // namespace xcmp

#endif // __XCMP_COMMAND_DISPATCHER_H__
