// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - XNL Session Layer
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @file SessionManager.h
 * @ingroup xnl
 * @file SessionManager.cpp
 * @ingroup xnl
 */
#if !defined(__XNL_SESSION_MANAGER_H__)
#define __XNL_SESSION_MANAGER_H__

#include "common/Defines.h"
#include "common/TEACrypto.h"
#include "common/network/tcp/TcpClient.h"
#include "xnl/XNLDefines.h"
#include "xnl/Frame.h"
#include "xnl/FrameReader.h"

#include <functional>
#include <mutex>

namespace xnl
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Drives XNL authentication and owns the session addressing state and counters.
     * @ingroup xnl
     *
     * The session counters (message sequence and transaction sequence) are only ever
     * advanced through this class; callers request the next value and never hold
     * their own copies.
     */
    class CPS_SW_API SessionManager {
    public:
        /**
         * @brief Initializes a new instance of the SessionManager class.
         * @param channel Connected transport.
         * @param debug Flag indicating whether debug logging and frame dumps are enabled.
         */
        SessionManager(network::tcp::TcpClient* channel, bool debug = false);
        /**
         * @brief Finalizes a instance of the SessionManager class.
         */
        ~SessionManager();

        /**
         * @brief Runs the authentication handshake on the calling thread.
         * @param timeoutMs Milliseconds allowed for the whole handshake.
         * @throws cps::AuthenticationFailed if the peer rejects the key.
         * @throws cps::ProtocolViolation if the peer strays from the handshake.
         * @throws cps::CommandTimeout if the handshake does not complete in time.
         * @throws cps::TransportError / cps::FramingError on transport or framing failure.
         */
        void authenticate(uint32_t timeoutMs);

        /**
         * @brief Reads the next frame from the transport.
         * @param[out] frame Decoded frame.
         * @param timeoutMs Milliseconds to wait for a frame.
         * @returns bool True, if a frame was read, otherwise false.
         */
        bool readFrame(Frame& frame, uint32_t timeoutMs);
        /**
         * @brief Writes a frame to the transport. Whole frames are never interleaved.
         * @param frame Frame to write.
         */
        void sendFrame(const Frame& frame);

        /**
         * @brief Allocates the next command sequence number.
         * @returns uint8_t Sequence for the next command frame.
         */
        uint8_t nextSequence();
        /**
         * @brief Allocates the next transaction id.
         * @param isReserved Optional predicate reporting ids that must not be handed out.
         * @returns uint16_t Transaction id ((session prefix << 8) | transaction sequence).
         */
        uint16_t allocateTransactionId(const std::function<bool(uint16_t)>& isReserved = nullptr);

        /**
         * @brief Builds a counted XCMP command frame addressed to the master.
         * @param xcmp XCMP payload.
         * @param txId Transaction id.
         * @param seq Command sequence.
         * @returns Frame Data message frame.
         */
        Frame buildCommandFrame(const ByteBuffer& xcmp, uint16_t txId, uint8_t seq) const;
        /**
         * @brief Builds an uncounted XCMP frame addressed to the master (sequence byte 0).
         * @param xcmp XCMP payload.
         * @param txId Transaction id.
         * @returns Frame Data message frame.
         */
        Frame buildDataFrame(const ByteBuffer& xcmp, uint16_t txId) const;

        /**
         * @brief Gets the session state.
         * @returns SessionState::E Session state.
         */
        defines::SessionState::E getState() const;
        /**
         * @brief Sets the session state. A closed session stays closed.
         * @param state Session state.
         */
        void setState(defines::SessionState::E state);
        /**
         * @brief Flag indicating whether the session is closed.
         * @returns bool True, if closed, otherwise false.
         */
        bool isClosed() const { return getState() == defines::SessionState::CLOSED; }
        /**
         * @brief Closes the session and shuts down the transport.
         */
        void close();

        /**
         * @brief Gets the transport.
         * @returns TcpClient* Transport.
         */
        network::tcp::TcpClient* getChannel() const { return m_channel; }

    private:
        network::tcp::TcpClient* m_channel;
        FrameReader m_reader;
        crypto::TEA m_tea;

        mutable std::mutex m_lock;
        std::mutex m_writeLock;

        defines::SessionState::E m_state;
        uint8_t m_nextSequence;
        uint8_t m_nextTxSeq;

        uint8_t m_tempPrefix;

        bool m_debug;

        /**
         * @brief Internal helper to handle a frame received while authenticating.
         * @param frame Received frame.
         * @returns bool True, if the frame advanced the handshake, otherwise false.
         */
        bool processAuthFrame(const Frame& frame);

        /**
         * @brief Internal helper to send the device master query.
         */
        void writeMasterQuery();
        /**
         * @brief Internal helper to send the device authentication key.
         * @param seed 8 byte authentication seed.
         */
        void writeAuthKey(const uint8_t* seed);

    public:
        /**
         * @brief Assigned local XNL address.
         */
        DECLARE_RO_PROPERTY(uint16_t, localAddress, LocalAddress);
        /**
         * @brief Master (peer) XNL address.
         */
        DECLARE_RO_PROPERTY(uint16_t, peerAddress, PeerAddress);
        /**
         * @brief Session prefix assigned during authentication.
         */
        DECLARE_RO_PROPERTY(uint8_t, sessionPrefix, SessionPrefix);
    };
} // namespace xnl

#endif // __XNL_SESSION_MANAGER_H__
