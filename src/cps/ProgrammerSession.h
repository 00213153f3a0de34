// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Codeplug Access
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @file ProgrammerSession.h
 * @ingroup cps
 * @file ProgrammerSession.cpp
 * @ingroup cps
 */
#if !defined(__CPS_PROGRAMMER_SESSION_H__)
#define __CPS_PROGRAMMER_SESSION_H__

#include "common/Defines.h"
#include "common/Exception.h"
#include "common/network/tcp/TcpClient.h"
#include "xnl/SessionManager.h"
#include "xcmp/CommandDispatcher.h"
#include "cps/RecordDescriptor.h"
#include "cps/CodeplugReader.h"
#include "cps/CodeplugWriter.h"
#include "cps/RadioIdentity.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cps
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Programming session with one radio over one connection.
     * @ingroup cps
     *
     * A session is bound to its connection and cannot be reused once closed. Operations
     * are serialized, so a read and a write never interleave on the same session. Any
     * fatal error closes the session before it is rethrown.
     */
    class CPS_SW_API ProgrammerSession {
    public:
        /**
         * @brief Initializes a new instance of the ProgrammerSession class.
         * @param channel Connected transport; ownership passes to the session.
         * @param config Dispatcher configuration.
         * @param debug Flag indicating whether debug logging and frame dumps are enabled.
         */
        ProgrammerSession(std::unique_ptr<network::tcp::TcpClient> channel, const xcmp::DispatcherConfig& config = xcmp::DispatcherConfig(),
            bool debug = false);
        /**
         * @brief Finalizes a instance of the ProgrammerSession class.
         */
        ~ProgrammerSession();

        /**
         * @brief Connects to a radio.
         * @param address Radio address.
         * @param port Radio XNL port.
         * @param config Dispatcher configuration.
         * @param debug Flag indicating whether debug logging and frame dumps are enabled.
         * @returns std::unique_ptr<ProgrammerSession> Unauthenticated session.
         * @throws cps::TransportError if the connection fails.
         */
        static std::unique_ptr<ProgrammerSession> connect(const std::string& address, uint16_t port = XNL_DEFAULT_PORT,
            const xcmp::DispatcherConfig& config = xcmp::DispatcherConfig(), bool debug = false);

        /**
         * @brief Authenticates and waits for the radio to report ready.
         * @param authTimeoutMs Milliseconds allowed for authentication.
         * @param readyTimeoutMs Milliseconds allowed for the readiness handshake.
         */
        void authenticate(uint32_t authTimeoutMs = DEFAULT_AUTH_TIMEOUT_MS, uint32_t readyTimeoutMs = DEFAULT_READY_TIMEOUT_MS);

        /**
         * @brief Queries the radio identity.
         * @returns RadioIdentity Radio identity.
         */
        RadioIdentity identify();
        /**
         * @brief Discovers the records available on the radio.
         * @returns std::vector<RecordDescriptor> Available records.
         */
        std::vector<RecordDescriptor> listRecords();
        /**
         * @brief Reads records.
         * @param records Records to read.
         * @param progress Optional progress callback.
         * @returns RecordMap Record bytes keyed by descriptor.
         */
        RecordMap readRecords(const std::vector<RecordDescriptor>& records, ReadProgressCallback progress = nullptr);
        /**
         * @brief Writes a codeplug image.
         * @param data Codeplug image.
         * @param progress Optional progress callback.
         * @param options Write parameters.
         */
        void writeCodeplug(const ByteBuffer& data, WriteProgressCallback progress = nullptr, const WriteOptions& options = WriteOptions());

        /**
         * @brief Closes the session.
         */
        void close();

        /**
         * @brief Flag indicating whether the session is closed.
         * @returns bool True, if closed, otherwise false.
         */
        bool isClosed() const;
        /**
         * @brief Flag indicating whether the radio has reported ready.
         * @returns bool True, if ready, otherwise false.
         */
        bool isReady() const;

        /**
         * @brief Gets the XNL session.
         * @returns xnl::SessionManager* XNL session.
         */
        xnl::SessionManager* getSession() const { return m_session.get(); }
        /**
         * @brief Gets the command dispatcher.
         * @returns xcmp::CommandDispatcher* Command dispatcher.
         */
        xcmp::CommandDispatcher* getDispatcher() const { return m_dispatcher.get(); }

    private:
        std::unique_ptr<network::tcp::TcpClient> m_channel;
        std::unique_ptr<xnl::SessionManager> m_session;
        std::unique_ptr<xcmp::CommandDispatcher> m_dispatcher;
        std::unique_ptr<CodeplugReader> m_reader;
        std::unique_ptr<CodeplugWriter> m_writer;

        std::mutex m_opLock;
        std::mutex m_closeLock;
        bool m_closed;

        bool m_debug;

        /**
         * @brief Internal helper to close the session if the error leaves it unusable.
         * @param e Error.
         */
        void onError(const Exception& e);
    };
} // namespace cps

#endif // __CPS_PROGRAMMER_SESSION_H__
