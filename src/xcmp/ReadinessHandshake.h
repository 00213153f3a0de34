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
 * @file ReadinessHandshake.h
 * @ingroup xcmp
 * @file ReadinessHandshake.cpp
 * @ingroup xcmp
 */
#if !defined(__XCMP_READINESS_HANDSHAKE_H__)
#define __XCMP_READINESS_HANDSHAKE_H__

#include "common/Defines.h"
#include "xcmp/XCMPDefines.h"
#include "xnl/Frame.h"
#include "xnl/SessionManager.h"

#include <condition_variable>
#include <mutex>

namespace xcmp
{
    // ---------------------------------------------------------------------------
    //  Class Prototypes
    // ---------------------------------------------------------------------------

    class CPS_SW_API CommandDispatcher;

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Answers the device initialization status broadcasts that follow authentication.
     * @ingroup xcmp
     *
     * The radio queries the local entity after authentication, then reports transitional
     * status until it reports completion. Commands are only honored after completion.
     */
    class CPS_SW_API ReadinessHandshake {
    public:
        /**
         * @brief Initializes a new instance of the ReadinessHandshake class.
         * @param dispatcher Dispatcher used to send the status reply.
         * @param session XNL session.
         * @param debug Flag indicating whether debug logging is enabled.
         */
        ReadinessHandshake(CommandDispatcher* dispatcher, xnl::SessionManager* session, bool debug = false);

        /**
         * @brief Processes a device initialization status broadcast.
         * @param frame Data message carrying XCMP 0xB400.
         */
        void onBroadcast(const xnl::Frame& frame);

        /**
         * @brief Blocks until the device reports ready.
         * @param timeoutMs Milliseconds to wait.
         * @returns bool True, if the device is ready, otherwise false.
         */
        bool waitUntilReady(uint32_t timeoutMs);

        /**
         * @brief Flag indicating whether the device reported ready.
         * @returns bool True, if ready, otherwise false.
         */
        bool isReady() const;
        /**
         * @brief Gets the readiness state.
         * @returns ReadyState::E Readiness state.
         */
        defines::ReadyState::E getState() const;

        /**
         * @brief Wakes any waiter; the session has failed.
         */
        void abort();

    private:
        CommandDispatcher* m_dispatcher;
        xnl::SessionManager* m_session;

        mutable std::mutex m_lock;
        std::condition_variable m_cond;

        defines::ReadyState::E m_state;
        bool m_aborted;

        bool m_debug;
    };
} // namespace xcmp

#endif // __XCMP_READINESS_HANDSHAKE_H__
