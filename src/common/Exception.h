// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2018 Jimmie Bergmann
 *  Copyright (C) 2024 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @file Exception.h
 * @ingroup common
 * @file Exception.cpp
 * @ingroup common
 */
#if !defined(__CPS_EXCEPTION_H__)
#define __CPS_EXCEPTION_H__

#include "common/Defines.h"

#include <stdexcept>
#include <string>

namespace cps
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief General programming engine exception.
     * @ingroup common
     */
    class CPS_SW_API Exception : public std::runtime_error {
    public:
        /**
         * @brief Enumeration of exception types.
         */
        enum eType
        {
            FRAMING,            // Malformed frame bytes.
            AUTHENTICATION,     // Authentication handshake rejected.
            COMMAND_TIMEOUT,    // No matching reply within the deadline.
            PROTOCOL_VIOLATION, // Frame or reply out of the expected sequence.
            SECURITY_REJECTED,  // Write-path security unlock refused.
            DEVICE_BUSY,        // Peer reported busy.
            NOT_READY,          // Command issued before the readiness handshake completed.
            COMMAND_FAILED,     // Peer reported a non-success status.
            TRANSPORT,          // Socket closed or errored.
            RECORD              // Record field out of bounds.
        };

        /**
         * @brief Initializes a new instance of the Exception class.
         * @param message Exception message.
         * @param type Exception type.
         */
        Exception(const std::string& message, const eType type);

        /**
         * @brief Get type of exception.
         * @returns eType Type of exception.
         */
        eType type() const;

        /**
         * @brief Get message of exception.
         * @returns const char* Exception message.
         */
        const char* message() const;

        /**
         * @brief Flag indicating whether this exception leaves the session unusable.
         * @returns bool True, if the session must be closed, otherwise false.
         */
        bool isFatal() const;

    private:
        eType m_type;
    };

    /**
     * @brief Malformed frame exception.
     * @ingroup common
     */
    class CPS_SW_API FramingError : public Exception {
    public:
        /** @brief Initializes a new instance of the FramingError class. */
        FramingError(const std::string& message);
    };

    /**
     * @brief Authentication failure exception.
     * @ingroup common
     */
    class CPS_SW_API AuthenticationFailed : public Exception {
    public:
        /** @brief Initializes a new instance of the AuthenticationFailed class. */
        AuthenticationFailed(const std::string& message);
    };

    /**
     * @brief Command timeout exception.
     * @ingroup common
     */
    class CPS_SW_API CommandTimeout : public Exception {
    public:
        /** @brief Initializes a new instance of the CommandTimeout class. */
        CommandTimeout(const std::string& message);
    };

    /**
     * @brief Protocol violation exception.
     * @ingroup common
     */
    class CPS_SW_API ProtocolViolation : public Exception {
    public:
        /** @brief Initializes a new instance of the ProtocolViolation class. */
        ProtocolViolation(const std::string& message);
    };

    /**
     * @brief Security unlock rejected exception.
     * @ingroup common
     */
    class CPS_SW_API SecurityRejected : public Exception {
    public:
        /** @brief Initializes a new instance of the SecurityRejected class. */
        SecurityRejected(const std::string& message);
    };

    /**
     * @brief Device busy exception.
     * @ingroup common
     */
    class CPS_SW_API DeviceBusy : public Exception {
    public:
        /** @brief Initializes a new instance of the DeviceBusy class. */
        DeviceBusy(const std::string& message);
    };

    /**
     * @brief Device not ready exception.
     * @ingroup common
     */
    class CPS_SW_API NotReady : public Exception {
    public:
        /** @brief Initializes a new instance of the NotReady class. */
        NotReady(const std::string& message);
    };

    /**
     * @brief Command failed exception.
     * @ingroup common
     */
    class CPS_SW_API CommandFailed : public Exception {
    public:
        /**
         * @brief Initializes a new instance of the CommandFailed class.
         * @param message Exception message.
         * @param status Status code reported by the peer.
         */
        CommandFailed(const std::string& message, uint8_t status);

        /**
         * @brief Gets the status code reported by the peer.
         * @returns uint8_t Status code.
         */
        uint8_t status() const { return m_status; }

    private:
        uint8_t m_status;
    };

    /**
     * @brief Transport failure exception.
     * @ingroup common
     */
    class CPS_SW_API TransportError : public Exception {
    public:
        /** @brief Initializes a new instance of the TransportError class. */
        TransportError(const std::string& message);
    };

    /**
     * @brief Record bounds exception.
     * @ingroup common
     */
    class CPS_SW_API RecordError : public Exception {
    public:
        /** @brief Initializes a new instance of the RecordError class. */
        RecordError(const std::string& message);
    };
} // namespace cps

#endif // __CPS_EXCEPTION_H__
