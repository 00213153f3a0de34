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
#include "Exception.h"

using namespace cps;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Exception class. */

Exception::Exception(const std::string& message, const eType type) :
    std::runtime_error(message),
    m_type(type)
{
    /* stub */
}

/* Get type of exception. */

Exception::eType Exception::type() const
{
    return m_type;
}

/* Get message of exception. */

const char* Exception::message() const
{
    return what();
}

/* Flag indicating whether this exception leaves the session unusable. */

bool Exception::isFatal() const
{
    switch (m_type) {
    case FRAMING:
    case AUTHENTICATION:
    case PROTOCOL_VIOLATION:
    case TRANSPORT:
        return true;
    default:
        return false;
    }
}

/*
** Taxonomy
*/

/* Initializes a new instance of the FramingError class. */

FramingError::FramingError(const std::string& message) : Exception(message, FRAMING) { /* stub */ }

/* Initializes a new instance of the AuthenticationFailed class. */

AuthenticationFailed::AuthenticationFailed(const std::string& message) : Exception(message, AUTHENTICATION) { /* stub */ }

/* Initializes a new instance of the CommandTimeout class. */

CommandTimeout::CommandTimeout(const std::string& message) : Exception(message, COMMAND_TIMEOUT) { /* stub */ }

/* Initializes a new instance of the ProtocolViolation class. */

ProtocolViolation::ProtocolViolation(const std::string& message) : Exception(message, PROTOCOL_VIOLATION) { /* stub */ }

/* Initializes a new instance of the SecurityRejected class. */

SecurityRejected::SecurityRejected(const std::string& message) : Exception(message, SECURITY_REJECTED) { /* stub */ }

/* Initializes a new instance of the DeviceBusy class. */

DeviceBusy::DeviceBusy(const std::string& message) : Exception(message, DEVICE_BUSY) { /* stub */ }

/* Initializes a new instance of the NotReady class. */

NotReady::NotReady(const std::string& message) : Exception(message, NOT_READY) { /* stub */ }

/* Initializes a new instance of the CommandFailed class. */

CommandFailed::CommandFailed(const std::string& message, uint8_t status) : Exception(message, COMMAND_FAILED),
    m_status(status)
{
    /* stub */
}

/* Initializes a new instance of the TransportError class. */

TransportError::TransportError(const std::string& message) : Exception(message, TRANSPORT) { /* stub */ }

/* Initializes a new instance of the RecordError class. */

RecordError::RecordError(const std::string& message) : Exception(message, RECORD) { /* stub */ }
