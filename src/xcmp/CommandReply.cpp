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
#include "common/Exception.h"
#include "common/Utils.h"
#include "xcmp/CommandReply.h"

using namespace xcmp;
using namespace xcmp::defines;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the CommandReply class. */

CommandReply::CommandReply() :
    m_data(),
    m_opcode(0U),
    m_status(Status::FAILURE)
{
    /* stub */
}

/* Initializes a new instance of the CommandReply class. */

CommandReply::CommandReply(uint16_t opcode, uint8_t status, const ByteBuffer& data) :
    m_data(data),
    m_opcode(opcode),
    m_status(status)
{
    /* stub */
}

/* Decodes a XCMP reply from the XCMP payload of a data message. */

bool CommandReply::decode(const ByteBuffer& xcmp, CommandReply& reply)
{
    if (xcmp.size() < XCMP_REPLY_HEADER_LEN)
        return false;

    const uint8_t* data = xcmp.data();
    uint16_t opcode = GET_UINT16(data, 0U);
    if ((opcode & XCMP_REPLY_FLAG) == 0U)
        return false;

    reply.m_opcode = opcode;
    reply.m_status = data[2U];
    reply.m_data.assign(xcmp.begin() + XCMP_REPLY_HEADER_LEN, xcmp.end());
    return true;
}

/* Maps a non-success status onto the error taxonomy. */

void CommandReply::checkStatus(const std::string& what) const
{
    if (isSuccess())
        return;

    std::string msg = what + " failed, opcode $" + __INT_HEX_STR(m_opcode) + ", status " + statusToString(m_status);
    if (m_status == Status::BUSY)
        throw cps::DeviceBusy(msg);

    throw cps::CommandFailed(msg, m_status);
}

/* Helper to convert a XCMP reply status to a string. */

std::string CommandReply::statusToString(uint8_t status)
{
    switch (status) {
    case Status::SUCCESS:
        return std::string("SUCCESS");
    case Status::FAILURE:
        return std::string("FAILURE");
    case Status::INVALID_PARAMETER:
        return std::string("INVALID_PARAMETER");
    case Status::REINIT_XNL:
        return std::string("REINIT_XNL");
    case Status::NOT_SUPPORTED:
        return std::string("NOT_SUPPORTED");
    case Status::BUSY:
        return std::string("BUSY");
    default:
        return "$" + __INT_HEX_STR(status, 2U);
    }
}
