// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Codeplug Access
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "common/Defines.h"
#include "common/Exception.h"
#include "common/Log.h"
#include "common/Utils.h"
#include "cps/RadioIdentity.h"

using namespace cps;
using namespace xcmp;
using namespace xcmp::defines;

#include <cassert>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the IdentityQuery class. */

IdentityQuery::IdentityQuery(CommandDispatcher* dispatcher) :
    m_dispatcher(dispatcher)
{
    assert(dispatcher != nullptr);
}

/* Queries every identity item. */

RadioIdentity IdentityQuery::query()
{
    RadioIdentity identity;

    try {
        identity.model = radioStatus(RadioStatusType::MODEL_NUMBER);
    }
    catch (const CommandFailed& e) {
        LogWarning(LOG_CPS, "Model number unavailable, %s", e.what());
    }

    try {
        identity.serial = radioStatus(RadioStatusType::SERIAL_NUMBER);
    }
    catch (const CommandFailed& e) {
        LogWarning(LOG_CPS, "Serial number unavailable, %s", e.what());
    }

    try {
        identity.radioId = radioId();
    }
    catch (const CommandFailed& e) {
        LogWarning(LOG_CPS, "Radio id unavailable, %s", e.what());
    }

    try {
        identity.firmwareVersion = versionInfo(VersionType::FIRMWARE);
    }
    catch (const CommandFailed& e) {
        LogWarning(LOG_CPS, "Firmware version unavailable, %s", e.what());
    }

    try {
        identity.codeplugVersion = versionInfo(VersionType::CODEPLUG);
    }
    catch (const CommandFailed& e) {
        LogWarning(LOG_CPS, "Codeplug version unavailable, %s", e.what());
    }

    LogMessage(LOG_CPS, "Radio model %s, serial %s, radio id %u, firmware %s, codeplug %s", identity.model.c_str(), identity.serial.c_str(),
        identity.radioId, identity.firmwareVersion.c_str(), identity.codeplugVersion.c_str());
    return identity;
}

/* Queries a textual radio status item. */

std::string IdentityQuery::radioStatus(uint8_t type)
{
    ByteBuffer data = typedQuery(Opcode::RADIO_STATUS, type);
    return toText(data, 1U);
}

/* Queries the radio id. */

uint32_t IdentityQuery::radioId()
{
    ByteBuffer data = typedQuery(Opcode::RADIO_STATUS, RadioStatusType::RADIO_ID);
    if (data.size() < 4U) {
        throw ProtocolViolation("Radio id reply carries " + std::to_string(data.size()) + " bytes");
    }

    const uint8_t* buffer = data.data();
    return GET_UINT24(buffer, 1U);
}

/* Queries a version item. */

std::string IdentityQuery::versionInfo(uint8_t type)
{
    ByteBuffer data = typedQuery(Opcode::VERSION_INFO, type);
    return toText(data, 1U);
}

/* Helper to convert reply bytes to text, dropping NULs and control characters. */

std::string IdentityQuery::toText(const ByteBuffer& data, uint32_t offset)
{
    std::string text;
    for (uint32_t i = offset; i < data.size(); i++) {
        uint8_t c = data[i];
        if (c < 0x20U || c == 0x7FU)
            continue;
        text.push_back((char)c);
    }

    // trim surrounding whitespace
    size_t start = text.find_first_not_of(' ');
    if (start == std::string::npos)
        return std::string();
    size_t end = text.find_last_not_of(' ');
    return text.substr(start, end - start + 1U);
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to send a typed query and check the echoed type. */

ByteBuffer IdentityQuery::typedQuery(uint16_t opcode, uint8_t type)
{
    CommandReply reply = m_dispatcher->send(opcode, ByteBuffer(1U, type));
    reply.checkStatus("Query $" + __INT_HEX_STR(opcode) + " type $" + __INT_HEX_STR(type, 2U));

    const ByteBuffer& data = reply.getData();
    if (data.empty()) {
        throw ProtocolViolation("Empty reply to query $" + __INT_HEX_STR(opcode));
    }

    if (data[0U] != type) {
        LogWarning(LOG_CPS, "Query $%04X type $%02X answered with type $%02X", opcode, type, data[0U]);
    }

    return data;
}
