// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - XNL Session Layer
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "common/Defines.h"
#include "xnl/Frame.h"
#include "common/Exception.h"
#include "common/Utils.h"

using namespace xnl;
using namespace xnl::defines;

#include <cstdio>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Frame class. */

Frame::Frame() :
    m_opcode(0U),
    m_xcmp(false),
    m_sequence(0U),
    m_dest(0U),
    m_src(0U),
    m_txId(0U),
    m_payload()
{
    /* stub */
}

/* Initializes a new instance of the Frame class. */

Frame::Frame(uint16_t opcode, uint16_t dest, uint16_t src, uint16_t txId, const ByteBuffer& payload) :
    m_opcode(opcode),
    m_xcmp(false),
    m_sequence(0U),
    m_dest(dest),
    m_src(src),
    m_txId(txId),
    m_payload(payload)
{
    /* stub */
}

/* Decodes a complete frame, including its length field. */

Frame Frame::decode(const uint8_t* data, uint32_t len)
{
    if (data == nullptr || len < XNL_FRAME_OVERHEAD) {
        throw cps::FramingError("Truncated XNL frame, " + std::to_string(len) + " bytes");
    }

    uint16_t totalLength = GET_UINT16(data, XNL_OFFS_LENGTH);
    uint16_t payloadLength = GET_UINT16(data, XNL_OFFS_PAYLOAD_LEN);

    if ((uint32_t)payloadLength != len - XNL_FRAME_OVERHEAD) {
        throw cps::FramingError("XNL payload length " + std::to_string(payloadLength) + " does not match " +
            std::to_string(len - XNL_FRAME_OVERHEAD) + " remaining bytes");
    }

    if ((uint32_t)totalLength != len - XNL_LENGTH_FIELD_LEN || (uint32_t)totalLength != XNL_HEADER_LEN + payloadLength) {
        throw cps::FramingError("XNL total length " + std::to_string(totalLength) + " is inconsistent with payload length " +
            std::to_string(payloadLength));
    }

    Frame frame;
    frame.m_opcode = GET_UINT16(data, XNL_OFFS_OPCODE);                         // Opcode
    frame.m_xcmp = data[XNL_OFFS_XCMP_FLAG] != 0U;                              // XCMP Flag
    frame.m_sequence = data[XNL_OFFS_SEQUENCE];                                 // Sequence / Flags
    frame.m_dest = GET_UINT16(data, XNL_OFFS_DEST);                             // Destination
    frame.m_src = GET_UINT16(data, XNL_OFFS_SRC);                               // Source
    frame.m_txId = GET_UINT16(data, XNL_OFFS_TXID);                             // Transaction Id
    frame.m_payload.assign(data + XNL_OFFS_PAYLOAD, data + len);                // Payload

    return frame;
}

/* Encodes the frame, including its length field. */

ByteBuffer Frame::encode() const
{
    if (m_payload.size() > XNL_MAX_PAYLOAD_LEN) {
        throw cps::FramingError("XNL payload of " + std::to_string(m_payload.size()) + " bytes exceeds the maximum of " +
            std::to_string(XNL_MAX_PAYLOAD_LEN) + " bytes");
    }

    ByteBuffer buffer(XNL_FRAME_OVERHEAD + m_payload.size(), 0x00U);
    uint8_t* data = buffer.data();

    uint16_t totalLength = getTotalLength();
    uint16_t payloadLength = getPayloadLength();

    SET_UINT16(totalLength, data, XNL_OFFS_LENGTH);                             // Total Length
    SET_UINT16(m_opcode, data, XNL_OFFS_OPCODE);                                // Opcode
    data[XNL_OFFS_XCMP_FLAG] = m_xcmp ? 0x01U : 0x00U;                          // XCMP Flag
    data[XNL_OFFS_SEQUENCE] = m_sequence;                                       // Sequence / Flags
    SET_UINT16(m_dest, data, XNL_OFFS_DEST);                                    // Destination
    SET_UINT16(m_src, data, XNL_OFFS_SRC);                                      // Source
    SET_UINT16(m_txId, data, XNL_OFFS_TXID);                                    // Transaction Id
    SET_UINT16(payloadLength, data, XNL_OFFS_PAYLOAD_LEN);                      // Payload Length

    if (!m_payload.empty())
        ::memcpy(data + XNL_OFFS_PAYLOAD, m_payload.data(), m_payload.size());

    return buffer;
}

/* Gets the XCMP opcode carried at the start of the payload. */

uint16_t Frame::getXCMPOpcode() const
{
    if (!m_xcmp || m_payload.size() < 2U)
        return 0U;

    const uint8_t* data = m_payload.data();
    return GET_UINT16(data, 0U);
}

/* Helper to describe the frame header for logging. */

std::string Frame::toString() const
{
    char buffer[128U];
    ::snprintf(buffer, sizeof(buffer), "opcode = $%04X, xcmp = %u, seq = %u, dst = $%04X, src = $%04X, txId = $%04X, len = %u",
        m_opcode, m_xcmp ? 1U : 0U, m_sequence, m_dest, m_src, m_txId, (uint32_t)m_payload.size());
    return std::string(buffer);
}

/* Equals operator. */

bool Frame::operator==(const Frame& data) const
{
    return m_opcode == data.m_opcode && m_xcmp == data.m_xcmp && m_sequence == data.m_sequence &&
        m_dest == data.m_dest && m_src == data.m_src && m_txId == data.m_txId && m_payload == data.m_payload;
}
