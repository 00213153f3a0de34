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
#include "common/Exception.h"
#include "common/Log.h"
#include "common/Utils.h"
#include "xnl/FrameReader.h"

using namespace xnl;
using namespace xnl::defines;
using namespace network::tcp;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the FrameReader class. */

FrameReader::FrameReader(TcpClient* channel, bool debug) :
    m_channel(channel),
    m_debug(debug)
{
    /* stub */
}

/* Reads the next frame from the transport. */

bool FrameReader::read(Frame& frame, uint32_t timeoutMs)
{
    if (m_channel == nullptr || !m_channel->isOpen())
        throw cps::TransportError("Transport is closed");

    uint8_t lengthField[XNL_LENGTH_FIELD_LEN];
    ssize_t ret = m_channel->readExact(lengthField, XNL_LENGTH_FIELD_LEN, timeoutMs);
    if (ret == SOCKET_READ_TIMEOUT)
        return false;
    if (ret == SOCKET_READ_PARTIAL)
        throw cps::TransportError("Timed out inside an XNL length field");
    if (ret < 0)
        throw cps::TransportError("Transport closed while reading an XNL frame");

    uint16_t totalLength = GET_UINT16(lengthField, 0U);
    if (totalLength < XNL_HEADER_LEN) {
        throw cps::FramingError("XNL total length " + std::to_string(totalLength) + " is shorter than the header");
    }

    uint32_t frameLength = XNL_LENGTH_FIELD_LEN + totalLength;
    DECLARE_UINT8_ARRAY(buffer, frameLength);
    buffer[0U] = lengthField[0U];
    buffer[1U] = lengthField[1U];

    ret = m_channel->readExact(buffer + XNL_LENGTH_FIELD_LEN, totalLength, FRAME_BODY_TIMEOUT_MS);
    if (ret == SOCKET_READ_TIMEOUT || ret == SOCKET_READ_PARTIAL)
        throw cps::TransportError("Timed out inside an XNL frame");
    if (ret < 0)
        throw cps::TransportError("Transport closed while reading an XNL frame");

    if (m_debug)
        Utils::dump(1U, "XNL RX", buffer, frameLength);

    frame = Frame::decode(buffer, frameLength);
    return true;
}

/* Writes a frame to the transport. */

void FrameReader::write(const Frame& frame)
{
    if (m_channel == nullptr)
        throw cps::TransportError("Transport is closed");

    ByteBuffer buffer = frame.encode();
    if (m_debug)
        Utils::dump(1U, "XNL TX", buffer.data(), (uint32_t)buffer.size());

    if (!m_channel->writeAll(buffer.data(), buffer.size())) {
        throw cps::TransportError("Failed to write XNL frame, " + frame.toString());
    }
}
