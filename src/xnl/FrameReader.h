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
 * @file FrameReader.h
 * @ingroup xnl
 * @file FrameReader.cpp
 * @ingroup xnl
 */
#if !defined(__XNL_FRAME_READER_H__)
#define __XNL_FRAME_READER_H__

#include "common/Defines.h"
#include "common/network/tcp/TcpClient.h"
#include "xnl/Frame.h"

namespace xnl
{
    // ---------------------------------------------------------------------------
    //  Constants
    // ---------------------------------------------------------------------------

    /** @brief Time allowed for the remainder of a frame once its length field has arrived. */
    const uint32_t FRAME_BODY_TIMEOUT_MS = 2000U;

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Pulls length-prefixed XNL frames off a stream transport.
     * @ingroup xnl
     */
    class CPS_SW_API FrameReader {
    public:
        /**
         * @brief Initializes a new instance of the FrameReader class.
         * @param channel Transport to read from.
         * @param debug Flag indicating raw frames should be dumped to the log.
         */
        FrameReader(network::tcp::TcpClient* channel, bool debug = false);

        /**
         * @brief Reads the next frame from the transport.
         * @param[out] frame Decoded frame.
         * @param timeoutMs Milliseconds to wait for the frame to begin arriving.
         * @returns bool True, if a frame was read, false if the transport stayed idle.
         * @throws cps::TransportError on a mid-frame timeout, peer close or socket error.
         * @throws cps::FramingError if the frame is malformed.
         */
        bool read(Frame& frame, uint32_t timeoutMs);

        /**
         * @brief Writes a frame to the transport.
         * @param frame Frame to write.
         * @throws cps::TransportError if the frame could not be written.
         */
        void write(const Frame& frame);

    private:
        network::tcp::TcpClient* m_channel;
        bool m_debug;
    };
} // namespace xnl

#endif // __XNL_FRAME_READER_H__
