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
 * @file Frame.h
 * @ingroup xnl
 * @file Frame.cpp
 * @ingroup xnl
 */
#if !defined(__XNL_FRAME_H__)
#define __XNL_FRAME_H__

#include "common/Defines.h"
#include "xnl/XNLDefines.h"

#include <string>

namespace xnl
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Represents a single XNL frame.
     * @ingroup xnl
     *
     * Wire layout (all fields big-endian):
     * \code{.unparsed}
     * Byte 0               1               2               3
     * Bit  7 6 5 4 3 2 1 0 7 6 5 4 3 2 1 0 7 6 5 4 3 2 1 0 7 6 5 4 3 2 1 0
     *     +-------------------------------+-------------------------------+
     *     | Total Length (excl. itself)   | Opcode                        |
     *     +---------------+---------------+-------------------------------+
     *     | XCMP Flag     | Sequence      | Destination Address           |
     *     +---------------+---------------+-------------------------------+
     *     | Source Address                | Transaction Id                |
     *     +-------------------------------+-------------------------------+
     *     | Payload Length                | Payload ...                   |
     *     +-------------------------------+-------------------------------+
     * \endcode
     */
    class CPS_SW_API Frame {
    public:
        /**
         * @brief Initializes a new instance of the Frame class.
         */
        Frame();
        /**
         * @brief Initializes a new instance of the Frame class.
         * @param opcode XNL opcode.
         * @param dest Destination address.
         * @param src Source address.
         * @param txId Transaction id.
         * @param payload Payload bytes.
         */
        Frame(uint16_t opcode, uint16_t dest, uint16_t src, uint16_t txId, const ByteBuffer& payload);

        /**
         * @brief Decodes a complete frame, including its length field.
         * @param data Buffer containing the frame.
         * @param len Length of the buffer.
         * @returns Frame Decoded frame.
         * @throws cps::FramingError if the frame is truncated or its lengths are inconsistent.
         */
        static Frame decode(const uint8_t* data, uint32_t len);
        /**
         * @brief Encodes the frame, including its length field.
         * @returns ByteBuffer Encoded frame.
         */
        ByteBuffer encode() const;

        /**
         * @brief Gets the total length field (header after the length field plus the payload).
         * @returns uint16_t Total length.
         */
        uint16_t getTotalLength() const { return (uint16_t)(defines::XNL_HEADER_LEN + m_payload.size()); }
        /**
         * @brief Gets the payload length.
         * @returns uint16_t Payload length.
         */
        uint16_t getPayloadLength() const { return (uint16_t)m_payload.size(); }

        /**
         * @brief Gets the frame payload.
         * @returns const ByteBuffer& Payload bytes.
         */
        const ByteBuffer& getPayload() const { return m_payload; }
        /**
         * @brief Sets the frame payload.
         * @param payload Payload bytes.
         */
        void setPayload(const ByteBuffer& payload) { m_payload = payload; }

        /**
         * @brief Gets the XCMP opcode carried at the start of the payload.
         * @returns uint16_t XCMP opcode, or 0 if this frame carries no XCMP payload.
         */
        uint16_t getXCMPOpcode() const;

        /**
         * @brief Helper to describe the frame header for logging.
         * @returns std::string Header description.
         */
        std::string toString() const;

        /**
         * @brief Equals operator.
         * @param data Frame to compare.
         * @returns bool True, if every header field and the payload are equal, otherwise false.
         */
        bool operator==(const Frame& data) const;

    public:
        /**
         * @brief XNL opcode.
         */
        DECLARE_PROPERTY(uint16_t, opcode, Opcode);
        /**
         * @brief Flag indicating the payload carries an XCMP message.
         */
        DECLARE_PROPERTY(bool, xcmp, XCMP);
        /**
         * @brief Message sequence (also the flags byte on authentication frames).
         */
        DECLARE_PROPERTY(uint8_t, sequence, Sequence);
        /**
         * @brief Destination address.
         */
        DECLARE_PROPERTY(uint16_t, dest, Dest);
        /**
         * @brief Source address.
         */
        DECLARE_PROPERTY(uint16_t, src, Src);
        /**
         * @brief Transaction id.
         */
        DECLARE_PROPERTY(uint16_t, txId, TxId);

    private:
        ByteBuffer m_payload;
    };
} // namespace xnl

#endif // __XNL_FRAME_H__
