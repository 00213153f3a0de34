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
 * @file CommandReply.h
 * @ingroup xcmp
 * @file CommandReply.cpp
 * @ingroup xcmp
 */
#if !defined(__XCMP_COMMAND_REPLY_H__)
#define __XCMP_COMMAND_REPLY_H__

#include "common/Defines.h"
#include "xcmp/XCMPDefines.h"

#include <string>

namespace xcmp
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Represents a decoded XCMP command reply.
     * @ingroup xcmp
     */
    class CPS_SW_API CommandReply {
    public:
        /**
         * @brief Initializes a new instance of the CommandReply class.
         */
        CommandReply();
        /**
         * @brief Initializes a new instance of the CommandReply class.
         * @param opcode Reply opcode.
         * @param status Reply status.
         * @param data Reply data following the status byte.
         */
        CommandReply(uint16_t opcode, uint8_t status, const ByteBuffer& data);

        /**
         * @brief Decodes a XCMP reply from the XCMP payload of a data message.
         * @param xcmp XCMP payload.
         * @param[out] reply Decoded reply.
         * @returns bool True, if the payload is a well formed reply, otherwise false.
         */
        static bool decode(const ByteBuffer& xcmp, CommandReply& reply);

        /**
         * @brief Gets the request opcode this reply answers.
         * @returns uint16_t Request opcode.
         */
        uint16_t getRequestOpcode() const { return (uint16_t)(m_opcode & ~defines::XCMP_REPLY_FLAG); }
        /**
         * @brief Flag indicating whether the reply reports success.
         * @returns bool True, if the status is success, otherwise false.
         */
        bool isSuccess() const { return m_status == defines::Status::SUCCESS; }

        /**
         * @brief Gets the reply data following the status byte.
         * @returns const ByteBuffer& Reply data.
         */
        const ByteBuffer& getData() const { return m_data; }

        /**
         * @brief Maps a non-success status onto the error taxonomy.
         * @param what Description of the command, used in the exception message.
         * @throws cps::DeviceBusy if the peer reported busy.
         * @throws cps::CommandFailed for any other non-success status.
         */
        void checkStatus(const std::string& what) const;

        /**
         * @brief Helper to convert a XCMP reply status to a string.
         * @param status Reply status.
         * @returns std::string Textual status.
         */
        static std::string statusToString(uint8_t status);

    private:
        ByteBuffer m_data;

    public:
        /**
         * @brief Reply opcode.
         */
        DECLARE_RO_PROPERTY(uint16_t, opcode, Opcode);
        /**
         * @brief Reply status.
         */
        DECLARE_RO_PROPERTY(uint8_t, status, Status);
    };
} // namespace xcmp

#endif // __XCMP_COMMAND_REPLY_H__
