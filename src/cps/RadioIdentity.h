// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Codeplug Access
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @file RadioIdentity.h
 * @ingroup cps
 * @file RadioIdentity.cpp
 * @ingroup cps
 */
#if !defined(__CPS_RADIO_IDENTITY_H__)
#define __CPS_RADIO_IDENTITY_H__

#include "common/Defines.h"
#include "xcmp/CommandDispatcher.h"

#include <string>

namespace cps
{
    // ---------------------------------------------------------------------------
    //  Structure Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Identity of the connected radio.
     * @ingroup cps
     */
    struct RadioIdentity {
    public:
        /**
         * @brief Initializes a new instance of the RadioIdentity struct.
         */
        RadioIdentity() :
            model(),
            serial(),
            firmwareVersion(),
            codeplugVersion(),
            radioId(0U)
        {
            /* stub */
        }

        std::string model;              //! Model number.
        std::string serial;             //! Serial number.
        std::string firmwareVersion;    //! Host firmware version.
        std::string codeplugVersion;    //! Codeplug version.
        uint32_t radioId;               //! Radio id.
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Queries the identity of the connected radio.
     * @ingroup cps
     */
    class CPS_SW_API IdentityQuery {
    public:
        /**
         * @brief Initializes a new instance of the IdentityQuery class.
         * @param dispatcher Command dispatcher.
         */
        IdentityQuery(xcmp::CommandDispatcher* dispatcher);

        /**
         * @brief Queries every identity item. Items the radio refuses are left empty.
         * @returns RadioIdentity Radio identity.
         */
        RadioIdentity query();

        /**
         * @brief Queries a textual radio status item.
         * @param type Radio status type.
         * @returns std::string Trimmed value.
         */
        std::string radioStatus(uint8_t type);
        /**
         * @brief Queries the radio id.
         * @returns uint32_t Radio id.
         */
        uint32_t radioId();
        /**
         * @brief Queries a version item.
         * @param type Version type.
         * @returns std::string Trimmed value.
         */
        std::string versionInfo(uint8_t type);

        /**
         * @brief Helper to convert reply bytes to text, dropping NULs and control characters.
         * @param data Reply bytes.
         * @param offset Offset of the first text byte.
         * @returns std::string Text.
         */
        static std::string toText(const ByteBuffer& data, uint32_t offset);

    private:
        xcmp::CommandDispatcher* m_dispatcher;

        /**
         * @brief Internal helper to send a typed query and check the echoed type.
         * @param opcode Request opcode.
         * @param type Query type.
         * @returns ByteBuffer Reply data following the status byte.
         */
        ByteBuffer typedQuery(uint16_t opcode, uint8_t type);
    };
} // namespace cps

#endif // __CPS_RADIO_IDENTITY_H__
