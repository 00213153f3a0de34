// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - XNL Session Layer
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup xnl XNL Session Layer
 * @brief Implementation of the XNL session, addressing and authentication layer.
 *
 * @file XNLDefines.h
 * @ingroup xnl
 */
#if !defined(__XNL_DEFINES_H__)
#define  __XNL_DEFINES_H__

#include "common/Defines.h"

// Shorthand macro to xnl::defines -- keeps source code that doesn't use "using" concise
#if !defined(XNLDEF)
#define XNLDEF xnl::defines
#endif // XNLDEF
namespace xnl
{
    namespace defines
    {
        // ---------------------------------------------------------------------------
        //  Constants
        // ---------------------------------------------------------------------------

        /**
         * @addtogroup xnl
         * @{
         */

        /** @name Frame Lengths */
        const uint32_t  XNL_LENGTH_FIELD_LEN = 2U;
        const uint32_t  XNL_HEADER_LEN = 12U;                                   // header bytes following the length field
        const uint32_t  XNL_FRAME_OVERHEAD = XNL_LENGTH_FIELD_LEN + XNL_HEADER_LEN;
        const uint32_t  XNL_MAX_PAYLOAD_LEN = 0xFFFFU - XNL_HEADER_LEN;
        /** @} */

        /** @name Frame Field Offsets */
        const uint32_t  XNL_OFFS_LENGTH = 0U;
        const uint32_t  XNL_OFFS_OPCODE = 2U;
        const uint32_t  XNL_OFFS_XCMP_FLAG = 4U;
        const uint32_t  XNL_OFFS_SEQUENCE = 5U;
        const uint32_t  XNL_OFFS_DEST = 6U;
        const uint32_t  XNL_OFFS_SRC = 8U;
        const uint32_t  XNL_OFFS_TXID = 10U;
        const uint32_t  XNL_OFFS_PAYLOAD_LEN = 12U;
        const uint32_t  XNL_OFFS_PAYLOAD = 14U;
        /** @} */

        /** @name Addressing */
        const uint16_t  XNL_QUERY_ADDRESS = 0x0006U;                            // destination of DeviceMasterQuery
        const uint16_t  XNL_TEMP_ADDRESS_BASE = 0xFF00U;                        // src of DeviceAuthKey is base | temporary prefix
        const uint8_t   XNL_AUTH_KEY_FLAGS = 0x08U;
        const uint8_t   XNL_AUTH_RESULT_SUCCESS = 0x01U;
        const uint8_t   XNL_SYSMAP_MARKER = 0xFFU;
        /** @} */

        /** @name Payload Lengths */
        const uint32_t  XNL_AUTH_SEED_LEN = 8U;
        const uint32_t  XNL_SYSMAP_PAYLOAD_LEN = 2U + XNL_AUTH_SEED_LEN;
        const uint32_t  XNL_AUTH_KEY_PAYLOAD_LEN = 4U + XNL_AUTH_SEED_LEN;
        const uint32_t  XNL_AUTH_REPLY_MIN_LEN = 4U;
        /** @} */

        /** @brief Fixed leading bytes of the DeviceAuthKey payload (device type, auth index). */
        const uint8_t   XNL_AUTH_KEY_PREAMBLE[] = { 0x00U, 0x00U, 0x0AU, 0x00U };

        /** @} */

        /** @brief XNL Opcodes */
        namespace Opcode {
            /** @brief XNL Opcodes */
            enum : uint16_t {
                MASTER_STATUS_BRDCST = 0x0002U,         //! Master Status Broadcast
                DEVICE_MASTER_QUERY = 0x0004U,          //! Device Master Query
                DEVICE_SYSMAP_BRDCST = 0x0005U,         //! Device System Map Broadcast
                DEVICE_AUTH_KEY = 0x0006U,              //! Device Authentication Key
                DEVICE_AUTH_KEY_REPLY = 0x0007U,        //! Device Authentication Key Reply
                DEVICE_CONN_REPLY = 0x0009U,            //! Device Connection Reply
                DATA_MSG = 0x000BU,                     //! Data Message
                DATA_MSG_ACK = 0x000CU                  //! Data Message Acknowledge
            };
        }

        /** @brief Session States */
        namespace SessionState {
            /** @brief Session States */
            enum E : uint8_t {
                CONNECTING,                             //! Awaiting master status broadcast
                AUTHENTICATING,                         //! Awaiting system map and authentication reply
                HANDSHAKE_READY,                        //! Authenticated; awaiting device readiness
                COMMANDS_ALLOWED,                       //! Ready for commands
                CLOSED                                  //! Session closed
            };
        }
    } // namespace defines
} // namespace xnl

#endif // __XNL_DEFINES_H__
