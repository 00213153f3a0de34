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
 * @defgroup xcmp XCMP Command Layer
 * @brief Implementation for the XCMP command layer carried in XNL data messages.
 *
 * @file XCMPDefines.h
 * @ingroup xcmp
 */
#if !defined(__XCMP_DEFINES_H__)
#define  __XCMP_DEFINES_H__

#include "common/Defines.h"

// Shorthand macro to xcmp::defines -- keeps source code that doesn't use "using" concise
#if !defined(XCMPDEF)
#define XCMPDEF xcmp::defines
#endif // XCMPDEF
namespace xcmp
{
    namespace defines
    {
        // ---------------------------------------------------------------------------
        //  Constants
        // ---------------------------------------------------------------------------

        /**
         * @addtogroup xcmp
         * @{
         */

        const uint16_t  XCMP_REPLY_FLAG = 0x8000U;                              // reply opcode = request | flag
        const uint16_t  XCMP_BRDCST_MASK = 0xF000U;
        const uint16_t  XCMP_BRDCST_PREFIX = 0xB000U;                           // unsolicited broadcasts are 0xBxxx

        const uint32_t  XCMP_OPCODE_LEN = 2U;
        const uint32_t  XCMP_REPLY_HEADER_LEN = 3U;                             // opcode + status

        /** @name Readiness */
        const uint32_t  XCMP_DEV_INIT_STATUS_OFFS = 6U;                         // init status byte in the 0xB400 payload
        const uint8_t   XCMP_DEV_INIT_REPLY[] = { 0xB4U, 0x00U, 0x00U, 0x00U, 0x00U, 0x00U, 0x00U, 0x0AU, 0x00U, 0x00U, 0x00U };
        /** @} */

        /** @name Codeplug Access */
        const uint32_t  MAX_READ_BATCH = 60U;
        const uint32_t  DEFAULT_BLOCK_SIZE = 512U;
        const uint32_t  RADIO_KEY_REPLY_MIN_LEN = 35U;
        const uint32_t  RADIO_KEY_OFFS = 3U;
        const uint8_t   PSDT_PARTITION_NAME[] = { 'C', 'P', 0x00U, 0x00U, 0x00U, 0x00U, 0x00U, 0x00U };
        /** @} */

        /** @name Block Transfer Flags */
        const uint8_t   TRANSFER_FLAG_COMPRESSED = 0x01U;
        const uint8_t   TRANSFER_FLAG_LAST = 0x80U;
        /** @} */

        /** @} */

        /** @brief XCMP Opcodes */
        namespace Opcode {
            /** @brief XCMP Opcodes */
            enum : uint16_t {
                RADIO_STATUS = 0x000EU,                 //! Radio Status Query
                VERSION_INFO = 0x000FU,                 //! Version Information Query
                SECURITY_KEY = 0x0012U,                 //! Security Key Query
                CODEPLUG_READ = 0x002EU,                //! Codeplug Record Read

                PROGRAM_MODE = 0x0106U,                 //! Enter/Exit Programming Mode
                UNLOCK_PARTITION = 0x0108U,             //! Unlock Partition
                PSDT_ACCESS = 0x010BU,                  //! Partition Access (Lock/Unlock)
                COMPONENT_SESSION = 0x010FU,            //! Component Session Control

                READ_RADIO_KEY = 0x0300U,               //! Read Radio Key
                UNLOCK_SECURITY = 0x0301U,              //! Unlock Security

                TRANSFER_DATA = 0x0446U,                //! Codeplug Block Transfer

                DEV_INIT_STATUS_BRDCST = 0xB400U,       //! Device Initialization Status Broadcast
                PROGRESS_BRDCST = 0xB10FU               //! Component Session Progress Broadcast
            };
        }

        /** @brief XCMP Reply Status */
        namespace Status {
            /** @brief XCMP Reply Status */
            enum E : uint8_t {
                SUCCESS = 0x00U,                        //! Success
                FAILURE = 0x01U,                        //! Failure
                INVALID_PARAMETER = 0x02U,              //! Invalid Parameter
                REINIT_XNL = 0x03U,                     //! Re-Initialize XNL
                NOT_SUPPORTED = 0x04U,                  //! Not Supported
                BUSY = 0x05U                            //! Busy
            };
        }

        /** @brief Component Session Action Flags */
        namespace SessionAction {
            /** @brief Component Session Action Flags */
            enum : uint16_t {
                START = 0x0001U,                        //! Start Session
                READ_MODE = 0x0010U,                    //! Read Mode
                WRITE_MODE = 0x0020U,                   //! Write Mode
                VALIDATE_CRC = 0x0100U,                 //! Validate CRC
                UNPACK_FILES = 0x0200U,                 //! Unpack Files
                DEPLOY = 0x0400U,                       //! Deploy
                RESET = 0x8000U                         //! Reset Session
            };
        }

        /** @brief Partitions */
        namespace Partition {
            /** @brief Partitions */
            enum E : uint8_t {
                APPLICATION = 0x80U,                    //! Application (Codeplug)
                SECURITY = 0x81U,                       //! Security
                TUNING = 0x82U,                         //! Tuning
                CFS = 0x87U                             //! Customer File System
            };
        }

        /** @brief Partition Access Actions */
        namespace PSDTAction {
            /** @brief Partition Access Actions */
            enum E : uint8_t {
                UNLOCK = 0x01U,                         //! Unlock
                LOCK = 0x02U                            //! Lock
            };
        }

        /** @brief Programming Mode Actions */
        namespace ProgramMode {
            /** @brief Programming Mode Actions */
            enum E : uint8_t {
                EXIT = 0x00U,                           //! Exit Programming Mode
                ENTER = 0x01U                           //! Enter Programming Mode
            };
        }

        /** @brief Radio Status Types */
        namespace RadioStatusType {
            /** @brief Radio Status Types */
            enum E : uint8_t {
                MODEL_NUMBER = 0x07U,                   //! Model Number
                SERIAL_NUMBER = 0x08U,                  //! Serial Number
                RADIO_ID = 0x0EU                        //! Radio ID
            };
        }

        /** @brief Version Information Types */
        namespace VersionType {
            /** @brief Version Information Types */
            enum E : uint8_t {
                FIRMWARE = 0x00U,                       //! Host Firmware
                CODEPLUG = 0x0FU                        //! Codeplug
            };
        }

        /** @brief Device Initialization Status */
        namespace InitStatus {
            /** @brief Device Initialization Status */
            enum E : uint8_t {
                STATUS_QUERY = 0x00U,                   //! Status Query (reply required)
                COMPLETE = 0x01U,                       //! Initialization Complete
                TRANSITIONAL = 0x02U                    //! Status Update
            };
        }

        /** @brief Readiness States */
        namespace ReadyState {
            /** @brief Readiness States */
            enum E : uint8_t {
                AWAITING_QUERY,                         //! Awaiting device status query
                RESPONDED,                              //! Replied to status query
                READY                                   //! Device ready for commands
            };
        }
    } // namespace defines
} // namespace xcmp

#endif // __XCMP_DEFINES_H__
