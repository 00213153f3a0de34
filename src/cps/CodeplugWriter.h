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
 * @file CodeplugWriter.h
 * @ingroup cps
 * @file CodeplugWriter.cpp
 * @ingroup cps
 */
#if !defined(__CPS_CODEPLUG_WRITER_H__)
#define __CPS_CODEPLUG_WRITER_H__

#include "common/Defines.h"
#include "common/TEACrypto.h"
#include "xnl/XNLDefines.h"
#include "xcmp/XCMPDefines.h"
#include "xcmp/CommandDispatcher.h"

#include <functional>

namespace cps
{
    // ---------------------------------------------------------------------------
    //  Constants
    // ---------------------------------------------------------------------------

    const uint32_t DEFAULT_TRANSFER_TIMEOUT_MS = 10000U;
    const uint32_t DEFAULT_VALIDATE_TIMEOUT_MS = 30000U;
    const uint32_t DEFAULT_DEPLOY_TIMEOUT_MS = 60000U;

    const uint32_t TRANSFER_HEADER_LEN = 7U;                                    // session id, block, flags, length
    const uint32_t MAX_TRANSFER_BLOCK_LEN = xnl::defines::XNL_MAX_PAYLOAD_LEN - xcmp::defines::XCMP_OPCODE_LEN - TRANSFER_HEADER_LEN;
    const uint32_t MAX_TRANSFER_BLOCKS = 0xFFFFU;                               // block count must fit the 16-bit block field

    // ---------------------------------------------------------------------------
    //  Structure Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Codeplug write parameters.
     * @ingroup cps
     */
    struct WriteOptions {
    public:
        /**
         * @brief Initializes a new instance of the WriteOptions struct.
         */
        WriteOptions() :
            partition(xcmp::defines::Partition::APPLICATION),
            blockSize(xcmp::defines::DEFAULT_BLOCK_SIZE),
            compress(false),
            commandTimeoutMs(DEFAULT_COMMAND_TIMEOUT_MS),
            transferTimeoutMs(DEFAULT_TRANSFER_TIMEOUT_MS),
            validateTimeoutMs(DEFAULT_VALIDATE_TIMEOUT_MS),
            deployTimeoutMs(DEFAULT_DEPLOY_TIMEOUT_MS)
        {
            /* stub */
        }

        uint8_t partition;              //! Partition to unlock.
        uint32_t blockSize;             //! Transfer block size.
        bool compress;                  //! Flag indicating the image is deflated before transfer.
        uint32_t commandTimeoutMs;      //! Timeout for mode, key and partition commands.
        uint32_t transferTimeoutMs;     //! Timeout for each transfer block.
        uint32_t validateTimeoutMs;     //! Timeout for CRC validation.
        uint32_t deployTimeoutMs;       //! Timeout for unpack and deploy.
    };

    /**
     * @brief Write progress reported by the device.
     * @ingroup cps
     */
    struct WriteProgress {
        uint8_t status;                 //! Device progress status.
        uint8_t percent;                //! Percent complete.
    };

    /**
     * @brief Callback reporting write progress.
     */
    typedef std::function<void(const WriteProgress& progress)> WriteProgressCallback;

    // ---------------------------------------------------------------------------
    //  Class Prototypes
    // ---------------------------------------------------------------------------

    class CPS_SW_API WriteCleanupGuard;

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements the security unlock and commit sequence used to write a codeplug.
     * @ingroup cps
     */
    class CPS_SW_API CodeplugWriter {
    public:
        /**
         * @brief Initializes a new instance of the CodeplugWriter class.
         * @param dispatcher Command dispatcher.
         * @param debug Flag indicating whether debug logging is enabled.
         */
        CodeplugWriter(xcmp::CommandDispatcher* dispatcher, bool debug = false);

        /**
         * @brief Writes a codeplug image.
         *  The partition is always locked again, any started session is reset and programming
         *  mode is always exited before this returns, whether or not the write succeeded.
         * @param data Codeplug image.
         * @param options Write parameters.
         * @param progress Optional progress callback.
         */
        void write(const ByteBuffer& data, const WriteOptions& options = WriteOptions(), WriteProgressCallback progress = nullptr);

        /** @name Write Steps */
        /**
         * @brief Enters programming mode.
         */
        void enterProgrammingMode();
        /**
         * @brief Reads the radio key used to unlock security.
         * @returns ByteBuffer 32 byte radio key.
         */
        ByteBuffer readRadioKey();
        /**
         * @brief Unlocks security with the encrypted radio key.
         * @param encryptedKey 32 byte encrypted radio key.
         * @throws cps::SecurityRejected if the device refuses the key.
         */
        void unlockSecurity(const ByteBuffer& encryptedKey);
        /**
         * @brief Unlocks the given partition and the codeplug partition access.
         * @param partition Partition.
         */
        void unlockPartition(uint8_t partition);
        /**
         * @brief Starts a write session.
         * @returns uint16_t Session id.
         */
        uint16_t startSession();
        /**
         * @brief Transfers the image in blocks.
         * @param sessionId Session id.
         * @param data Bytes to transfer.
         * @param compressed Flag indicating the bytes are deflated.
         * @param blockSize Block size.
         * @param timeoutMs Timeout for each block.
         */
        void transfer(uint16_t sessionId, const ByteBuffer& data, bool compressed, uint32_t blockSize, uint32_t timeoutMs);
        /**
         * @brief Requests CRC validation of the transferred bytes.
         * @param sessionId Session id.
         * @param crc CRC-32 of the transferred bytes.
         * @param timeoutMs Timeout.
         */
        void validate(uint16_t sessionId, uint32_t crc, uint32_t timeoutMs);
        /**
         * @brief Unpacks and deploys the validated image.
         * @param sessionId Session id.
         * @param timeoutMs Timeout.
         */
        void commit(uint16_t sessionId, uint32_t timeoutMs);
        /**
         * @brief Locks the codeplug partition access.
         */
        void lockPartition();
        /**
         * @brief Resets a write session.
         * @param sessionId Session id.
         */
        void resetSession(uint16_t sessionId);
        /**
         * @brief Exits programming mode.
         */
        void exitProgrammingMode();
        /** @} */

    private:
        xcmp::CommandDispatcher* m_dispatcher;
        crypto::TEA m_tea;
        uint32_t m_commandTimeout;
        bool m_debug;

        /**
         * @brief Internal helper to send a component session action.
         * @param action Action flags.
         * @param sessionId Session id.
         * @param extra Bytes following the session id.
         * @param timeoutMs Timeout.
         * @returns CommandReply Reply.
         */
        xcmp::CommandReply sessionAction(uint16_t action, uint16_t sessionId, const ByteBuffer& extra, uint32_t timeoutMs);
        /**
         * @brief Internal helper to send a partition access action.
         * @param action Partition access action.
         * @returns CommandReply Reply.
         */
        xcmp::CommandReply psdtAccess(uint8_t action);
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Runs the write cleanup steps when it leaves scope.
     * @ingroup cps
     *
     * Cleanup locks the partition, resets the write session (if one was started) and exits
     * programming mode, in that order. Cleanup failures are logged and never thrown.
     */
    class CPS_SW_API WriteCleanupGuard {
    public:
        /**
         * @brief Initializes a new instance of the WriteCleanupGuard class.
         * @param writer Codeplug writer.
         * @param dispatcher Command dispatcher.
         */
        WriteCleanupGuard(CodeplugWriter* writer, xcmp::CommandDispatcher* dispatcher);
        /**
         * @brief Finalizes a instance of the WriteCleanupGuard class.
         */
        ~WriteCleanupGuard();

        /**
         * @brief Records the started write session.
         * @param sessionId Session id.
         */
        void setSessionId(uint16_t sessionId);
        /**
         * @brief Records the progress listener to remove on cleanup.
         * @param listenerId Broadcast listener id.
         */
        void setListenerId(uint32_t listenerId);

    private:
        CodeplugWriter* m_writer;
        xcmp::CommandDispatcher* m_dispatcher;

        bool m_sessionStarted;
        uint16_t m_sessionId;
        uint32_t m_listenerId;

        WriteCleanupGuard(const WriteCleanupGuard&) = delete;
        WriteCleanupGuard& operator=(const WriteCleanupGuard&) = delete;
    };
} // namespace cps

#endif // __CPS_CODEPLUG_WRITER_H__
