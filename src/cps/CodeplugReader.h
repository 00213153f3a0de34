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
 * @file CodeplugReader.h
 * @ingroup cps
 * @file CodeplugReader.cpp
 * @ingroup cps
 */
#if !defined(__CPS_CODEPLUG_READER_H__)
#define __CPS_CODEPLUG_READER_H__

#include "common/Defines.h"
#include "cps/RecordDescriptor.h"
#include "xcmp/XCMPDefines.h"
#include "xcmp/CommandDispatcher.h"

#include <vector>

namespace cps
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements record discovery and batched record reads.
     * @ingroup cps
     */
    class CPS_SW_API CodeplugReader {
    public:
        /**
         * @brief Initializes a new instance of the CodeplugReader class.
         * @param dispatcher Command dispatcher.
         * @param debug Flag indicating whether debug logging is enabled.
         */
        CodeplugReader(xcmp::CommandDispatcher* dispatcher, bool debug = false);

        /**
         * @brief Discovers the record ids available on the device.
         * @returns std::vector<uint16_t> Record ids, in the order the device reported them.
         */
        std::vector<uint16_t> listAvailableRecords();

        /**
         * @brief Reads the given records.
         *  Non-indexed records are batched; indexed records are read one per request.
         * @param records Records to read.
         * @param batchSize Maximum records per request (clamped to 60).
         * @param progress Optional progress callback.
         * @returns RecordMap Record bytes keyed by descriptor. Records the device refused are absent.
         */
        RecordMap readRecords(const std::vector<RecordDescriptor>& records, uint32_t batchSize = xcmp::defines::MAX_READ_BATCH,
            ReadProgressCallback progress = nullptr);

        /**
         * @brief Reads the device security key.
         * @returns ByteBuffer Security key bytes.
         */
        ByteBuffer readSecurityKey();

        /**
         * @brief Helper to generate a component session id.
         * @returns uint16_t Session id (1 - 0xFFFE).
         */
        static uint16_t newSessionId();

    private:
        xcmp::CommandDispatcher* m_dispatcher;
        bool m_debug;

        /**
         * @brief Internal helper to read one request worth of records.
         * @param batch Records in this request.
         * @param[out] records Record bytes keyed by descriptor.
         */
        void readBatch(const std::vector<RecordDescriptor>& batch, RecordMap& records);
        /**
         * @brief Internal helper to close a read session.
         * @param sessionId Session id.
         */
        void resetSession(uint16_t sessionId);
    };
} // namespace cps

#endif // __CPS_CODEPLUG_READER_H__
