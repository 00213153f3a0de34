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
 * @defgroup cps Codeplug Access
 * @brief Implementation for reading, writing and decoding radio codeplugs.
 *
 * @file RecordDescriptor.h
 * @ingroup cps
 */
#if !defined(__CPS_RECORD_DESCRIPTOR_H__)
#define __CPS_RECORD_DESCRIPTOR_H__

#include "common/Defines.h"

#include <cstdio>
#include <functional>
#include <map>
#include <string>

namespace cps
{
    // ---------------------------------------------------------------------------
    //  Structure Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Identifies one readable or writable codeplug record.
     * @ingroup cps
     */
    struct RecordDescriptor {
    public:
        /**
         * @brief Initializes a new instance of the RecordDescriptor struct.
         */
        RecordDescriptor() :
            recordId(0U),
            index(0U),
            indexed(false)
        {
            /* stub */
        }
        /**
         * @brief Initializes a new instance of the RecordDescriptor struct.
         * @param id Record id.
         */
        explicit RecordDescriptor(uint16_t id) :
            recordId(id),
            index(0U),
            indexed(false)
        {
            /* stub */
        }
        /**
         * @brief Initializes a new instance of the RecordDescriptor struct for a repeating record.
         * @param id Record id.
         * @param idx Record index.
         */
        RecordDescriptor(uint16_t id, uint16_t idx) :
            recordId(id),
            index(idx),
            indexed(true)
        {
            /* stub */
        }

        uint16_t recordId;      //! Record id.
        uint16_t index;         //! Record index (0 for non-indexed records).
        bool indexed;           //! Flag indicating the record repeats and is read one index at a time.

        /**
         * @brief Helper to describe the record for logging.
         * @returns std::string Textual description.
         */
        std::string toString() const
        {
            char buffer[32U];
            if (indexed)
                ::snprintf(buffer, sizeof(buffer), "$%04X:%u", recordId, index);
            else
                ::snprintf(buffer, sizeof(buffer), "$%04X", recordId);
            return std::string(buffer);
        }

        /** @brief Equals operator. */
        bool operator==(const RecordDescriptor& data) const { return recordId == data.recordId && index == data.index; }
        /** @brief Not-equals operator. */
        bool operator!=(const RecordDescriptor& data) const { return !(*this == data); }
        /** @brief Less-than operator. */
        bool operator<(const RecordDescriptor& data) const
        {
            if (recordId != data.recordId)
                return recordId < data.recordId;
            return index < data.index;
        }
    };

    /**
     * @brief Record bytes keyed by descriptor.
     */
    typedef std::map<RecordDescriptor, ByteBuffer> RecordMap;

    /**
     * @brief Callback reporting read progress (records completed, records requested).
     */
    typedef std::function<void(uint32_t done, uint32_t total)> ReadProgressCallback;
} // namespace cps

#endif // __CPS_RECORD_DESCRIPTOR_H__
