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
 * @file ChannelLayout.h
 * @ingroup cps
 * @file ChannelLayout.cpp
 * @ingroup cps
 */
#if !defined(__CPS_CHANNEL_LAYOUT_H__)
#define __CPS_CHANNEL_LAYOUT_H__

#include "common/Defines.h"
#include "cps/RecordCodec.h"

#include <vector>

namespace cps
{
    // ---------------------------------------------------------------------------
    //  Constants
    // ---------------------------------------------------------------------------

    const uint16_t  CHANNEL_RECORD_ID = 0x0FFBU;
    const uint32_t  CHANNEL_RECORD_LEN = 324U;
    const uint32_t  CHANNEL_NAME_LEN = 32U;                                     // bytes, 16 UTF-16 code units

    /** @name Channel Field Names */
    const char      CHANNEL_FIELD_MODE[] = "mode";
    const char      CHANNEL_FIELD_COLOR_CODE[] = "colorCode";
    const char      CHANNEL_FIELD_RX_FREQ[] = "rxFrequency";
    const char      CHANNEL_FIELD_TX_FREQ[] = "txFrequency";
    const char      CHANNEL_FIELD_RX_TONE[] = "rxTone";
    const char      CHANNEL_FIELD_TX_TONE[] = "txTone";
    const char      CHANNEL_FIELD_NAME[] = "name";
    const char      CHANNEL_FIELD_POWER[] = "power";
    const char      CHANNEL_FIELD_TOT[] = "tot";
    /** @} */

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Reference field layout of the channel record.
     * @ingroup cps
     */
    class CPS_SW_API ChannelLayout {
    public:
        /**
         * @brief Gets the channel record field descriptors.
         * @returns const std::vector<FieldDescriptor>& Field descriptors.
         */
        static const std::vector<FieldDescriptor>& fields();

        /**
         * @brief Decodes a channel record.
         * @param record Channel record bytes.
         * @returns FieldMap Decoded channel fields.
         */
        static FieldMap decode(const ByteBuffer& record);
        /**
         * @brief Encodes channel fields into a channel record.
         * @param[in,out] record Channel record bytes.
         * @param values Channel fields.
         */
        static void encode(ByteBuffer& record, const FieldMap& values);
    };
} // namespace cps

#endif // __CPS_CHANNEL_LAYOUT_H__
