// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Codeplug Access
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "common/Defines.h"
#include "cps/ChannelLayout.h"

using namespace cps;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Gets the channel record field descriptors. */

const std::vector<FieldDescriptor>& ChannelLayout::fields()
{
    static const std::vector<FieldDescriptor> layout = {
        FieldDescriptor(CHANNEL_FIELD_MODE, 0x0EU, 0U, FieldType::UINT8),
        FieldDescriptor(CHANNEL_FIELD_COLOR_CODE, 0x18U, 0U, FieldType::UINT8),
        FieldDescriptor(CHANNEL_FIELD_RX_FREQ, 0x24U, 0U, FieldType::FREQUENCY_5HZ),
        FieldDescriptor(CHANNEL_FIELD_TX_FREQ, 0x28U, 0U, FieldType::FREQUENCY_5HZ),
        FieldDescriptor(CHANNEL_FIELD_RX_TONE, 0x30U, 0U, FieldType::TONE_0_1HZ),
        FieldDescriptor(CHANNEL_FIELD_TX_TONE, 0x32U, 0U, FieldType::TONE_0_1HZ),
        FieldDescriptor(CHANNEL_FIELD_NAME, 0x3CU, CHANNEL_NAME_LEN, FieldType::UTF16LE_STRING),
        FieldDescriptor(CHANNEL_FIELD_POWER, 0x77U, 0U, FieldType::UINT8),
        FieldDescriptor(CHANNEL_FIELD_TOT, 0x78U, 0U, FieldType::UINT16_LE)
    };

    return layout;
}

/* Decodes a channel record. */

FieldMap ChannelLayout::decode(const ByteBuffer& record)
{
    return RecordCodec::decode(record.data(), (uint32_t)record.size(), fields());
}

/* Encodes channel fields into a channel record. */

void ChannelLayout::encode(ByteBuffer& record, const FieldMap& values)
{
    RecordCodec::encode(record.data(), (uint32_t)record.size(), fields(), values);
}
