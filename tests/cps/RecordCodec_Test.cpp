// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Test Suite
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "Defines.h"
#include "common/Exception.h"
#include "common/Log.h"
#include "common/Utils.h"
#include "cps/ChannelLayout.h"
#include "cps/RecordCodec.h"

using namespace cps;

#include <catch2/catch_test_macros.hpp>

/* Helper to build the reference channel record. */

static ByteBuffer referenceChannel()
{
    ByteBuffer record(CHANNEL_RECORD_LEN, 0x00U);

    record[0x0EU] = 0x01U;                                      // mode
    record[0x18U] = 0x07U;                                      // color code

    // 451.025 MHz / 456.025 MHz in 5 Hz steps
    uint8_t rx[] = { 0x48U, 0x6BU, 0x60U, 0x05U };
    uint8_t tx[] = { 0x88U, 0xADU, 0x6FU, 0x05U };
    ::memcpy(record.data() + 0x24U, rx, 4U);
    ::memcpy(record.data() + 0x28U, tx, 4U);

    // 131.8 Hz / 88.5 Hz
    record[0x30U] = 0x26U; record[0x31U] = 0x05U;
    record[0x32U] = 0x75U; record[0x33U] = 0x03U;

    // "Ops 1 Ω"
    uint8_t name[] = { 0x4FU, 0x00U, 0x70U, 0x00U, 0x73U, 0x00U, 0x20U, 0x00U, 0x31U, 0x00U, 0x20U, 0x00U, 0xA9U, 0x03U };
    ::memcpy(record.data() + 0x3CU, name, sizeof(name));

    record[0x77U] = 0x02U;                                      // power
    record[0x78U] = 0x3CU; record[0x79U] = 0x00U;               // tot

    return record;
}

TEST_CASE("Record Codec", "[Record Codec Test]") {
    SECTION("Channel_Decode_Test") {
        bool failed = false;

        INFO("Channel Record Decode Test");

        FieldMap values = ChannelLayout::decode(referenceChannel());
        if (values.size() != ChannelLayout::fields().size())
            failed = true;

        if (values[CHANNEL_FIELD_MODE].getNumber() != 1U || values[CHANNEL_FIELD_COLOR_CODE].getNumber() != 7U)
            failed = true;

        if (values[CHANNEL_FIELD_RX_FREQ].getNumber() != 451025000ULL) {
            ::LogDebug("T", "Channel_Decode_Test, RX FREQ %s\n", values[CHANNEL_FIELD_RX_FREQ].toString().c_str());
            failed = true;
        }
        if (values[CHANNEL_FIELD_TX_FREQ].getNumber() != 456025000ULL)
            failed = true;
        if (values[CHANNEL_FIELD_RX_FREQ].toString() != "451.025000 MHz")
            failed = true;

        if (values[CHANNEL_FIELD_RX_TONE].getNumber() != 1318U || values[CHANNEL_FIELD_TX_TONE].getNumber() != 885U)
            failed = true;
        if (values[CHANNEL_FIELD_RX_TONE].toString() != "131.8 Hz")
            failed = true;

        if (values[CHANNEL_FIELD_NAME].getText() != "Ops 1 \xCE\xA9") {
            ::LogDebug("T", "Channel_Decode_Test, NAME %s\n", values[CHANNEL_FIELD_NAME].getText().c_str());
            failed = true;
        }

        if (values[CHANNEL_FIELD_POWER].getNumber() != 2U || values[CHANNEL_FIELD_TOT].getNumber() != 60U)
            failed = true;

        REQUIRE(failed==false);
    }

    SECTION("Channel_Encode_Test") {
        bool failed = false;

        INFO("Channel Record Encode Test");

        // re-encoding the decoded fields reproduces the record
        ByteBuffer reference = referenceChannel();
        ByteBuffer record(CHANNEL_RECORD_LEN, 0x00U);
        ChannelLayout::encode(record, ChannelLayout::decode(reference));
        if (record != reference) {
            Utils::dump(2U, "Channel_Encode_Test, Encoded", record.data(), 0x80U);
            failed = true;
        }

        // partial updates leave the other fields alone
        FieldMap update;
        update[CHANNEL_FIELD_RX_FREQ] = FieldValue::number(FieldType::FREQUENCY_5HZ, 462562500ULL);
        update[CHANNEL_FIELD_NAME] = FieldValue::text("FRS 1");
        ChannelLayout::encode(record, update);

        FieldMap values = ChannelLayout::decode(record);
        if (values[CHANNEL_FIELD_RX_FREQ].getNumber() != 462562500ULL)
            failed = true;
        if (values[CHANNEL_FIELD_TX_FREQ].getNumber() != 456025000ULL)
            failed = true;
        if (values[CHANNEL_FIELD_NAME].getText() != "FRS 1")
            failed = true;

        // the shorter name is NUL padded
        for (uint32_t i = 0x3CU + 10U; i < 0x3CU + CHANNEL_NAME_LEN; i++) {
            if (record[i] != 0x00U)
                failed = true;
        }

        REQUIRE(failed==false);
    }

    SECTION("Field_Bounds_Test") {
        INFO("Record Field Bounds Test");

        uint8_t record[8U] = { 0x01U, 0x02U, 0x03U, 0x04U, 0x05U, 0x06U, 0x07U, 0x08U };

        FieldDescriptor inside("inside", 4U, 0U, FieldType::UINT32_LE);
        REQUIRE(RecordCodec::decodeField(record, sizeof(record), inside).getNumber() == 0x08070605U);

        FieldDescriptor straddle("straddle", 6U, 0U, FieldType::UINT32_LE);
        REQUIRE_THROWS_AS(RecordCodec::decodeField(record, sizeof(record), straddle), cps::RecordError);

        FieldDescriptor past("past", 8U, 0U, FieldType::UINT8);
        REQUIRE_THROWS_AS(RecordCodec::decodeField(record, sizeof(record), past), cps::RecordError);

        FieldDescriptor text("text", 2U, 8U, FieldType::UTF16LE_STRING);
        REQUIRE_THROWS_AS(RecordCodec::encodeField(record, sizeof(record), text, FieldValue::text("ab")), cps::RecordError);

        // a short channel record cannot hold the layout
        ByteBuffer truncated(0x40U, 0x00U);
        REQUIRE_THROWS_AS(ChannelLayout::decode(truncated), cps::RecordError);
    }

    SECTION("Field_Value_Test") {
        INFO("Record Field Value Test");

        uint8_t record[8U] = { 0x00U };
        FieldDescriptor byte("byte", 0U, 0U, FieldType::UINT8);
        FieldDescriptor word("word", 2U, 0U, FieldType::UINT16_LE);
        FieldDescriptor name("name", 4U, 4U, FieldType::UTF16LE_STRING);

        // values that do not fit or do not match the field type
        REQUIRE_THROWS_AS(RecordCodec::encodeField(record, sizeof(record), byte, FieldValue::number(FieldType::UINT8, 256U)),
            cps::RecordError);
        REQUIRE_THROWS_AS(RecordCodec::encodeField(record, sizeof(record), word, FieldValue::text("12")), cps::RecordError);
        REQUIRE_THROWS_AS(RecordCodec::encodeField(record, sizeof(record), name, FieldValue::number(FieldType::UINT8, 1U)),
            cps::RecordError);
        REQUIRE_THROWS_AS(RecordCodec::encodeField(record, sizeof(record), name, FieldValue::text("abc")), cps::RecordError);

        RecordCodec::encodeField(record, sizeof(record), word, FieldValue::number(FieldType::UINT16_LE, 0xBEEFU));
        REQUIRE(record[2U] == 0xEFU);
        REQUIRE(record[3U] == 0xBEU);

        // neighbouring bytes are untouched
        REQUIRE(record[1U] == 0x00U);
        REQUIRE(record[4U] == 0x00U);
    }

    SECTION("Text_Conversion_Test") {
        bool failed = false;

        INFO("Record Text Conversion Test");

        // BMP and supplementary plane characters
        ByteBuffer utf16;
        if (!RecordCodec::utf8ToUtf16le("A\xCE\xA9\xF0\x9F\x98\x80", utf16))
            failed = true;

        uint8_t expected[] = { 0x41U, 0x00U, 0xA9U, 0x03U, 0x3DU, 0xD8U, 0x00U, 0xDEU };
        if (utf16 != ByteBuffer(expected, expected + sizeof(expected)))
            failed = true;

        if (RecordCodec::utf16leToUtf8(expected, sizeof(expected)) != "A\xCE\xA9\xF0\x9F\x98\x80")
            failed = true;

        // conversion stops at the first NUL
        uint8_t padded[] = { 0x48U, 0x00U, 0x69U, 0x00U, 0x00U, 0x00U, 0x5AU, 0x00U };
        if (RecordCodec::utf16leToUtf8(padded, sizeof(padded)) != "Hi")
            failed = true;

        // an unpaired surrogate becomes U+FFFD
        uint8_t lone[] = { 0x3DU, 0xD8U, 0x41U, 0x00U };
        if (RecordCodec::utf16leToUtf8(lone, sizeof(lone)) != "\xEF\xBF\xBD" "A")
            failed = true;

        // malformed UTF-8 is refused
        if (RecordCodec::utf8ToUtf16le("\xC3", utf16))
            failed = true;
        if (RecordCodec::utf8ToUtf16le("\xFF\x41", utf16))
            failed = true;
        if (RecordCodec::utf8ToUtf16le("\xE2\x28\xA1", utf16))
            failed = true;
        if (RecordCodec::utf8ToUtf16le("\xED\xA0\x80", utf16))
            failed = true;

        // overlong forms are refused
        if (RecordCodec::utf8ToUtf16le(std::string("\xC0\x80", 2U), utf16))
            failed = true;
        if (RecordCodec::utf8ToUtf16le("\xC1\xBF", utf16))
            failed = true;
        if (RecordCodec::utf8ToUtf16le("\xE0\x80\xAF", utf16))
            failed = true;
        if (RecordCodec::utf8ToUtf16le("\xF0\x8F\xBF\xBF", utf16))
            failed = true;

        // the shortest forms at each boundary are accepted
        if (!RecordCodec::utf8ToUtf16le("\xC2\x80\xE0\xA0\x80\xF0\x90\x80\x80", utf16) || utf16.size() != 8U)
            failed = true;

        REQUIRE(failed==false);
    }
}
