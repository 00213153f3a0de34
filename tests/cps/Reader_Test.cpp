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
#include "cps/ProgrammerSession.h"
#include "mock/MockRadio.h"

using namespace cps;
using namespace xcmp::defines;

#include <catch2/catch_test_macros.hpp>

/* Helper to generate recognizable record contents. */

static ByteBuffer recordData(uint16_t id, uint16_t index)
{
    ByteBuffer data(4U + (id % 13U), 0x00U);
    data[0U] = (uint8_t)(id >> 8);
    data[1U] = (uint8_t)(id & 0xFFU);
    data[2U] = (uint8_t)(index >> 8);
    data[3U] = (uint8_t)(index & 0xFFU);
    for (uint32_t i = 4U; i < data.size(); i++) {
        data[i] = (uint8_t)(id + i);
    }

    return data;
}

TEST_CASE("Codeplug Reader", "[Codeplug Reader Test]") {
    SECTION("Batched_Read_Test") {
        bool failed = false;

        INFO("Codeplug Batched Read Test");

        MockRadio radio;
        std::vector<RecordDescriptor> records;
        for (uint16_t i = 0U; i < 130U; i++) {
            RecordDescriptor record(0x0100U + i);
            records.push_back(record);
            radio.addRecord(record, recordData(record.recordId, 0U));
        }

        auto session = radio.connect();

        uint32_t lastDone = 0U;
        uint32_t callbacks = 0U;
        RecordMap result = session->readRecords(records, [&](uint32_t done, uint32_t total) {
            if (done <= lastDone || total != 130U)
                failed = true;
            lastDone = done;
            callbacks++;
        });

        std::vector<uint32_t> batches = radio.getReadBatchSizes();
        if (batches != std::vector<uint32_t>({ 60U, 60U, 10U })) {
            ::LogDebug("T", "Batched_Read_Test, %u BATCHES\n", (uint32_t)batches.size());
            failed = true;
        }

        if (callbacks != 3U || lastDone != 130U)
            failed = true;

        if (result.size() != 130U) {
            failed = true;
        }
        else {
            for (const RecordDescriptor& record : records) {
                if (result[record] != recordData(record.recordId, 0U)) {
                    ::LogDebug("T", "Batched_Read_Test, RECORD %s MISMATCH\n", record.toString().c_str());
                    failed = true;
                }
            }
        }

        REQUIRE(failed==false);
    }

    SECTION("Indexed_Read_Test") {
        bool failed = false;

        INFO("Codeplug Indexed Read Test");

        MockRadio radio;
        std::vector<RecordDescriptor> records;
        records.push_back(RecordDescriptor(0x0200U));
        for (uint16_t i = 0U; i < 4U; i++) {
            records.push_back(RecordDescriptor(0x0FFBU, i));
        }
        records.push_back(RecordDescriptor(0x0201U));

        for (const RecordDescriptor& record : records) {
            radio.addRecord(record, recordData(record.recordId, record.index));
        }

        auto session = radio.connect();
        RecordMap result = session->readRecords(records);

        // each indexed record travels alone, the plain ones share a request
        std::vector<uint32_t> batches = radio.getReadBatchSizes();
        if (batches != std::vector<uint32_t>({ 1U, 1U, 1U, 1U, 2U }))
            failed = true;

        if (result.size() != records.size())
            failed = true;
        for (uint16_t i = 0U; i < 4U; i++) {
            if (result[RecordDescriptor(0x0FFBU, i)] != recordData(0x0FFBU, i))
                failed = true;
        }

        REQUIRE(failed==false);
    }

    SECTION("Reordered_Reply_Test") {
        bool failed = false;

        INFO("Codeplug Reordered Reply Test");

        MockRadio radio;
        radio.setReverseReadEntries(true);
        radio.setExtraReadEntry(true);

        std::vector<RecordDescriptor> records;
        for (uint16_t i = 0U; i < 8U; i++) {
            RecordDescriptor record(0x0300U + (i * 3U));
            records.push_back(record);
            radio.addRecord(record, recordData(record.recordId, 0U));
        }

        auto session = radio.connect();
        RecordMap result = session->readRecords(records);

        // entries are matched by echo; the unrequested $7E7E is dropped
        if (result.size() != records.size())
            failed = true;
        if (result.find(RecordDescriptor(0x7E7EU)) != result.end())
            failed = true;
        for (const RecordDescriptor& record : records) {
            if (result[record] != recordData(record.recordId, 0U))
                failed = true;
        }

        REQUIRE(failed==false);
    }

    SECTION("Refused_Record_Test") {
        bool failed = false;

        INFO("Codeplug Refused Record Test");

        MockRadio radio;
        radio.addRecord(RecordDescriptor(0x0400U), recordData(0x0400U, 0U));
        radio.addRecord(RecordDescriptor(0x0402U), recordData(0x0402U, 0U));

        std::vector<RecordDescriptor> records;
        records.push_back(RecordDescriptor(0x0400U));
        records.push_back(RecordDescriptor(0x0401U));
        records.push_back(RecordDescriptor(0x0402U));

        auto session = radio.connect();
        RecordMap result = session->readRecords(records);

        if (result.size() != 2U)
            failed = true;
        if (result.find(RecordDescriptor(0x0401U)) != result.end())
            failed = true;
        if (session->isClosed())
            failed = true;

        REQUIRE(failed==false);
    }

    SECTION("Missing_Record_Test") {
        INFO("Codeplug Missing Record Test");

        MockRadio radio;
        radio.setOmitReadEntry(true);

        std::vector<RecordDescriptor> records;
        for (uint16_t i = 0U; i < 4U; i++) {
            RecordDescriptor record(0x0600U + i);
            records.push_back(record);
            radio.addRecord(record, recordData(record.recordId, 0U));
        }

        auto session = radio.connect();

        // a requested record neither delivered nor refused
        REQUIRE_THROWS_AS(session->readRecords(records), cps::ProtocolViolation);
        REQUIRE(session->isClosed());
        REQUIRE(radio.getReadBatchSizes() == std::vector<uint32_t>({ 4U }));
    }

    SECTION("List_Records_Test") {
        bool failed = false;

        INFO("Codeplug List Records Test");

        MockRadio radio;
        std::vector<uint16_t> ids = { 0x0FFBU, 0x0010U, 0x0200U, 0x1234U };
        radio.setAvailableRecords(ids);

        auto session = radio.connect();

        std::vector<RecordDescriptor> first = session->listRecords();
        std::vector<RecordDescriptor> second = session->listRecords();

        if (first.size() != ids.size() || first != second)
            failed = true;
        for (uint32_t i = 0U; i < first.size() && !failed; i++) {
            if (first[i].recordId != ids[i] || first[i].indexed)
                failed = true;
        }

        // each listing opens a read session and resets it
        uint16_t open = SessionAction::START | SessionAction::READ_MODE;
        std::vector<uint16_t> actions = radio.getSessionActions();
        if (actions != std::vector<uint16_t>({ open, SessionAction::RESET, open, SessionAction::RESET }))
            failed = true;

        REQUIRE(failed==false);
    }

    SECTION("Read_Failure_Test") {
        INFO("Codeplug Read Failure Test");

        MockRadio radio;
        radio.addRecord(RecordDescriptor(0x0500U), recordData(0x0500U, 0U));

        auto session = radio.connect();
        radio.setReplyStatus(Opcode::CODEPLUG_READ, Status::FAILURE);

        std::vector<RecordDescriptor> records(1U, RecordDescriptor(0x0500U));
        REQUIRE_THROWS_AS(session->readRecords(records), cps::CommandFailed);

        // a refused command leaves the session usable
        REQUIRE_FALSE(session->isClosed());
    }
}
