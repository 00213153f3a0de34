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
#include "common/Exception.h"
#include "common/Log.h"
#include "common/Utils.h"
#include "cps/CodeplugReader.h"

using namespace cps;
using namespace xcmp;
using namespace xcmp::defines;

#include <cassert>
#include <random>
#include <set>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

const uint32_t READ_REPLY_HEADER_LEN = 2U;                  // entry count
const uint32_t READ_ENTRY_HEADER_LEN = 7U;                  // id, index, status, length
const uint32_t SESSION_REPLY_HEADER_LEN = 4U;               // session id, record count

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the CodeplugReader class. */

CodeplugReader::CodeplugReader(CommandDispatcher* dispatcher, bool debug) :
    m_dispatcher(dispatcher),
    m_debug(debug)
{
    assert(dispatcher != nullptr);
}

/* Discovers the record ids available on the device. */

std::vector<uint16_t> CodeplugReader::listAvailableRecords()
{
    uint16_t sessionId = newSessionId();

    uint8_t request[4U];
    uint16_t action = SessionAction::START | SessionAction::READ_MODE;
    SET_UINT16(action, request, 0U);
    SET_UINT16(sessionId, request, 2U);

    CommandReply reply = m_dispatcher->send(Opcode::COMPONENT_SESSION, ByteBuffer(request, request + sizeof(request)));
    reply.checkStatus("Start read session");

    std::vector<uint16_t> ids;
    try {
        const ByteBuffer& data = reply.getData();
        if (data.size() < SESSION_REPLY_HEADER_LEN) {
            throw ProtocolViolation("Truncated read session reply, " + std::to_string(data.size()) + " bytes");
        }

        const uint8_t* buffer = data.data();
        uint16_t replySessionId = GET_UINT16(buffer, 0U);
        uint16_t count = GET_UINT16(buffer, 2U);
        if (replySessionId != sessionId) {
            LogWarning(LOG_CPS, "Read session reply carries session $%04X, expected $%04X", replySessionId, sessionId);
        }

        if (data.size() < SESSION_REPLY_HEADER_LEN + (count * 2U)) {
            throw ProtocolViolation("Read session reply announces " + std::to_string(count) + " records but carries " +
                std::to_string((data.size() - SESSION_REPLY_HEADER_LEN) / 2U));
        }

        for (uint32_t i = 0U; i < count; i++) {
            ids.push_back(GET_UINT16(buffer, SESSION_REPLY_HEADER_LEN + (i * 2U)));
        }
    }
    catch (const Exception&) {
        resetSession(sessionId);
        throw;
    }

    resetSession(sessionId);

    LogMessage(LOG_CPS, "Device reports %u available records", (uint32_t)ids.size());
    return ids;
}

/* Reads the given records. */

RecordMap CodeplugReader::readRecords(const std::vector<RecordDescriptor>& records, uint32_t batchSize, ReadProgressCallback progress)
{
    if (batchSize == 0U || batchSize > MAX_READ_BATCH)
        batchSize = MAX_READ_BATCH;

    // indexed records are unreliable when batched
    std::vector<std::vector<RecordDescriptor>> requests;
    std::vector<RecordDescriptor> batch;
    for (const RecordDescriptor& record : records) {
        if (record.indexed) {
            requests.push_back(std::vector<RecordDescriptor>(1U, record));
            continue;
        }

        batch.push_back(record);
        if (batch.size() == batchSize) {
            requests.push_back(batch);
            batch.clear();
        }
    }

    if (!batch.empty())
        requests.push_back(batch);

    RecordMap result;
    uint32_t done = 0U;
    uint32_t total = (uint32_t)records.size();

    for (const std::vector<RecordDescriptor>& request : requests) {
        readBatch(request, result);

        done += (uint32_t)request.size();
        if (progress != nullptr)
            progress(done, total);
    }

    LogMessage(LOG_CPS, "Read %u of %u records in %u requests", (uint32_t)result.size(), total, (uint32_t)requests.size());
    return result;
}

/* Reads the device security key. */

ByteBuffer CodeplugReader::readSecurityKey()
{
    CommandReply reply = m_dispatcher->send(Opcode::SECURITY_KEY, ByteBuffer());
    reply.checkStatus("Read security key");

    if (m_debug) {
        Utils::dump(1U, "Security key", reply.getData().data(), (uint32_t)reply.getData().size());
    }

    return reply.getData();
}

/* Helper to generate a component session id. */

uint16_t CodeplugReader::newSessionId()
{
    static std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist(0x0001U, 0xFFFEU);
    return (uint16_t)dist(rng);
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to read one request worth of records. */

void CodeplugReader::readBatch(const std::vector<RecordDescriptor>& batch, RecordMap& records)
{
    ByteBuffer request(READ_REPLY_HEADER_LEN + (batch.size() * 4U), 0x00U);
    uint8_t* buffer = request.data();

    uint16_t count = (uint16_t)batch.size();
    SET_UINT16(count, buffer, 0U);
    for (uint32_t i = 0U; i < batch.size(); i++) {
        uint8_t* entry = buffer + READ_REPLY_HEADER_LEN + (i * 4U);
        uint16_t recordId = batch[i].recordId;
        uint16_t index = batch[i].index;
        SET_UINT16(recordId, entry, 0U);
        SET_UINT16(index, entry, 2U);
    }

    CommandReply reply = m_dispatcher->send(Opcode::CODEPLUG_READ, request);
    reply.checkStatus("Codeplug read");

    const ByteBuffer& data = reply.getData();
    if (data.size() < READ_REPLY_HEADER_LEN) {
        throw ProtocolViolation("Truncated codeplug read reply, " + std::to_string(data.size()) + " bytes");
    }

    std::set<RecordDescriptor> pending(batch.begin(), batch.end());

    const uint8_t* body = data.data();
    uint16_t entries = GET_UINT16(body, 0U);
    uint32_t offs = READ_REPLY_HEADER_LEN;

    for (uint32_t i = 0U; i < entries; i++) {
        if (offs + READ_ENTRY_HEADER_LEN > data.size()) {
            throw ProtocolViolation("Codeplug read entry " + std::to_string(i) + " header overruns the reply");
        }

        const uint8_t* entry = body + offs;
        uint16_t recordId = GET_UINT16(entry, 0U);
        uint16_t index = GET_UINT16(entry, 2U);
        uint8_t status = entry[4U];
        uint16_t length = GET_UINT16(entry, 5U);
        offs += READ_ENTRY_HEADER_LEN;

        if (offs + length > data.size()) {
            throw ProtocolViolation("Codeplug read entry $" + __INT_HEX_STR(recordId) + " length " + std::to_string(length) +
                " overruns the reply");
        }

        // entries are matched by their echo, not their position
        std::set<RecordDescriptor>::iterator it = pending.find(RecordDescriptor(recordId, index));
        if (it == pending.end()) {
            LogWarning(LOG_CPS, "Discarding unrequested record $%04X:%u", recordId, index);
            offs += length;
            continue;
        }

        RecordDescriptor descriptor = *it;
        pending.erase(it);

        if (status != Status::SUCCESS) {
            LogWarning(LOG_CPS, "Device refused record %s, status %s", descriptor.toString().c_str(),
                CommandReply::statusToString(status).c_str());
            offs += length;
            continue;
        }

        records[descriptor] = ByteBuffer(entry + READ_ENTRY_HEADER_LEN, entry + READ_ENTRY_HEADER_LEN + length);
        if (m_debug) {
            LogDebugEx(LOG_CPS, "CodeplugReader::readBatch()", "record %s, len = %u", descriptor.toString().c_str(), length);
        }

        offs += length;
    }

    if (!pending.empty()) {
        throw ProtocolViolation("Codeplug read reply is missing record " + pending.begin()->toString() + " and " +
            std::to_string(pending.size() - 1U) + " others");
    }
}

/* Internal helper to close a read session. */

void CodeplugReader::resetSession(uint16_t sessionId)
{
    uint8_t request[4U];
    uint16_t action = SessionAction::RESET;
    SET_UINT16(action, request, 0U);
    SET_UINT16(sessionId, request, 2U);

    CommandReply reply = m_dispatcher->send(Opcode::COMPONENT_SESSION, ByteBuffer(request, request + sizeof(request)));
    if (!reply.isSuccess()) {
        LogWarning(LOG_CPS, "Reset of read session $%04X returned %s", sessionId, CommandReply::statusToString(reply.getStatus()).c_str());
    }
}
