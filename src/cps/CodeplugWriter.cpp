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
#include "common/zlib/Compression.h"
#include "cps/CodeplugWriter.h"
#include "cps/CodeplugReader.h"

using namespace cps;
using namespace xcmp;
using namespace xcmp::defines;

#include <cassert>
#include <exception>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the CodeplugWriter class. */

CodeplugWriter::CodeplugWriter(CommandDispatcher* dispatcher, bool debug) :
    m_dispatcher(dispatcher),
    m_tea(),
    m_commandTimeout(DEFAULT_COMMAND_TIMEOUT_MS),
    m_debug(debug)
{
    assert(dispatcher != nullptr);
    m_commandTimeout = dispatcher->getConfig().timeoutMs;
}

/* Writes a codeplug image. */

void CodeplugWriter::write(const ByteBuffer& data, const WriteOptions& options, WriteProgressCallback progress)
{
    if (data.empty()) {
        throw RecordError("Codeplug image is empty");
    }

    m_commandTimeout = options.commandTimeoutMs;
    uint32_t blockSize = (options.blockSize == 0U) ? DEFAULT_BLOCK_SIZE : options.blockSize;

    ByteBuffer image;
    if (options.compress) {
        if (!compress::Compression::compress(data, image)) {
            throw RecordError("Failed to compress the codeplug image");
        }

        LogMessage(LOG_CPS, "Compressed codeplug image, %u -> %u bytes", (uint32_t)data.size(), (uint32_t)image.size());
    }
    else {
        image = data;
    }

    if (blockSize > MAX_TRANSFER_BLOCK_LEN) {
        throw RecordError("Transfer block size " + std::to_string(blockSize) + " exceeds the maximum of " +
            std::to_string(MAX_TRANSFER_BLOCK_LEN) + " bytes");
    }

    size_t blockCount = (image.size() + blockSize - 1U) / blockSize;
    if (blockCount > MAX_TRANSFER_BLOCKS) {
        throw RecordError("Codeplug image of " + std::to_string(image.size()) + " bytes needs " + std::to_string(blockCount) +
            " transfer blocks, the maximum is " + std::to_string(MAX_TRANSFER_BLOCKS));
    }

    LogMessage(LOG_CPS, "Writing codeplug, %u bytes, partition $%02X, block size %u", (uint32_t)image.size(), options.partition, blockSize);

    WriteCleanupGuard guard(this, m_dispatcher);

    // 1. programming mode
    enterProgrammingMode();

    // 2. and 3. security unlock
    ByteBuffer radioKey = readRadioKey();
    ByteBuffer encryptedKey;
    if (!m_tea.encryptRadioKey(radioKey, encryptedKey)) {
        throw RecordError("Failed to encrypt the radio key");
    }

    unlockSecurity(encryptedKey);

    // 4. partition
    unlockPartition(options.partition);

    // 5. session and transfer
    if (progress != nullptr) {
        uint32_t listenerId = m_dispatcher->addBroadcastListener(Opcode::PROGRESS_BRDCST, [progress](uint16_t, const ByteBuffer& data) {
            if (data.size() < 2U) {
                LogWarning(LOG_CPS, "Short write progress broadcast, len = %u", (uint32_t)data.size());
                return;
            }

            WriteProgress report;
            report.status = data[0U];
            report.percent = data[1U];
            progress(report);
        });
        guard.setListenerId(listenerId);
    }

    uint16_t sessionId = startSession();
    guard.setSessionId(sessionId);

    transfer(sessionId, image, options.compress, blockSize, options.transferTimeoutMs);

    // 6. validation
    validate(sessionId, compress::Compression::crc32(image), options.validateTimeoutMs);

    // 7. deploy
    commit(sessionId, options.deployTimeoutMs);

    if (progress != nullptr) {
        WriteProgress report;
        report.status = Status::SUCCESS;
        report.percent = 100U;
        progress(report);
    }

    LogMessage(LOG_CPS, "Codeplug written, session $%04X", sessionId);
}

/* Enters programming mode. */

void CodeplugWriter::enterProgrammingMode()
{
    ByteBuffer payload(1U, ProgramMode::ENTER);
    CommandReply reply = m_dispatcher->send(Opcode::PROGRAM_MODE, payload, m_commandTimeout, m_dispatcher->getConfig().retries);
    reply.checkStatus("Enter programming mode");

    LogMessage(LOG_CPS, "Entered programming mode");
}

/* Reads the radio key used to unlock security. */

ByteBuffer CodeplugWriter::readRadioKey()
{
    CommandReply reply = m_dispatcher->send(Opcode::READ_RADIO_KEY, ByteBuffer(), m_commandTimeout, m_dispatcher->getConfig().retries);
    reply.checkStatus("Read radio key");

    // key bytes follow the opcode and status
    const ByteBuffer& data = reply.getData();
    if (data.size() + XCMP_REPLY_HEADER_LEN < RADIO_KEY_REPLY_MIN_LEN) {
        throw ProtocolViolation("Radio key reply is " + std::to_string(data.size() + XCMP_REPLY_HEADER_LEN) + " bytes, expected " +
            std::to_string(RADIO_KEY_REPLY_MIN_LEN));
    }

    ByteBuffer key(data.begin(), data.begin() + crypto::RADIO_KEY_LEN);
    if (m_debug) {
        Utils::dump(1U, "Radio key", key.data(), (uint32_t)key.size());
    }

    return key;
}

/* Unlocks security with the encrypted radio key. */

void CodeplugWriter::unlockSecurity(const ByteBuffer& encryptedKey)
{
    CommandReply reply = m_dispatcher->send(Opcode::UNLOCK_SECURITY, encryptedKey, m_commandTimeout, m_dispatcher->getConfig().retries);
    if (!reply.isSuccess()) {
        LogError(LOG_CPS, "Security unlock rejected, status %s", CommandReply::statusToString(reply.getStatus()).c_str());
        throw SecurityRejected("Security unlock rejected, status " + CommandReply::statusToString(reply.getStatus()));
    }

    LogMessage(LOG_CPS, "Security unlocked");
}

/* Unlocks the given partition and the codeplug partition access. */

void CodeplugWriter::unlockPartition(uint8_t partition)
{
    ByteBuffer payload(1U, partition);
    CommandReply reply = m_dispatcher->send(Opcode::UNLOCK_PARTITION, payload, m_commandTimeout, m_dispatcher->getConfig().retries);
    reply.checkStatus("Unlock partition $" + __INT_HEX_STR(partition, 2U));

    reply = psdtAccess(PSDTAction::UNLOCK);
    reply.checkStatus("Unlock codeplug partition access");

    LogMessage(LOG_CPS, "Partition $%02X unlocked", partition);
}

/* Starts a write session. */

uint16_t CodeplugWriter::startSession()
{
    uint16_t sessionId = CodeplugReader::newSessionId();

    CommandReply reply = sessionAction(SessionAction::START | SessionAction::WRITE_MODE, sessionId, ByteBuffer(), m_commandTimeout);
    reply.checkStatus("Start write session");

    LogMessage(LOG_CPS, "Write session $%04X started", sessionId);
    return sessionId;
}

/* Transfers the image in blocks. */

void CodeplugWriter::transfer(uint16_t sessionId, const ByteBuffer& data, bool compressed, uint32_t blockSize, uint32_t timeoutMs)
{
    uint32_t blocks = (uint32_t)((data.size() + blockSize - 1U) / blockSize);

    for (uint32_t block = 0U; block < blocks; block++) {
        uint32_t offs = block * blockSize;
        uint32_t len = std::min(blockSize, (uint32_t)data.size() - offs);

        uint8_t flags = 0x00U;
        if (compressed)
            flags |= TRANSFER_FLAG_COMPRESSED;
        if (block == blocks - 1U)
            flags |= TRANSFER_FLAG_LAST;

        ByteBuffer payload(TRANSFER_HEADER_LEN, 0x00U);
        uint8_t* header = payload.data();
        SET_UINT16(sessionId, header, 0U);
        SET_UINT16(block, header, 2U);
        header[4U] = flags;
        SET_UINT16(len, header, 5U);
        payload.insert(payload.end(), data.begin() + offs, data.begin() + offs + len);

        CommandReply reply = m_dispatcher->send(Opcode::TRANSFER_DATA, payload, timeoutMs, m_dispatcher->getConfig().retries);
        reply.checkStatus("Transfer block " + std::to_string(block));

        if (m_debug) {
            LogDebugEx(LOG_CPS, "CodeplugWriter::transfer()", "block %u of %u, len = %u, flags = $%02X", block + 1U, blocks, len, flags);
        }
    }

    LogMessage(LOG_CPS, "Transferred %u bytes in %u blocks", (uint32_t)data.size(), blocks);
}

/* Requests CRC validation of the transferred bytes. */

void CodeplugWriter::validate(uint16_t sessionId, uint32_t crc, uint32_t timeoutMs)
{
    uint8_t buffer[4U];
    SET_UINT32(crc, buffer, 0U);

    CommandReply reply = sessionAction(SessionAction::VALIDATE_CRC, sessionId, ByteBuffer(buffer, buffer + 4U), timeoutMs);
    reply.checkStatus("Validate CRC $" + __INT_HEX_STR(crc, 8U));

    LogMessage(LOG_CPS, "Write session $%04X validated, CRC $%08X", sessionId, crc);
}

/* Unpacks and deploys the validated image. */

void CodeplugWriter::commit(uint16_t sessionId, uint32_t timeoutMs)
{
    CommandReply reply = sessionAction(SessionAction::UNPACK_FILES | SessionAction::DEPLOY, sessionId, ByteBuffer(), timeoutMs);
    reply.checkStatus("Unpack and deploy");

    LogMessage(LOG_CPS, "Write session $%04X deployed", sessionId);
}

/* Locks the codeplug partition access. */

void CodeplugWriter::lockPartition()
{
    CommandReply reply = psdtAccess(PSDTAction::LOCK);
    reply.checkStatus("Lock codeplug partition access");
}

/* Resets a write session. */

void CodeplugWriter::resetSession(uint16_t sessionId)
{
    CommandReply reply = sessionAction(SessionAction::RESET, sessionId, ByteBuffer(), m_commandTimeout);
    reply.checkStatus("Reset write session");
}

/* Exits programming mode. */

void CodeplugWriter::exitProgrammingMode()
{
    ByteBuffer payload(1U, ProgramMode::EXIT);
    CommandReply reply = m_dispatcher->send(Opcode::PROGRAM_MODE, payload, m_commandTimeout, m_dispatcher->getConfig().retries);
    reply.checkStatus("Exit programming mode");

    LogMessage(LOG_CPS, "Exited programming mode");
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to send a component session action. */

CommandReply CodeplugWriter::sessionAction(uint16_t action, uint16_t sessionId, const ByteBuffer& extra, uint32_t timeoutMs)
{
    ByteBuffer payload(4U, 0x00U);
    uint8_t* buffer = payload.data();
    SET_UINT16(action, buffer, 0U);
    SET_UINT16(sessionId, buffer, 2U);
    payload.insert(payload.end(), extra.begin(), extra.end());

    return m_dispatcher->send(Opcode::COMPONENT_SESSION, payload, timeoutMs, m_dispatcher->getConfig().retries);
}

/* Internal helper to send a partition access action. */

CommandReply CodeplugWriter::psdtAccess(uint8_t action)
{
    ByteBuffer payload(1U, action);
    payload.insert(payload.end(), PSDT_PARTITION_NAME, PSDT_PARTITION_NAME + sizeof(PSDT_PARTITION_NAME));

    return m_dispatcher->send(Opcode::PSDT_ACCESS, payload, m_commandTimeout, m_dispatcher->getConfig().retries);
}

// ---------------------------------------------------------------------------
//  WriteCleanupGuard Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the WriteCleanupGuard class. */

WriteCleanupGuard::WriteCleanupGuard(CodeplugWriter* writer, CommandDispatcher* dispatcher) :
    m_writer(writer),
    m_dispatcher(dispatcher),
    m_sessionStarted(false),
    m_sessionId(0U),
    m_listenerId(0U)
{
    assert(writer != nullptr);
    assert(dispatcher != nullptr);
}

/* Finalizes a instance of the WriteCleanupGuard class. */

WriteCleanupGuard::~WriteCleanupGuard()
{
    if (m_listenerId != 0U)
        m_dispatcher->removeBroadcastListener(m_listenerId);

    try {
        m_writer->lockPartition();
    }
    catch (const Exception& e) {
        LogError(LOG_CPS, "Cleanup failed to lock the partition, %s", e.what());
    }
    catch (const std::exception& e) {
        LogError(LOG_CPS, "Cleanup failed to lock the partition, unexpected error, %s", e.what());
    }

    if (m_sessionStarted) {
        try {
            m_writer->resetSession(m_sessionId);
        }
        catch (const Exception& e) {
            LogError(LOG_CPS, "Cleanup failed to reset write session $%04X, %s", m_sessionId, e.what());
        }
        catch (const std::exception& e) {
            LogError(LOG_CPS, "Cleanup failed to reset write session $%04X, unexpected error, %s", m_sessionId, e.what());
        }
    }

    try {
        m_writer->exitProgrammingMode();
    }
    catch (const Exception& e) {
        LogError(LOG_CPS, "Cleanup failed to exit programming mode, %s", e.what());
    }
    catch (const std::exception& e) {
        LogError(LOG_CPS, "Cleanup failed to exit programming mode, unexpected error, %s", e.what());
    }
}

/* Records the started write session. */

void WriteCleanupGuard::setSessionId(uint16_t sessionId)
{
    m_sessionStarted = true;
    m_sessionId = sessionId;
}

/* Records the progress listener to remove on cleanup. */

void WriteCleanupGuard::setListenerId(uint32_t listenerId)
{
    m_listenerId = listenerId;
}
