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
#include "common/zlib/Compression.h"
#include "cps/ProgrammerSession.h"
#include "mock/MockRadio.h"

using namespace cps;
using namespace xcmp::defines;

#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <mutex>

/* Helper to generate a codeplug image. */

static ByteBuffer codeplugImage(uint32_t len)
{
    ByteBuffer image(len, 0x00U);
    for (uint32_t i = 0U; i < len; i++) {
        image[i] = (uint8_t)((i * 31U) ^ (i >> 3));
    }

    return image;
}

/* Helper to keep the opcodes that are part of the write path. */

static std::vector<uint16_t> writeOpcodes(const MockRadio& radio)
{
    std::vector<uint16_t> opcodes;
    for (uint16_t opcode : radio.getOpcodes()) {
        if (opcode == Opcode::TRANSFER_DATA && !opcodes.empty() && opcodes.back() == Opcode::TRANSFER_DATA)
            continue;
        opcodes.push_back(opcode);
    }

    return opcodes;
}

TEST_CASE("Codeplug Writer", "[Codeplug Writer Test]") {
    SECTION("Write_Sequence_Test") {
        bool failed = false;

        INFO("Codeplug Write Sequence Test");

        MockRadio radio;
        auto session = radio.connect();

        std::mutex progressLock;
        std::vector<uint8_t> percents;

        WriteOptions options;
        options.blockSize = 128U;

        ByteBuffer image = codeplugImage(1000U);
        session->writeCodeplug(image, [&](const WriteProgress& progress) {
            std::lock_guard<std::mutex> lock(progressLock);
            percents.push_back(progress.percent);
        }, options);

        // transfer runs are collapsed to a single entry
        std::vector<uint16_t> expected = {
            Opcode::PROGRAM_MODE, Opcode::READ_RADIO_KEY, Opcode::UNLOCK_SECURITY,
            Opcode::UNLOCK_PARTITION, Opcode::PSDT_ACCESS,
            Opcode::COMPONENT_SESSION, Opcode::TRANSFER_DATA, Opcode::COMPONENT_SESSION, Opcode::COMPONENT_SESSION,
            Opcode::PSDT_ACCESS, Opcode::COMPONENT_SESSION, Opcode::PROGRAM_MODE
        };
        if (writeOpcodes(radio) != expected) {
            ::LogDebug("T", "Write_Sequence_Test, UNEXPECTED OPCODE ORDER\n");
            failed = true;
        }

        std::vector<uint16_t> actions = radio.getSessionActions();
        std::vector<uint16_t> expectedActions = {
            (uint16_t)(SessionAction::START | SessionAction::WRITE_MODE), SessionAction::VALIDATE_CRC,
            (uint16_t)(SessionAction::UNPACK_FILES | SessionAction::DEPLOY), SessionAction::RESET
        };
        if (actions != expectedActions)
            failed = true;

        // enter, then exit programming mode; unlock, then lock the partition
        std::vector<ReceivedCommand> commands = radio.getCommands();
        std::vector<uint8_t> modes;
        std::vector<uint8_t> psdt;
        for (const ReceivedCommand& command : commands) {
            if (command.opcode == Opcode::PROGRAM_MODE)
                modes.push_back(command.payload[0U]);
            if (command.opcode == Opcode::PSDT_ACCESS)
                psdt.push_back(command.payload[0U]);
            if (command.opcode == Opcode::UNLOCK_PARTITION && command.payload[0U] != Partition::APPLICATION)
                failed = true;
        }
        if (modes != std::vector<uint8_t>({ ProgramMode::ENTER, ProgramMode::EXIT }))
            failed = true;
        if (psdt != std::vector<uint8_t>({ PSDTAction::UNLOCK, PSDTAction::LOCK }))
            failed = true;

        if (!radio.isSecurityKeyValid())
            failed = true;

        if (radio.getImage() != image) {
            ::LogDebug("T", "Write_Sequence_Test, IMAGE MISMATCH\n");
            failed = true;
        }

        // 1000 bytes in 128 byte blocks, the last one flagged
        std::vector<uint8_t> flags = radio.getTransferFlags();
        if (flags.size() != 8U) {
            failed = true;
        }
        else {
            for (uint32_t i = 0U; i < 7U; i++) {
                if (flags[i] != 0x00U)
                    failed = true;
            }
            if (flags[7U] != TRANSFER_FLAG_LAST)
                failed = true;
        }

        {
            std::lock_guard<std::mutex> lock(progressLock);
            if (percents.empty() || percents.back() != 100U)
                failed = true;
            if (std::find(percents.begin(), percents.end(), (uint8_t)50U) == percents.end())
                failed = true;
        }

        if (radio.getSequenceErrors() != 0U || session->isClosed())
            failed = true;

        REQUIRE(failed==false);
    }

    SECTION("Compressed_Write_Test") {
        bool failed = false;

        INFO("Codeplug Compressed Write Test");

        MockRadio radio;
        auto session = radio.connect();

        WriteOptions options;
        options.compress = true;

        ByteBuffer image(4096U, 0x00U);
        for (uint32_t i = 0U; i < image.size(); i++) {
            image[i] = (uint8_t)(i % 16U);
        }

        session->writeCodeplug(image, nullptr, options);

        ByteBuffer inflated;
        if (!compress::Compression::decompress(radio.getImage(), inflated) || inflated != image) {
            ::LogDebug("T", "Compressed_Write_Test, IMAGE MISMATCH\n");
            failed = true;
        }

        std::vector<uint8_t> flags = radio.getTransferFlags();
        if (flags.empty()) {
            failed = true;
        }
        else {
            for (uint8_t flag : flags) {
                if ((flag & TRANSFER_FLAG_COMPRESSED) == 0U)
                    failed = true;
            }
            if ((flags.back() & TRANSFER_FLAG_LAST) == 0U)
                failed = true;
        }

        REQUIRE(failed==false);
    }

    SECTION("Security_Rejected_Test") {
        bool failed = false;

        INFO("Codeplug Security Rejected Test");

        MockRadio radio;
        auto session = radio.connect();
        radio.setReplyStatus(Opcode::UNLOCK_SECURITY, Status::FAILURE);

        REQUIRE_THROWS_AS(session->writeCodeplug(codeplugImage(256U)), cps::SecurityRejected);

        // no session was started, so none is reset
        std::vector<uint16_t> expected = {
            Opcode::PROGRAM_MODE, Opcode::READ_RADIO_KEY, Opcode::UNLOCK_SECURITY,
            Opcode::PSDT_ACCESS, Opcode::PROGRAM_MODE
        };
        if (radio.getOpcodes() != expected)
            failed = true;
        if (!radio.getSessionActions().empty())
            failed = true;
        if (radio.count(Opcode::TRANSFER_DATA) != 0U)
            failed = true;

        std::vector<ReceivedCommand> commands = radio.getCommands();
        if (commands.back().payload != ByteBuffer(1U, ProgramMode::EXIT))
            failed = true;

        REQUIRE(failed==false);
    }

    SECTION("Transfer_Failure_Test") {
        bool failed = false;

        INFO("Codeplug Transfer Failure Test");

        MockRadio radio;
        auto session = radio.connect();
        radio.setFailTransferBlock(1);

        WriteOptions options;
        options.blockSize = 64U;

        try {
            session->writeCodeplug(codeplugImage(300U), nullptr, options);
            failed = true;
        }
        catch (const cps::CommandFailed& e) {
            if (e.status() != Status::FAILURE)
                failed = true;
        }

        if (radio.count(Opcode::TRANSFER_DATA) != 2U)
            failed = true;

        std::vector<uint16_t> actions = radio.getSessionActions();
        std::vector<uint16_t> expectedActions = {
            (uint16_t)(SessionAction::START | SessionAction::WRITE_MODE), SessionAction::RESET
        };
        if (actions != expectedActions)
            failed = true;

        std::vector<uint16_t> opcodes = radio.getOpcodes();
        if (opcodes.size() < 3U || opcodes[opcodes.size() - 3U] != Opcode::PSDT_ACCESS ||
            opcodes[opcodes.size() - 2U] != Opcode::COMPONENT_SESSION || opcodes.back() != Opcode::PROGRAM_MODE)
            failed = true;

        // a refused block does not tear the session down
        if (session->isClosed())
            failed = true;

        REQUIRE(failed==false);
    }

    SECTION("CRC_Failure_Test") {
        bool failed = false;

        INFO("Codeplug CRC Failure Test");

        MockRadio radio;
        auto session = radio.connect();
        radio.setFailCrc(true);

        REQUIRE_THROWS_AS(session->writeCodeplug(codeplugImage(700U)), cps::CommandFailed);

        std::vector<uint16_t> actions = radio.getSessionActions();
        std::vector<uint16_t> expectedActions = {
            (uint16_t)(SessionAction::START | SessionAction::WRITE_MODE), SessionAction::VALIDATE_CRC, SessionAction::RESET
        };
        if (actions != expectedActions)
            failed = true;

        std::vector<ReceivedCommand> commands = radio.getCommands();
        if (commands.back().opcode != Opcode::PROGRAM_MODE || commands.back().payload != ByteBuffer(1U, ProgramMode::EXIT))
            failed = true;

        REQUIRE(failed==false);
    }

    SECTION("Block_Limits_Test") {
        INFO("Codeplug Block Limits Test");

        MockRadio radio;
        auto session = radio.connect();

        // a block that cannot fit in one XNL frame
        WriteOptions options;
        options.blockSize = MAX_TRANSFER_BLOCK_LEN + 1U;
        REQUIRE_THROWS_AS(session->writeCodeplug(codeplugImage(1024U), nullptr, options), cps::RecordError);

        // more blocks than the 16-bit block field can number
        options.blockSize = 1U;
        REQUIRE_THROWS_AS(session->writeCodeplug(codeplugImage(MAX_TRANSFER_BLOCKS + 1U), nullptr, options), cps::RecordError);

        // both are refused before programming mode is entered
        REQUIRE(radio.getCommands().empty());
        REQUIRE_FALSE(session->isClosed());

        // the largest block still fits
        options.blockSize = MAX_TRANSFER_BLOCK_LEN;
        ByteBuffer image = codeplugImage(MAX_TRANSFER_BLOCK_LEN + 16U);
        session->writeCodeplug(image, nullptr, options);
        REQUIRE(radio.getImage() == image);
        REQUIRE(radio.getTransferFlags().size() == 2U);
    }

    SECTION("Empty_Image_Test") {
        INFO("Codeplug Empty Image Test");

        MockRadio radio;
        auto session = radio.connect();

        REQUIRE_THROWS_AS(session->writeCodeplug(ByteBuffer()), cps::RecordError);
        REQUIRE(radio.getCommands().empty());
    }
}
