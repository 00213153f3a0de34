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

TEST_CASE("Radio Identity", "[Radio Identity Test]") {
    SECTION("Identify_Test") {
        bool failed = false;

        INFO("Radio Identify Test");

        MockRadio radio;
        auto session = radio.connect();

        RadioIdentity identity = session->identify();
        if (identity.model != MOCK_MODEL) {
            ::LogDebug("T", "Identify_Test, MODEL %s\n", identity.model.c_str());
            failed = true;
        }
        if (identity.serial != MOCK_SERIAL)
            failed = true;
        if (identity.firmwareVersion != MOCK_FIRMWARE)
            failed = true;
        if (identity.codeplugVersion != MOCK_CODEPLUG)
            failed = true;
        if (identity.radioId != MOCK_RADIO_ID) {
            ::LogDebug("T", "Identify_Test, RADIO ID %u\n", identity.radioId);
            failed = true;
        }

        if (radio.count(Opcode::RADIO_STATUS) != 3U || radio.count(Opcode::VERSION_INFO) != 2U)
            failed = true;

        REQUIRE(failed==false);
    }

    SECTION("Identify_Busy_Test") {
        INFO("Radio Identify Busy Test");

        MockRadio radio;
        auto session = radio.connect();
        radio.setReplyStatus(Opcode::RADIO_STATUS, Status::BUSY);

        REQUIRE_THROWS_AS(session->identify(), cps::DeviceBusy);
        REQUIRE_FALSE(session->isClosed());
    }

    SECTION("Security_Key_Test") {
        INFO("Radio Security Key Test");

        MockRadio radio;
        auto session = radio.connect();

        CodeplugReader reader(session->getDispatcher());
        ByteBuffer key = reader.readSecurityKey();
        REQUIRE(key.size() == 16U);
        REQUIRE(key[0U] == 0xA0U);
        REQUIRE(key[15U] == 0xAFU);
    }
}
