// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Test Suite
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024 Bryan Biedenkapp, N2PLL
 *
 */
#include "Defines.h"
#include "common/TEACrypto.h"
#include "common/Log.h"
#include "common/Utils.h"

using namespace crypto;

#include <catch2/catch_test_macros.hpp>
#include <stdlib.h>
#include <time.h>

TEST_CASE("TEA", "[Crypto Test]") {
    SECTION("TEA_Known_Answer_Test") {
        bool failed = false;

        INFO("TEA Known Answer Test");

        TEA tea = TEA();

        uint8_t zero[8U] = { 0x00U, 0x00U, 0x00U, 0x00U, 0x00U, 0x00U, 0x00U, 0x00U };
        uint8_t zeroExpected[8U] = { 0xBCU, 0xD0U, 0x75U, 0xE4U, 0x01U, 0x4BU, 0x88U, 0xBEU };

        uint8_t seed[8U] = { 0x3CU, 0x91U, 0x07U, 0xE2U, 0x5DU, 0xA8U, 0x14U, 0x6FU };
        uint8_t seedExpected[8U] = { 0x4EU, 0xEFU, 0x6BU, 0x83U, 0x8CU, 0x58U, 0x6AU, 0x42U };

        uint8_t counter[8U] = { 0x01U, 0x02U, 0x03U, 0x04U, 0x05U, 0x06U, 0x07U, 0x08U };
        uint8_t counterExpected[8U] = { 0xF1U, 0x59U, 0xE0U, 0x08U, 0x41U, 0x03U, 0xC5U, 0x33U };

        uint8_t out[8U];

        tea.encryptBlock(zero, out);
        Utils::dump(2U, "TEA_Known_Answer_Test, Zero", out, 8U);
        for (uint32_t i = 0; i < 8U; i++) {
            if (out[i] != zeroExpected[i]) {
                ::LogDebug("T", "TEA_Known_Answer_Test, ZERO INVALID AT IDX %d\n", i);
                failed = true;
            }
        }

        tea.encryptBlock(seed, out);
        Utils::dump(2U, "TEA_Known_Answer_Test, Seed", out, 8U);
        for (uint32_t i = 0; i < 8U; i++) {
            if (out[i] != seedExpected[i]) {
                ::LogDebug("T", "TEA_Known_Answer_Test, SEED INVALID AT IDX %d\n", i);
                failed = true;
            }
        }

        ulong64_t block = tea.encryptBlock((ulong64_t)0x0102030405060708ULL);
        for (uint32_t i = 0; i < 8U; i++) {
            uint8_t b = (uint8_t)(block >> (56U - (i * 8U)));
            if (b != counterExpected[i]) {
                ::LogDebug("T", "TEA_Known_Answer_Test, COUNTER INVALID AT IDX %d\n", i);
                failed = true;
            }
        }

        ulong64_t vectors[3U][2U] = {
            { 0x1B9B4D8AD7DF4274ULL, 0x438D290638271DBFULL },
            { 0xFFFFFFFFFFFFFFFFULL, 0x44B7AD33F98A9C0EULL },
            { 0x123456789ABCDEF0ULL, 0x52D45C7FE0AB13F0ULL }
        };
        for (uint32_t i = 0; i < 3U; i++) {
            if (tea.encryptBlock(vectors[i][0U]) != vectors[i][1U]) {
                ::LogDebug("T", "TEA_Known_Answer_Test, VECTOR %u INVALID\n", i);
                failed = true;
            }
            if (tea.decryptBlock(vectors[i][1U]) != vectors[i][0U]) {
                ::LogDebug("T", "TEA_Known_Answer_Test, VECTOR %u DOES NOT INVERT\n", i);
                failed = true;
            }
        }

        // in-place operation
        ::memcpy(out, counter, 8U);
        tea.encryptBlock(out, out);
        if (::memcmp(out, counterExpected, 8U) != 0) {
            ::LogDebug("T", "TEA_Known_Answer_Test, IN-PLACE MISMATCH\n");
            failed = true;
        }

        REQUIRE(failed==false);
    }

    SECTION("TEA_Crypto_Test") {
        bool failed = false;

        INFO("TEA Crypto Test");

        srand((unsigned int)time(NULL));

        // message
        ByteBuffer message(48U);
        for (uint32_t i = 0; i < 48U; i++) {
            message[i] = (uint8_t)rand();
        }

        TEA* tea = new TEA();

        Utils::dump(2U, "TEA_Crypto_Test, Message", message.data(), 48U);

        ByteBuffer crypted;
        if (!tea->encrypt(message, crypted)) {
            ::LogDebug("T", "TEA_Crypto_Test, ENCRYPT FAILED\n");
            failed = true;
        }
        Utils::dump(2U, "TEA_Crypto_Test, Encrypted", crypted.data(), (uint32_t)crypted.size());

        ByteBuffer decrypted;
        if (!tea->decrypt(crypted, decrypted)) {
            ::LogDebug("T", "TEA_Crypto_Test, DECRYPT FAILED\n");
            failed = true;
        }
        Utils::dump(2U, "TEA_Crypto_Test, Decrypted", decrypted.data(), (uint32_t)decrypted.size());

        if (decrypted.size() != message.size()) {
            failed = true;
        }
        else {
            for (uint32_t i = 0; i < 48U; i++) {
                if (decrypted[i] != message[i]) {
                    ::LogDebug("T", "TEA_Crypto_Test, INVALID AT IDX %d\n", i);
                    failed = true;
                }
            }
        }

        if (crypted == message) {
            ::LogDebug("T", "TEA_Crypto_Test, CIPHERTEXT EQUALS PLAINTEXT\n");
            failed = true;
        }

        delete tea;
        REQUIRE(failed==false);
    }

    SECTION("TEA_Radio_Key_Test") {
        bool failed = false;

        INFO("TEA Radio Key Test");

        TEA tea = TEA();

        ByteBuffer key(RADIO_KEY_LEN);
        for (uint32_t i = 0; i < RADIO_KEY_LEN; i++) {
            key[i] = (uint8_t)(0x40U + (i * 7U));
        }

        ByteBuffer encrypted;
        if (!tea.encryptRadioKey(key, encrypted) || encrypted.size() != RADIO_KEY_LEN) {
            ::LogDebug("T", "TEA_Radio_Key_Test, ENCRYPT FAILED\n");
            failed = true;
        }

        // four independent blocks
        for (uint32_t block = 0; block < 4U && !failed; block++) {
            uint8_t expected[8U];
            tea.encryptBlock(key.data() + (block * 8U), expected);
            if (::memcmp(expected, encrypted.data() + (block * 8U), 8U) != 0) {
                ::LogDebug("T", "TEA_Radio_Key_Test, BLOCK %u MISMATCH\n", block);
                failed = true;
            }
        }

        ByteBuffer shortKey(RADIO_KEY_LEN - 1U, 0x55U);
        ByteBuffer ignored;
        if (tea.encryptRadioKey(shortKey, ignored)) {
            ::LogDebug("T", "TEA_Radio_Key_Test, SHORT KEY ACCEPTED\n");
            failed = true;
        }

        ByteBuffer ragged(12U, 0x55U);
        if (tea.encrypt(ragged, ignored)) {
            ::LogDebug("T", "TEA_Radio_Key_Test, RAGGED BUFFER ACCEPTED\n");
            failed = true;
        }

        REQUIRE(failed==false);
    }
}
