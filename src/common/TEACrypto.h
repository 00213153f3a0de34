// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup crypto Cryptography
 * @brief Defines and implements cryptography routines.
 * @ingroup common
 *
 * @file TEACrypto.h
 * @ingroup crypto
 * @file TEACrypto.cpp
 * @ingroup crypto
 */
#if !defined(__TEA_CRYPTO_H__)
#define __TEA_CRYPTO_H__

#include "common/Defines.h"

namespace crypto
{
    // ---------------------------------------------------------------------------
    //  Constants
    // ---------------------------------------------------------------------------

    const uint32_t TEA_BLOCK_LEN = 8U;
    const uint32_t TEA_ROUNDS = 32U;
    const uint32_t TEA_DELTA = 0x790AB771U;

    /** @brief Fixed XNL authentication key words. */
    const uint32_t TEA_XNL_KEY[4U] = { 0x5A96301DU, 0x0CF2AA55U, 0xBF936CC6U, 0xBD5ECD5BU };

    const uint32_t RADIO_KEY_LEN = 32U;

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Tiny Encryption Algorithm, in the variant used for XNL authentication.
     * @ingroup crypto
     *
     * Blocks are 8 bytes, loaded as two big-endian 32-bit halves. The round
     * schedule is standard 32 round TEA with a non-standard delta.
     */
    class CPS_SW_API TEA {
    public:
        /**
         * @brief Initializes a new instance of the TEA class using the XNL key.
         */
        explicit TEA();
        /**
         * @brief Initializes a new instance of the TEA class.
         * @param key 128-bit key as four 32-bit words.
         * @param delta Round delta.
         */
        TEA(const uint32_t key[4U], uint32_t delta);

        /**
         * @brief Encrypt a single 8 byte block.
         * @param in Input block.
         * @param out Output block (may alias input).
         */
        void encryptBlock(const uint8_t* in, uint8_t* out) const;
        /**
         * @brief Decrypt a single 8 byte block.
         * @param in Input block.
         * @param out Output block (may alias input).
         */
        void decryptBlock(const uint8_t* in, uint8_t* out) const;

        /**
         * @brief Encrypt a single block held as a 64-bit integer (first byte is the most significant).
         * @param block Input block.
         * @returns ulong64_t Encrypted block.
         */
        ulong64_t encryptBlock(ulong64_t block) const;
        /**
         * @brief Decrypt a single block held as a 64-bit integer (first byte is the most significant).
         * @param block Input block.
         * @returns ulong64_t Decrypted block.
         */
        ulong64_t decryptBlock(ulong64_t block) const;

        /**
         * @brief Encrypt a buffer as independent 8 byte blocks (ECB).
         * @param in Input buffer; length must be a multiple of 8.
         * @param[out] out Encrypted buffer.
         * @returns bool True, if the buffer was encrypted, otherwise false.
         */
        bool encrypt(const ByteBuffer& in, ByteBuffer& out) const;
        /**
         * @brief Decrypt a buffer as independent 8 byte blocks (ECB).
         * @param in Input buffer; length must be a multiple of 8.
         * @param[out] out Decrypted buffer.
         * @returns bool True, if the buffer was decrypted, otherwise false.
         */
        bool decrypt(const ByteBuffer& in, ByteBuffer& out) const;

        /**
         * @brief Encrypt a 32 byte radio key for the security unlock command.
         * @param radioKey Radio key as read from the radio.
         * @param[out] out Encrypted radio key.
         * @returns bool True, if the key was exactly 32 bytes and was encrypted, otherwise false.
         */
        bool encryptRadioKey(const ByteBuffer& radioKey, ByteBuffer& out) const;

    private:
        uint32_t m_key[4U];
        uint32_t m_delta;
    };
} // namespace crypto

#endif // __TEA_CRYPTO_H__
