// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024 Bryan Biedenkapp, N2PLL
 *
 */
#include "Defines.h"
#include "TEACrypto.h"
#include "Log.h"

using namespace crypto;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the TEA class using the XNL key. */

TEA::TEA() :
    m_key(),
    m_delta(TEA_DELTA)
{
    for (uint32_t i = 0U; i < 4U; i++)
        m_key[i] = TEA_XNL_KEY[i];
}

/* Initializes a new instance of the TEA class. */

TEA::TEA(const uint32_t key[4U], uint32_t delta) :
    m_key(),
    m_delta(delta)
{
    for (uint32_t i = 0U; i < 4U; i++)
        m_key[i] = key[i];
}

/* Encrypt a single 8 byte block. */

void TEA::encryptBlock(const uint8_t* in, uint8_t* out) const
{
    uint32_t v0 = GET_UINT32(in, 0U);
    uint32_t v1 = GET_UINT32(in, 4U);

    uint32_t sum = 0U;
    for (uint32_t i = 0U; i < TEA_ROUNDS; i++) {
        sum += m_delta;
        v0 += ((v1 << 4) + m_key[0U]) ^ (v1 + sum) ^ ((v1 >> 5) + m_key[1U]);
        v1 += ((v0 << 4) + m_key[2U]) ^ (v0 + sum) ^ ((v0 >> 5) + m_key[3U]);
    }

    SET_UINT32(v0, out, 0U);
    SET_UINT32(v1, out, 4U);
}

/* Decrypt a single 8 byte block. */

void TEA::decryptBlock(const uint8_t* in, uint8_t* out) const
{
    uint32_t v0 = GET_UINT32(in, 0U);
    uint32_t v1 = GET_UINT32(in, 4U);

    uint32_t sum = m_delta * TEA_ROUNDS;
    for (uint32_t i = 0U; i < TEA_ROUNDS; i++) {
        v1 -= ((v0 << 4) + m_key[2U]) ^ (v0 + sum) ^ ((v0 >> 5) + m_key[3U]);
        v0 -= ((v1 << 4) + m_key[0U]) ^ (v1 + sum) ^ ((v1 >> 5) + m_key[1U]);
        sum -= m_delta;
    }

    SET_UINT32(v0, out, 0U);
    SET_UINT32(v1, out, 4U);
}

/* Encrypt a single block held as a 64-bit integer. */

ulong64_t TEA::encryptBlock(ulong64_t block) const
{
    uint8_t buffer[TEA_BLOCK_LEN];
    SET_UINT32((uint32_t)(block >> 32), buffer, 0U);
    SET_UINT32((uint32_t)(block & 0xFFFFFFFFU), buffer, 4U);

    encryptBlock(buffer, buffer);
    return ((ulong64_t)GET_UINT32(buffer, 0U) << 32) | (ulong64_t)GET_UINT32(buffer, 4U);
}

/* Decrypt a single block held as a 64-bit integer. */

ulong64_t TEA::decryptBlock(ulong64_t block) const
{
    uint8_t buffer[TEA_BLOCK_LEN];
    SET_UINT32((uint32_t)(block >> 32), buffer, 0U);
    SET_UINT32((uint32_t)(block & 0xFFFFFFFFU), buffer, 4U);

    decryptBlock(buffer, buffer);
    return ((ulong64_t)GET_UINT32(buffer, 0U) << 32) | (ulong64_t)GET_UINT32(buffer, 4U);
}

/* Encrypt a buffer as independent 8 byte blocks (ECB). */

bool TEA::encrypt(const ByteBuffer& in, ByteBuffer& out) const
{
    if (in.empty() || (in.size() % TEA_BLOCK_LEN) != 0U) {
        LogError(LOG_HOST, "TEA::encrypt(), input length %u is not a multiple of the block length", (uint32_t)in.size());
        return false;
    }

    out.resize(in.size());
    for (size_t offs = 0U; offs < in.size(); offs += TEA_BLOCK_LEN)
        encryptBlock(in.data() + offs, out.data() + offs);

    return true;
}

/* Decrypt a buffer as independent 8 byte blocks (ECB). */

bool TEA::decrypt(const ByteBuffer& in, ByteBuffer& out) const
{
    if (in.empty() || (in.size() % TEA_BLOCK_LEN) != 0U) {
        LogError(LOG_HOST, "TEA::decrypt(), input length %u is not a multiple of the block length", (uint32_t)in.size());
        return false;
    }

    out.resize(in.size());
    for (size_t offs = 0U; offs < in.size(); offs += TEA_BLOCK_LEN)
        decryptBlock(in.data() + offs, out.data() + offs);

    return true;
}

/* Encrypt a 32 byte radio key for the security unlock command. */

bool TEA::encryptRadioKey(const ByteBuffer& radioKey, ByteBuffer& out) const
{
    if (radioKey.size() != RADIO_KEY_LEN) {
        LogError(LOG_HOST, "TEA::encryptRadioKey(), radio key must be %u bytes, got %u", RADIO_KEY_LEN, (uint32_t)radioKey.size());
        return false;
    }

    return encrypt(radioKey, out);
}
