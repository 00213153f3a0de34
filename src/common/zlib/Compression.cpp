// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "Defines.h"
#include "zlib/Compression.h"
#include "Log.h"
#include "Utils.h"

// zlib declares a global compress() that clashes with namespace compress
#define compress zlib_compress
#include <zlib.h>
#undef compress

using namespace compress;

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

const uint32_t ZLIB_CHUNK_LEN = 16384U;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Compress the given input buffer. */

bool Compression::compress(const ByteBuffer& buffer, ByteBuffer& out)
{
    out.clear();
    if (buffer.empty())
        return false;

    // compression structures
    z_stream strm;
    ::memset(&strm, 0x00U, sizeof(z_stream));
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;

    // initialize compression
    if (deflateInit(&strm, Z_DEFAULT_COMPRESSION) != Z_OK) {
        LogError(LOG_HOST, "Error initializing ZLIB");
        return false;
    }

    // set input data
    strm.avail_in = (uInt)buffer.size();
    strm.next_in = const_cast<Bytef*>(buffer.data());

    int ret;
    do {
        // grow the output buffer as needed
        size_t used = out.size();
        out.resize(used + ZLIB_CHUNK_LEN);
        strm.avail_out = ZLIB_CHUNK_LEN;
        strm.next_out = out.data() + used;

        ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            LogError(LOG_HOST, "ZLIB error compressing data; stream error");
            deflateEnd(&strm);
            out.clear();
            return false;
        }
    } while (ret != Z_STREAM_END);

    out.resize(strm.total_out);
    deflateEnd(&strm);

#if DEBUG_COMPRESS
    Utils::dump(1U, "Compression::compress(), Compressed Data", out.data(), (uint32_t)out.size());
#endif
    return true;
}

/* Decompress the given input buffer. */

bool Compression::decompress(const ByteBuffer& buffer, ByteBuffer& out)
{
    out.clear();
    if (buffer.empty())
        return false;

    // compression structures
    z_stream strm;
    ::memset(&strm, 0x00U, sizeof(z_stream));
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;

    // set input data
    strm.avail_in = (uInt)buffer.size();
    strm.next_in = const_cast<Bytef*>(buffer.data());

    // initialize decompression
    int ret = inflateInit(&strm);
    if (ret != Z_OK) {
        LogError(LOG_HOST, "Error initializing ZLIB");
        return false;
    }

    uint8_t outbuffer[1024U];
    do {
        strm.avail_out = sizeof(outbuffer);
        strm.next_out = outbuffer;

        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            // truncated input surfaces as Z_BUF_ERROR once no progress can be made
            LogError(LOG_HOST, "ZLIB error decompressing compressed data, ret = %d", ret);
            inflateEnd(&strm);
            out.clear();
            return false;
        }

        out.insert(out.end(), outbuffer, outbuffer + sizeof(outbuffer) - strm.avail_out);
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);

#if DEBUG_COMPRESS
    Utils::dump(1U, "Compression::decompress(), Decompressed Data", out.data(), (uint32_t)out.size());
#endif
    return true;
}

/* Calculates the IEEE 802.3 CRC-32 of the given buffer. */

uint32_t Compression::crc32(const ByteBuffer& buffer)
{
    uLong crc = ::crc32(0L, Z_NULL, 0);
    if (buffer.empty())
        return (uint32_t)crc;

    crc = ::crc32(crc, buffer.data(), (uInt)buffer.size());
    return (uint32_t)crc;
}
