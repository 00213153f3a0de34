// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup compress Compression
 * @brief Defines and implements zlib deflate helpers used for codeplug transfer.
 * @ingroup common
 *
 * @file Compression.h
 * @ingroup compress
 * @file Compression.cpp
 * @ingroup compress
 */
#if !defined(__COMPRESSION_H__)
#define __COMPRESSION_H__

#include "common/Defines.h"

namespace compress
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements zlib compression, decompression and checksumming.
     * @ingroup compress
     */
    class CPS_SW_API Compression {
    public:
        /**
         * @brief Compress the given input buffer.
         * @param buffer Buffer to compress.
         * @param[out] out Compressed (zlib stream) data.
         * @returns bool True, if the buffer was compressed, otherwise false.
         */
        static bool compress(const ByteBuffer& buffer, ByteBuffer& out);
        /**
         * @brief Decompress the given input buffer.
         * @param buffer Buffer to decompress.
         * @param[out] out Decompressed data.
         * @returns bool True, if the buffer was decompressed, otherwise false.
         */
        static bool decompress(const ByteBuffer& buffer, ByteBuffer& out);

        /**
         * @brief Calculates the IEEE 802.3 CRC-32 of the given buffer.
         * @param buffer Buffer to checksum.
         * @returns uint32_t CRC-32.
         */
        static uint32_t crc32(const ByteBuffer& buffer);
    };
} // namespace compress

#endif // __COMPRESSION_H__
