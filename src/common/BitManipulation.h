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
 * @file BitManipulation.h
 * @ingroup common
 */
#pragma once
#if !defined(__BIT_MANIPULATION_H__)
#define __BIT_MANIPULATION_H__

#if !defined(__COMMON_DEFINES_H__)
#warning "BitManipulation.h included before Defines.h, please check include order"
#include "common/Defines.h"
#endif

// ---------------------------------------------------------------------------
//  Macros
// ---------------------------------------------------------------------------

/*
** Big-endian (network order) accessors. XNL and XCMP framing always uses these.
*/

/**
 * @brief Sets a uint32_t into 4 bytes of a buffer/array. (32-bit value, big-endian).
 * @ingroup common
 * @param val uint32_t value to set
 * @param buffer uint8_t buffer to set value on
 * @param offset Offset within uint8_t buffer
 */
#define SET_UINT32(val, buffer, offset)                     \
            buffer[0U + (offset)] = ((val) >> 24) & 0xFFU;  \
            buffer[1U + (offset)] = ((val) >> 16) & 0xFFU;  \
            buffer[2U + (offset)] = ((val) >> 8) & 0xFFU;   \
            buffer[3U + (offset)] = ((val) >> 0) & 0xFFU;
/**
 * @brief Gets a uint32_t consisting of 4 bytes from a buffer/array. (32-bit value, big-endian).
 * @ingroup common
 * @param buffer uint8_t buffer to get value from
 * @param offset Offset within uint8_t buffer
 */
#define GET_UINT32(buffer, offset)                                  \
            (((uint32_t)buffer[(offset) + 0U] << 24)    |           \
             ((uint32_t)buffer[(offset) + 1U] << 16)    |           \
             ((uint32_t)buffer[(offset) + 2U] << 8)     |           \
             ((uint32_t)buffer[(offset) + 3U] << 0))
/**
 * @brief Gets a uint32_t consisting of 3 bytes from a buffer/array. (24-bit value, big-endian).
 * @ingroup common
 * @param buffer uint8_t buffer to get value from
 * @param offset Offset within uint8_t buffer
 */
#define GET_UINT24(buffer, offset)                                  \
            (((uint32_t)buffer[(offset) + 0U] << 16)    |           \
             ((uint32_t)buffer[(offset) + 1U] << 8)     |           \
             ((uint32_t)buffer[(offset) + 2U] << 0))
/**
 * @brief Sets a uint16_t into 2 bytes of a buffer/array. (16-bit value, big-endian).
 * @ingroup common
 * @param val uint16_t value to set
 * @param buffer uint8_t buffer to set value on
 * @param offset Offset within uint8_t buffer
 */
#define SET_UINT16(val, buffer, offset)                     \
            buffer[0U + (offset)] = ((val) >> 8) & 0xFFU;   \
            buffer[1U + (offset)] = ((val) >> 0) & 0xFFU;
/**
 * @brief Gets a uint16_t consisting of 2 bytes from a buffer/array. (16-bit value, big-endian).
 * @ingroup common
 * @param buffer uint8_t buffer to get value from
 * @param offset Offset within uint8_t buffer
 */
#define GET_UINT16(buffer, offset)                                  \
            ((uint16_t)((((uint32_t)buffer[(offset) + 0U] << 8) & 0xFF00U) |  \
                        (((uint32_t)buffer[(offset) + 1U] << 0) & 0x00FFU)))

/*
** Little-endian accessors. Codeplug record fields are stored little-endian even though
** the session framing around them is big-endian.
*/

/**
 * @brief Sets a uint32_t into 4 bytes of a buffer/array. (32-bit value, little-endian).
 * @ingroup common
 * @param val uint32_t value to set
 * @param buffer uint8_t buffer to set value on
 * @param offset Offset within uint8_t buffer
 */
#define SET_UINT32_LE(val, buffer, offset)                  \
            buffer[0U + (offset)] = ((val) >> 0) & 0xFFU;   \
            buffer[1U + (offset)] = ((val) >> 8) & 0xFFU;   \
            buffer[2U + (offset)] = ((val) >> 16) & 0xFFU;  \
            buffer[3U + (offset)] = ((val) >> 24) & 0xFFU;
/**
 * @brief Gets a uint32_t consisting of 4 bytes from a buffer/array. (32-bit value, little-endian).
 * @ingroup common
 * @param buffer uint8_t buffer to get value from
 * @param offset Offset within uint8_t buffer
 */
#define GET_UINT32_LE(buffer, offset)                               \
            (((uint32_t)buffer[(offset) + 0U] << 0)     |           \
             ((uint32_t)buffer[(offset) + 1U] << 8)     |           \
             ((uint32_t)buffer[(offset) + 2U] << 16)    |           \
             ((uint32_t)buffer[(offset) + 3U] << 24))
/**
 * @brief Sets a uint16_t into 2 bytes of a buffer/array. (16-bit value, little-endian).
 * @ingroup common
 * @param val uint16_t value to set
 * @param buffer uint8_t buffer to set value on
 * @param offset Offset within uint8_t buffer
 */
#define SET_UINT16_LE(val, buffer, offset)                  \
            buffer[0U + (offset)] = ((val) >> 0) & 0xFFU;   \
            buffer[1U + (offset)] = ((val) >> 8) & 0xFFU;
/**
 * @brief Gets a uint16_t consisting of 2 bytes from a buffer/array. (16-bit value, little-endian).
 * @ingroup common
 * @param buffer uint8_t buffer to get value from
 * @param offset Offset within uint8_t buffer
 */
#define GET_UINT16_LE(buffer, offset)                               \
            ((uint16_t)(((uint32_t)buffer[(offset) + 0U] << 0) |    \
                        ((uint32_t)buffer[(offset) + 1U] << 8)))

#endif // __BIT_MANIPULATION_H__
