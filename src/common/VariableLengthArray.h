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
 * @file VariableLengthArray.h
 * @ingroup common
 */
#pragma once
#if !defined(__VARIABLE_LENGTH_ARRAY_H__)
#define __VARIABLE_LENGTH_ARRAY_H__

#if !defined(__COMMON_DEFINES_H__)
#warning "VariableLengthArray.h included before Defines.h, please check include order"
#include "common/Defines.h"
#endif

// ---------------------------------------------------------------------------
//  Types
// ---------------------------------------------------------------------------

/**
 * @addtogroup common
 * @{
 */

/**
 * @brief Unique uint8_t array.
 * @ingroup common
 */
typedef std::unique_ptr<uint8_t[]> UInt8Array;

/**
 * @brief Growable byte buffer, used for frame payloads and codeplug record data.
 * @ingroup common
 */
typedef std::vector<uint8_t> ByteBuffer;

/** @} */

// ---------------------------------------------------------------------------
//  Macros
// ---------------------------------------------------------------------------

/**
 * @brief Declares a unique uint8_t array/buffer.
 *  Creates a zero-initialized unique uint8_t array of the given length, and a raw pointer to it named
 *  after the parameter name passed to the macro.
 * @ingroup common
 * @param name Name of array/buffer.
 * @param len Length of array/buffer.
 */
#define DECLARE_UINT8_ARRAY(name, len)                                      \
    UInt8Array __##name##__UInt8Array = std::make_unique<uint8_t[]>(len);   \
    uint8_t* name = __##name##__UInt8Array.get();                           \
    ::memset(name, 0x00U, len);

#endif // __VARIABLE_LENGTH_ARRAY_H__
