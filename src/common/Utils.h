// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2009,2014,2015,2016 Jonathan Naylor, G4KLX
 *  Copyright (C) 2018-2024 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @file Utils.h
 * @ingroup common
 * @file Utils.cpp
 * @ingroup common
 */
#if !defined(__UTILS_H__)
#define __UTILS_H__

#include "common/Defines.h"

#include <cstring>
#include <string>

// ---------------------------------------------------------------------------
//  Inlines
// ---------------------------------------------------------------------------

/**
 * @brief String from integer number.
 * @param value Integer value to convert.
 * @returns std::string String representation of the integer value.
 */
inline std::string __INT_STR(const int& value) {
    std::stringstream ss;
    ss << value;
    return ss.str();
}

/**
 * @brief String from hexadecimal integer number.
 * @param value Integer value to convert.
 * @param width Minimum number of digits.
 * @returns std::string Zero padded hexadecimal representation of the integer value.
 */
inline std::string __INT_HEX_STR(const uint32_t& value, uint32_t width = 4U) {
    std::stringstream ss;
    ss << std::hex << std::uppercase;
    ss.width(width);
    ss.fill('0');
    ss << value;
    return ss.str();
}

/**
 * @brief Helper to lower-case an input string.
 * @param value Input string.
 * @returns std::string Lowercased string.
 */
inline std::string strtolower(const std::string value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    return v;
}

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Various helper utilities.
 * @ingroup common
 */
class CPS_SW_API Utils {
public:
    /**
     * @brief Helper to dump the input buffer and display the hexadecimal output in the log.
     * @param title Name of buffer.
     * @param data Buffer to dump.
     * @param length Length of buffer.
     */
    static void dump(const std::string& title, const uint8_t* data, uint32_t length);
    /**
     * @brief Helper to dump the input buffer and display the hexadecimal output in the log.
     * @param level Log level.
     * @param title Name of buffer.
     * @param data Buffer to dump.
     * @param length Length of buffer.
     */
    static void dump(int level, const std::string& title, const uint8_t* data, uint32_t length);

    /**
     * @brief Helper to format a buffer as a contiguous uppercase hexadecimal string.
     * @param data Buffer to format.
     * @param length Length of buffer.
     * @returns std::string Hexadecimal string.
     */
    static std::string toHex(const uint8_t* data, uint32_t length);
};

#endif // __UTILS_H__
