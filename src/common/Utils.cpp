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
#include "Utils.h"
#include "Log.h"

#include <cctype>
#include <cstdio>

// ---------------------------------------------------------------------------
//  Static Class Members
// ---------------------------------------------------------------------------

/* Helper to dump the input buffer and display the hexadecimal output in the log. */

void Utils::dump(const std::string& title, const uint8_t* data, uint32_t length)
{
    dump(1U, title, data, length);
}

/* Helper to dump the input buffer and display the hexadecimal output in the log. */

void Utils::dump(int level, const std::string& title, const uint8_t* data, uint32_t length)
{
    if (data == nullptr)
        return;

    ::Log(level, "DUMP", nullptr, 0, nullptr, "%s, length = %u", title.c_str(), length);

    uint32_t offset = 0U;
    while (length > 0U) {
        std::string output;

        uint32_t bytes = (length > 16U) ? 16U : length;
        for (uint32_t i = 0U; i < bytes; i++) {
            char temp[10U];
            ::snprintf(temp, sizeof(temp), "%02X ", data[offset + i]);
            output += temp;
        }

        for (uint32_t i = bytes; i < 16U; i++)
            output += "   ";

        output += "   *";
        for (uint32_t i = 0U; i < bytes; i++) {
            uint8_t c = data[offset + i];
            if (::isprint(c))
                output += (char)c;
            else
                output += '.';
        }
        output += '*';

        ::Log(level, "DUMP", nullptr, 0, nullptr, "%04X:  %s", offset, output.c_str());

        offset += 16U;
        length -= bytes;
    }
}

/* Helper to format a buffer as a contiguous uppercase hexadecimal string. */

std::string Utils::toHex(const uint8_t* data, uint32_t length)
{
    static const char DIGITS[] = "0123456789ABCDEF";

    std::string output;
    if (data == nullptr)
        return output;

    output.reserve(length * 2U);
    for (uint32_t i = 0U; i < length; i++) {
        output += DIGITS[(data[i] >> 4) & 0x0FU];
        output += DIGITS[data[i] & 0x0FU];
    }

    return output;
}
