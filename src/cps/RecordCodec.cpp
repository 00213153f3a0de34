// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Codeplug Access
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "common/Defines.h"
#include "common/Exception.h"
#include "common/Utils.h"
#include "cps/RecordCodec.h"

using namespace cps;

#include <cstdio>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

const uint32_t FREQUENCY_STEP_HZ = 5U;
const uint32_t UNICODE_REPLACEMENT = 0xFFFDU;

// ---------------------------------------------------------------------------
//  FieldDescriptor Public Class Members
// ---------------------------------------------------------------------------

/* Gets the number of bytes the field occupies. */

uint32_t FieldDescriptor::getWidth() const
{
    switch (type) {
    case FieldType::UINT8:
        return 1U;
    case FieldType::UINT16_LE:
    case FieldType::TONE_0_1HZ:
        return 2U;
    case FieldType::UINT32_LE:
    case FieldType::FREQUENCY_5HZ:
        return 4U;
    default:
        return width;
    }
}

// ---------------------------------------------------------------------------
//  FieldValue Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the FieldValue class. */

FieldValue::FieldValue() :
    m_type(FieldType::BYTES),
    m_number(0U),
    m_text(),
    m_bytes()
{
    /* stub */
}

/* Creates a numeric value. */

FieldValue FieldValue::number(FieldType::E type, ulong64_t value)
{
    FieldValue ret;
    ret.m_type = type;
    ret.m_number = value;
    return ret;
}

/* Creates a text value. */

FieldValue FieldValue::text(const std::string& value)
{
    FieldValue ret;
    ret.m_type = FieldType::UTF16LE_STRING;
    ret.m_text = value;
    return ret;
}

/* Creates a raw byte value. */

FieldValue FieldValue::bytes(const ByteBuffer& value)
{
    FieldValue ret;
    ret.m_type = FieldType::BYTES;
    ret.m_bytes = value;
    return ret;
}

/* Flag indicating whether the value is numeric. */

bool FieldValue::isNumeric() const
{
    return m_type != FieldType::UTF16LE_STRING && m_type != FieldType::BYTES;
}

/* Helper to format the value for display. */

std::string FieldValue::toString() const
{
    char buffer[64U];
    switch (m_type) {
    case FieldType::FREQUENCY_5HZ:
        ::snprintf(buffer, sizeof(buffer), "%llu.%06llu MHz", (unsigned long long)(m_number / 1000000ULL),
            (unsigned long long)(m_number % 1000000ULL));
        return std::string(buffer);
    case FieldType::TONE_0_1HZ:
        ::snprintf(buffer, sizeof(buffer), "%llu.%llu Hz", (unsigned long long)(m_number / 10ULL), (unsigned long long)(m_number % 10ULL));
        return std::string(buffer);
    case FieldType::UTF16LE_STRING:
        return m_text;
    case FieldType::BYTES:
        return Utils::toHex(m_bytes.data(), (uint32_t)m_bytes.size());
    default:
        return std::to_string(m_number);
    }
}

/* Equals operator. */

bool FieldValue::operator==(const FieldValue& data) const
{
    return m_type == data.m_type && m_number == data.m_number && m_text == data.m_text && m_bytes == data.m_bytes;
}

// ---------------------------------------------------------------------------
//  RecordCodec Public Class Members
// ---------------------------------------------------------------------------

/* Decodes the described fields of a record. */

FieldMap RecordCodec::decode(const uint8_t* record, uint32_t len, const std::vector<FieldDescriptor>& fields)
{
    FieldMap values;
    for (const FieldDescriptor& field : fields) {
        values[field.name] = decodeField(record, len, field);
    }

    return values;
}

/* Encodes values into a record. */

void RecordCodec::encode(uint8_t* record, uint32_t len, const std::vector<FieldDescriptor>& fields, const FieldMap& values)
{
    for (const FieldDescriptor& field : fields) {
        FieldMap::const_iterator it = values.find(field.name);
        if (it == values.end())
            continue;

        encodeField(record, len, field, it->second);
    }
}

/* Decodes a single field. */

FieldValue RecordCodec::decodeField(const uint8_t* record, uint32_t len, const FieldDescriptor& field)
{
    if (record == nullptr) {
        throw RecordError("No record to decode field " + field.name);
    }

    checkBounds(len, field);

    const uint8_t* data = record + field.offset;
    switch (field.type) {
    case FieldType::UINT8:
        return FieldValue::number(field.type, data[0U]);
    case FieldType::UINT16_LE:
    case FieldType::TONE_0_1HZ:
        return FieldValue::number(field.type, GET_UINT16_LE(data, 0U));
    case FieldType::UINT32_LE:
        return FieldValue::number(field.type, GET_UINT32_LE(data, 0U));
    case FieldType::FREQUENCY_5HZ:
        return FieldValue::number(field.type, (ulong64_t)GET_UINT32_LE(data, 0U) * FREQUENCY_STEP_HZ);
    case FieldType::UTF16LE_STRING:
        return FieldValue::text(utf16leToUtf8(data, field.getWidth()));
    case FieldType::BYTES:
    default:
        return FieldValue::bytes(ByteBuffer(data, data + field.getWidth()));
    }
}

/* Encodes a single field. */

void RecordCodec::encodeField(uint8_t* record, uint32_t len, const FieldDescriptor& field, const FieldValue& value)
{
    if (record == nullptr) {
        throw RecordError("No record to encode field " + field.name);
    }

    checkBounds(len, field);

    bool textual = field.type == FieldType::UTF16LE_STRING;
    bool raw = field.type == FieldType::BYTES;
    if ((textual && value.getType() != FieldType::UTF16LE_STRING) || (raw && value.getType() != FieldType::BYTES) ||
        (!textual && !raw && !value.isNumeric())) {
        throw RecordError("Value type does not match field " + field.name);
    }

    uint8_t* data = record + field.offset;
    ulong64_t number = value.getNumber();
    switch (field.type) {
    case FieldType::UINT8:
        if (number > 0xFFU)
            throw RecordError("Value " + std::to_string(number) + " does not fit field " + field.name);
        data[0U] = (uint8_t)number;
        break;
    case FieldType::UINT16_LE:
    case FieldType::TONE_0_1HZ:
        {
            if (number > 0xFFFFU)
                throw RecordError("Value " + std::to_string(number) + " does not fit field " + field.name);
            uint16_t v = (uint16_t)number;
            SET_UINT16_LE(v, data, 0U);
        }
        break;
    case FieldType::UINT32_LE:
        {
            if (number > 0xFFFFFFFFULL)
                throw RecordError("Value " + std::to_string(number) + " does not fit field " + field.name);
            uint32_t v = (uint32_t)number;
            SET_UINT32_LE(v, data, 0U);
        }
        break;
    case FieldType::FREQUENCY_5HZ:
        {
            ulong64_t steps = number / FREQUENCY_STEP_HZ;
            if (steps > 0xFFFFFFFFULL)
                throw RecordError("Frequency " + std::to_string(number) + " Hz does not fit field " + field.name);
            uint32_t v = (uint32_t)steps;
            SET_UINT32_LE(v, data, 0U);
        }
        break;
    case FieldType::UTF16LE_STRING:
        {
            ByteBuffer text;
            if (!utf8ToUtf16le(value.getText(), text)) {
                throw RecordError("Invalid UTF-8 text for field " + field.name);
            }

            if (text.size() > field.getWidth()) {
                throw RecordError("Text of " + std::to_string(text.size()) + " bytes does not fit field " + field.name);
            }

            ::memset(data, 0x00U, field.getWidth());
            if (!text.empty())
                ::memcpy(data, text.data(), text.size());
        }
        break;
    case FieldType::BYTES:
    default:
        {
            const ByteBuffer& bytes = value.getBytes();
            if (bytes.size() > field.getWidth()) {
                throw RecordError(std::to_string(bytes.size()) + " bytes do not fit field " + field.name);
            }

            ::memset(data, 0x00U, field.getWidth());
            if (!bytes.empty())
                ::memcpy(data, bytes.data(), bytes.size());
        }
        break;
    }
}

/* Converts NUL terminated or padded UTF-16LE to UTF-8. */

std::string RecordCodec::utf16leToUtf8(const uint8_t* data, uint32_t len)
{
    std::string out;
    uint32_t units = len / 2U;

    for (uint32_t i = 0U; i < units; i++) {
        uint32_t cp = GET_UINT16_LE(data, i * 2U);
        if (cp == 0U)
            break;

        if (cp >= 0xD800U && cp <= 0xDBFFU) {
            uint32_t low = (i + 1U < units) ? GET_UINT16_LE(data, (i + 1U) * 2U) : 0U;
            if (low >= 0xDC00U && low <= 0xDFFFU) {
                cp = 0x10000U + ((cp - 0xD800U) << 10) + (low - 0xDC00U);
                i++;
            }
            else {
                cp = UNICODE_REPLACEMENT;
            }
        }
        else if (cp >= 0xDC00U && cp <= 0xDFFFU) {
            cp = UNICODE_REPLACEMENT;
        }

        if (cp < 0x80U) {
            out.push_back((char)cp);
        }
        else if (cp < 0x800U) {
            out.push_back((char)(0xC0U | (cp >> 6)));
            out.push_back((char)(0x80U | (cp & 0x3FU)));
        }
        else if (cp < 0x10000U) {
            out.push_back((char)(0xE0U | (cp >> 12)));
            out.push_back((char)(0x80U | ((cp >> 6) & 0x3FU)));
            out.push_back((char)(0x80U | (cp & 0x3FU)));
        }
        else {
            out.push_back((char)(0xF0U | (cp >> 18)));
            out.push_back((char)(0x80U | ((cp >> 12) & 0x3FU)));
            out.push_back((char)(0x80U | ((cp >> 6) & 0x3FU)));
            out.push_back((char)(0x80U | (cp & 0x3FU)));
        }
    }

    return out;
}

/* Converts UTF-8 to UTF-16LE. */

bool RecordCodec::utf8ToUtf16le(const std::string& text, ByteBuffer& out)
{
    out.clear();

    size_t i = 0U;
    while (i < text.size()) {
        uint8_t c = (uint8_t)text[i];
        uint32_t cp = 0U;
        uint32_t extra = 0U;

        if (c < 0x80U) {
            cp = c;
        }
        else if ((c & 0xE0U) == 0xC0U) {
            cp = c & 0x1FU;
            extra = 1U;
        }
        else if ((c & 0xF0U) == 0xE0U) {
            cp = c & 0x0FU;
            extra = 2U;
        }
        else if ((c & 0xF8U) == 0xF0U) {
            cp = c & 0x07U;
            extra = 3U;
        }
        else {
            return false;
        }

        if (i + extra >= text.size()) {
            return false;
        }

        for (uint32_t n = 1U; n <= extra; n++) {
            uint8_t cc = (uint8_t)text[i + n];
            if ((cc & 0xC0U) != 0x80U)
                return false;
            cp = (cp << 6) | (cc & 0x3FU);
        }

        i += 1U + extra;

        // overlong forms encode a code point a shorter sequence could carry
        static const uint32_t minimum[4U] = { 0x00U, 0x80U, 0x800U, 0x10000U };
        if (cp < minimum[extra])
            return false;

        if (cp > 0x10FFFFU || (cp >= 0xD800U && cp <= 0xDFFFU))
            return false;

        if (cp >= 0x10000U) {
            cp -= 0x10000U;
            uint16_t high = (uint16_t)(0xD800U + (cp >> 10));
            uint16_t low = (uint16_t)(0xDC00U + (cp & 0x3FFU));
            out.push_back(high & 0xFFU);
            out.push_back(high >> 8);
            out.push_back(low & 0xFFU);
            out.push_back(low >> 8);
        }
        else {
            out.push_back(cp & 0xFFU);
            out.push_back((cp >> 8) & 0xFFU);
        }
    }

    return true;
}

// ---------------------------------------------------------------------------
//  RecordCodec Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to check a field lies inside the record. */

void RecordCodec::checkBounds(uint32_t len, const FieldDescriptor& field)
{
    uint32_t width = field.getWidth();
    if (width == 0U || field.offset >= len || width > len - field.offset) {
        throw RecordError("Field " + field.name + " at offset " + std::to_string(field.offset) + " width " + std::to_string(width) +
            " lies outside the " + std::to_string(len) + " byte record");
    }
}
