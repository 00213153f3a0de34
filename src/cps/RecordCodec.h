// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Codeplug Access
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @file RecordCodec.h
 * @ingroup cps
 * @file RecordCodec.cpp
 * @ingroup cps
 */
#if !defined(__CPS_RECORD_CODEC_H__)
#define __CPS_RECORD_CODEC_H__

#include "common/Defines.h"

#include <map>
#include <string>
#include <vector>

namespace cps
{
    // ---------------------------------------------------------------------------
    //  Constants
    // ---------------------------------------------------------------------------

    /** @brief Record Field Types */
    namespace FieldType {
        /** @brief Record Field Types */
        enum E : uint8_t {
            UINT8,                                      //! Single byte
            UINT16_LE,                                  //! Little-endian 16-bit
            UINT32_LE,                                  //! Little-endian 32-bit
            FREQUENCY_5HZ,                              //! Little-endian 32-bit in 5 Hz steps
            TONE_0_1HZ,                                 //! Little-endian 16-bit in 0.1 Hz steps
            UTF16LE_STRING,                             //! NUL padded UTF-16LE text
            BYTES                                       //! Raw bytes
        };
    }

    // ---------------------------------------------------------------------------
    //  Structure Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Describes where a named field lives inside a record.
     * @ingroup cps
     */
    struct FieldDescriptor {
    public:
        /**
         * @brief Initializes a new instance of the FieldDescriptor struct.
         */
        FieldDescriptor() :
            name(),
            offset(0U),
            width(0U),
            type(FieldType::BYTES)
        {
            /* stub */
        }
        /**
         * @brief Initializes a new instance of the FieldDescriptor struct.
         * @param n Field name.
         * @param offs Byte offset within the record.
         * @param w Width in bytes (0 uses the natural width of numeric types).
         * @param t Field type.
         */
        FieldDescriptor(const std::string& n, uint32_t offs, uint32_t w, FieldType::E t) :
            name(n),
            offset(offs),
            width(w),
            type(t)
        {
            /* stub */
        }

        std::string name;       //! Field name.
        uint32_t offset;        //! Byte offset within the record.
        uint32_t width;         //! Width in bytes.
        FieldType::E type;      //! Field type.

        /**
         * @brief Gets the number of bytes the field occupies.
         * @returns uint32_t Field width.
         */
        uint32_t getWidth() const;
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Decoded value of a record field.
     * @ingroup cps
     *
     * Numeric types carry their value in engineering units: frequencies in Hz, tones in
     * tenths of a Hz. Text is UTF-8.
     */
    class CPS_SW_API FieldValue {
    public:
        /**
         * @brief Initializes a new instance of the FieldValue class.
         */
        FieldValue();

        /** @brief Creates a numeric value. */
        static FieldValue number(FieldType::E type, ulong64_t value);
        /** @brief Creates a text value. */
        static FieldValue text(const std::string& value);
        /** @brief Creates a raw byte value. */
        static FieldValue bytes(const ByteBuffer& value);

        /**
         * @brief Gets the field type.
         * @returns FieldType::E Field type.
         */
        FieldType::E getType() const { return m_type; }
        /**
         * @brief Flag indicating whether the value is numeric.
         * @returns bool True, if numeric, otherwise false.
         */
        bool isNumeric() const;

        /**
         * @brief Gets the numeric value.
         * @returns ulong64_t Numeric value.
         */
        ulong64_t getNumber() const { return m_number; }
        /**
         * @brief Gets the text value.
         * @returns const std::string& UTF-8 text.
         */
        const std::string& getText() const { return m_text; }
        /**
         * @brief Gets the raw byte value.
         * @returns const ByteBuffer& Raw bytes.
         */
        const ByteBuffer& getBytes() const { return m_bytes; }

        /**
         * @brief Helper to format the value for display.
         * @returns std::string Formatted value.
         */
        std::string toString() const;

        /** @brief Equals operator. */
        bool operator==(const FieldValue& data) const;

    private:
        FieldType::E m_type;
        ulong64_t m_number;
        std::string m_text;
        ByteBuffer m_bytes;
    };

    /**
     * @brief Decoded field values keyed by field name.
     */
    typedef std::map<std::string, FieldValue> FieldMap;

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Encodes and decodes fixed layout records against field descriptors.
     * @ingroup cps
     *
     * Numeric record fields are little-endian, unlike the big-endian framing around them.
     * The only validation performed is bounds checking.
     */
    class CPS_SW_API RecordCodec {
    public:
        /**
         * @brief Decodes the described fields of a record.
         * @param record Record bytes.
         * @param len Record length.
         * @param fields Field descriptors.
         * @returns FieldMap Decoded values keyed by field name.
         * @throws cps::RecordError if a field lies outside the record.
         */
        static FieldMap decode(const uint8_t* record, uint32_t len, const std::vector<FieldDescriptor>& fields);
        /**
         * @brief Encodes values into a record. Fields without a value are left untouched.
         * @param record Record bytes.
         * @param len Record length.
         * @param fields Field descriptors.
         * @param values Values keyed by field name.
         * @throws cps::RecordError if a field lies outside the record or does not fit its value.
         */
        static void encode(uint8_t* record, uint32_t len, const std::vector<FieldDescriptor>& fields, const FieldMap& values);

        /**
         * @brief Decodes a single field.
         * @param record Record bytes.
         * @param len Record length.
         * @param field Field descriptor.
         * @returns FieldValue Decoded value.
         */
        static FieldValue decodeField(const uint8_t* record, uint32_t len, const FieldDescriptor& field);
        /**
         * @brief Encodes a single field.
         * @param record Record bytes.
         * @param len Record length.
         * @param field Field descriptor.
         * @param value Value.
         */
        static void encodeField(uint8_t* record, uint32_t len, const FieldDescriptor& field, const FieldValue& value);

        /**
         * @brief Converts NUL terminated or padded UTF-16LE to UTF-8.
         * @param data UTF-16LE bytes.
         * @param len Length in bytes.
         * @returns std::string UTF-8 text.
         */
        static std::string utf16leToUtf8(const uint8_t* data, uint32_t len);
        /**
         * @brief Converts UTF-8 to UTF-16LE.
         * @param text UTF-8 text.
         * @param[out] out UTF-16LE bytes.
         * @returns bool True, if the text was valid UTF-8, otherwise false.
         */
        static bool utf8ToUtf16le(const std::string& text, ByteBuffer& out);

    private:
        /**
         * @brief Internal helper to check a field lies inside the record.
         * @param len Record length.
         * @param field Field descriptor.
         */
        static void checkBounds(uint32_t len, const FieldDescriptor& field);
    };
} // namespace cps

#endif // __CPS_RECORD_CODEC_H__
