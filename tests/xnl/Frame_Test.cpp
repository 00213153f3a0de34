// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Test Suite
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "Defines.h"
#include "common/Exception.h"
#include "common/Log.h"
#include "common/Utils.h"
#include "xnl/Frame.h"
#include "xnl/FrameReader.h"

using namespace xnl;
using namespace xnl::defines;

#include <catch2/catch_test_macros.hpp>
#include <sys/socket.h>

TEST_CASE("XNL Frame", "[XNL Frame Test]") {
    SECTION("Frame_Encode_Test") {
        bool failed = false;

        INFO("XNL Frame Encode Test");

        uint8_t data[] = { 0x00U, 0x0EU, 0x00U, 0x01U };
        Frame frame(Opcode::DATA_MSG, 0x0001U, 0x0023U, 0x2207U, ByteBuffer(data, data + sizeof(data)));
        frame.setXCMP(true);
        frame.setSequence(0x05U);

        uint8_t expected[] = {
            0x00U, 0x10U,               // total length
            0x00U, 0x0BU,               // opcode
            0x01U,                      // XCMP flag
            0x05U,                      // sequence
            0x00U, 0x01U,               // destination
            0x00U, 0x23U,               // source
            0x22U, 0x07U,               // transaction id
            0x00U, 0x04U,               // payload length
            0x00U, 0x0EU, 0x00U, 0x01U  // payload
        };

        ByteBuffer buffer = frame.encode();
        Utils::dump(2U, "Frame_Encode_Test, Encoded", buffer.data(), (uint32_t)buffer.size());

        if (buffer.size() != sizeof(expected)) {
            ::LogDebug("T", "Frame_Encode_Test, LENGTH %u\n", (uint32_t)buffer.size());
            failed = true;
        }
        else {
            for (uint32_t i = 0; i < sizeof(expected); i++) {
                if (buffer[i] != expected[i]) {
                    ::LogDebug("T", "Frame_Encode_Test, INVALID AT IDX %d\n", i);
                    failed = true;
                }
            }
        }

        if (frame.getTotalLength() != 12U + frame.getPayloadLength())
            failed = true;
        if (frame.getXCMPOpcode() != 0x000EU)
            failed = true;

        REQUIRE(failed==false);
    }

    SECTION("Frame_Decode_Test") {
        bool failed = false;

        INFO("XNL Frame Decode Test");

        uint8_t wire[] = {
            0x00U, 0x0FU, 0x00U, 0x05U, 0x00U, 0x00U, 0x00U, 0x00U,
            0x00U, 0x01U, 0x00U, 0x00U, 0x00U, 0x03U, 0xFFU, 0x1AU, 0x99U
        };

        Frame frame = Frame::decode(wire, sizeof(wire));
        if (frame.getOpcode() != Opcode::DEVICE_SYSMAP_BRDCST)
            failed = true;
        if (frame.getXCMP())
            failed = true;
        if (frame.getSrc() != 0x0001U || frame.getDest() != 0x0000U)
            failed = true;
        if (frame.getPayloadLength() != 3U || frame.getPayload()[1U] != 0x1AU)
            failed = true;

        // not an XCMP frame
        if (frame.getXCMPOpcode() != 0U)
            failed = true;

        // round trip reproduces the wire bytes
        ByteBuffer again = frame.encode();
        if (again != ByteBuffer(wire, wire + sizeof(wire)))
            failed = true;

        REQUIRE(failed==false);
    }

    SECTION("Frame_Malformed_Test") {
        INFO("XNL Frame Malformed Test");

        // shorter than the header
        uint8_t truncated[] = { 0x00U, 0x0CU, 0x00U, 0x0BU, 0x01U, 0x00U };
        REQUIRE_THROWS_AS(Frame::decode(truncated, sizeof(truncated)), cps::FramingError);
        REQUIRE_THROWS_AS(Frame::decode(nullptr, 0U), cps::FramingError);

        // payload length claims more than is present
        uint8_t payloadMismatch[] = {
            0x00U, 0x0EU, 0x00U, 0x0BU, 0x01U, 0x01U, 0x00U, 0x01U,
            0x00U, 0x23U, 0x22U, 0x01U, 0x00U, 0x04U, 0x00U, 0x0EU
        };
        REQUIRE_THROWS_AS(Frame::decode(payloadMismatch, sizeof(payloadMismatch)), cps::FramingError);

        // total length disagrees with the payload length
        uint8_t totalMismatch[] = {
            0x00U, 0x20U, 0x00U, 0x0BU, 0x01U, 0x01U, 0x00U, 0x01U,
            0x00U, 0x23U, 0x22U, 0x01U, 0x00U, 0x02U, 0x00U, 0x0EU
        };
        REQUIRE_THROWS_AS(Frame::decode(totalMismatch, sizeof(totalMismatch)), cps::FramingError);
    }

    SECTION("Frame_Payload_Limits_Test") {
        bool failed = false;

        INFO("XNL Frame Payload Limits Test");

        // empty payload
        Frame empty(Opcode::DEVICE_MASTER_QUERY, 0x0006U, 0x0000U, 0x0000U, ByteBuffer());
        ByteBuffer buffer = empty.encode();
        if (buffer.size() != XNL_FRAME_OVERHEAD || buffer[1U] != XNL_HEADER_LEN)
            failed = true;
        if (!(Frame::decode(buffer.data(), (uint32_t)buffer.size()) == empty)) {
            ::LogDebug("T", "Frame_Payload_Limits_Test, EMPTY PAYLOAD MISMATCH\n");
            failed = true;
        }

        // largest payload the 16-bit length field can describe
        ByteBuffer payload(XNL_MAX_PAYLOAD_LEN, 0x00U);
        for (uint32_t i = 0U; i < payload.size(); i++)
            payload[i] = (uint8_t)(i * 7U);

        Frame largest(Opcode::DATA_MSG, 0x0001U, 0x0023U, 0x2201U, payload);
        largest.setXCMP(true);
        buffer = largest.encode();
        if (buffer.size() != XNL_FRAME_OVERHEAD + XNL_MAX_PAYLOAD_LEN)
            failed = true;
        if (buffer[0U] != 0xFFU || buffer[1U] != 0xFFU) {
            ::LogDebug("T", "Frame_Payload_Limits_Test, TOTAL LENGTH %02X%02X\n", buffer[0U], buffer[1U]);
            failed = true;
        }
        if (!(Frame::decode(buffer.data(), (uint32_t)buffer.size()) == largest)) {
            ::LogDebug("T", "Frame_Payload_Limits_Test, MAXIMUM PAYLOAD MISMATCH\n");
            failed = true;
        }

        // one byte more cannot be described by the length field
        payload.push_back(0x00U);
        Frame oversize(Opcode::DATA_MSG, 0x0001U, 0x0023U, 0x2202U, payload);
        REQUIRE_THROWS_AS(oversize.encode(), cps::FramingError);

        REQUIRE(failed==false);
    }

    SECTION("FrameReader_Stream_Test") {
        bool failed = false;

        INFO("XNL FrameReader Stream Test");

        int fds[2U] = { -1, -1 };
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

        network::tcp::TcpClient left(fds[0U]);
        network::tcp::TcpClient right(fds[1U]);

        FrameReader writer(&left);
        FrameReader reader(&right);

        // nothing pending
        Frame frame;
        if (reader.read(frame, 50U))
            failed = true;

        uint8_t data[] = { 0xB4U, 0x00U, 0x00U, 0x00U, 0x00U, 0x00U, 0x01U };
        Frame first(Opcode::DATA_MSG, 0x0023U, 0x0001U, 0x0105U, ByteBuffer(data, data + sizeof(data)));
        first.setXCMP(true);
        Frame second(Opcode::DEVICE_CONN_REPLY, 0x0023U, 0x0001U, 0x0000U, ByteBuffer());

        writer.write(first);
        writer.write(second);

        if (!reader.read(frame, 1000U) || !(frame == first))
            failed = true;
        if (!reader.read(frame, 1000U) || !(frame == second))
            failed = true;

        // a length field shorter than the header is a framing error
        uint8_t bad[] = { 0x00U, 0x02U };
        REQUIRE(left.writeAll(bad, sizeof(bad)));
        REQUIRE_THROWS_AS(reader.read(frame, 1000U), cps::FramingError);

        // closed peer is a transport error
        left.close();
        REQUIRE_THROWS_AS(reader.read(frame, 1000U), cps::TransportError);

        REQUIRE(failed==false);
    }
}
