// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Test Suite
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @file MockRadio.h
 * @ingroup tests
 * @file MockRadio.cpp
 * @ingroup tests
 */
#if !defined(__MOCK_RADIO_H__)
#define __MOCK_RADIO_H__

#include "common/Defines.h"
#include "common/ThreadFunc.h"
#include "common/TEACrypto.h"
#include "common/network/tcp/TcpClient.h"
#include "cps/ProgrammerSession.h"
#include "cps/RecordDescriptor.h"
#include "xnl/Frame.h"
#include "xnl/FrameReader.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

const uint16_t  MOCK_MASTER_ADDRESS = 0x0001U;
const uint8_t   MOCK_TEMP_PREFIX = 0x1AU;
const uint8_t   MOCK_SESSION_PREFIX = 0x22U;
const uint16_t  MOCK_LOCAL_ADDRESS = 0x0023U;
const uint16_t  MOCK_READY_QUERY_TXID = 0x0105U;

const uint8_t   MOCK_AUTH_SEED[8U] = { 0x3CU, 0x91U, 0x07U, 0xE2U, 0x5DU, 0xA8U, 0x14U, 0x6FU };

const char      MOCK_MODEL[] = "H98UCF9PW6AN";
const char      MOCK_SERIAL[] = "123TRX4567";
const char      MOCK_FIRMWARE[] = "R02.10.00";
const char      MOCK_CODEPLUG[] = "R02.10.03";
const uint32_t  MOCK_RADIO_ID = 1234567U;

// ---------------------------------------------------------------------------
//  Structure Declaration
// ---------------------------------------------------------------------------

/**
 * @brief A XCMP command as received by the mock radio.
 * @ingroup tests
 */
struct ReceivedCommand {
    uint16_t opcode;            //! XCMP opcode.
    uint16_t txId;              //! XNL transaction id.
    uint8_t sequence;           //! XNL sequence.
    ByteBuffer payload;         //! Bytes following the opcode.
};

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Scripted radio peer on the far end of a socket pair.
 * @ingroup tests
 *
 * The mock plays the XNL master side of authentication, runs the device
 * readiness handshake and answers the XCMP commands the engine issues. Every
 * command is recorded and its sequence number checked against the previous
 * command. Replies can be dropped or failed per opcode.
 */
class MockRadio {
public:
    /**
     * @brief Initializes a new instance of the MockRadio class.
     * @param debug Flag indicating whether frames are dumped.
     */
    MockRadio(bool debug = false);
    /**
     * @brief Finalizes a instance of the MockRadio class.
     */
    ~MockRadio();

    /**
     * @brief Takes the engine side of the socket pair.
     * @returns std::unique_ptr<network::tcp::TcpClient> Engine transport.
     */
    std::unique_ptr<network::tcp::TcpClient> takeChannel();

    /**
     * @brief Starts the radio thread.
     * @returns bool True, if the thread started, otherwise false.
     */
    bool start();
    /**
     * @brief Stops and joins the radio thread.
     */
    void stop();

    /**
     * @brief Starts the radio and opens a programming session against it.
     * @param config Dispatcher configuration.
     * @param authenticate Flag indicating whether the session is authenticated and made ready.
     * @returns std::unique_ptr<cps::ProgrammerSession> Programming session.
     */
    std::unique_ptr<cps::ProgrammerSession> connect(const xcmp::DispatcherConfig& config = xcmp::DispatcherConfig(),
        bool authenticate = true);

    /**
     * @brief Sets the result byte of the authentication key reply.
     */
    void setAuthResult(uint8_t result) { m_authResult = result; }
    /**
     * @brief Holds back (or releases) the device ready broadcast.
     */
    void setReadyWithheld(bool withheld) { m_readyWithheld = withheld; }
    /**
     * @brief Answers codeplug reads with the entries in reverse order.
     */
    void setReverseReadEntries(bool reverse) { m_reverseRead = reverse; }
    /**
     * @brief Appends an entry nobody asked for to every codeplug read reply.
     */
    void setExtraReadEntry(bool extra) { m_extraRead = extra; }
    /**
     * @brief Makes the given transfer block fail (-1 for none).
     */
    void setFailTransferBlock(int block) { m_failTransferBlock = block; }
    /**
     * @brief Makes CRC validation fail.
     */
    void setFailCrc(bool fail) { m_failCrc = fail; }
    /**
     * @brief Sends the given number of out of sequence frames between the master query and the system map.
     */
    void setStrayAuthFrames(uint32_t count) { m_strayAuthFrames = count; }
    /**
     * @brief Answers the given opcode with a length field shorter than an XNL header (0 for none).
     */
    void setMalformedReply(uint16_t opcode) { m_malformedOpcode = opcode; }
    /**
     * @brief Leaves the last requested entry out of every codeplug read reply.
     */
    void setOmitReadEntry(bool omit) { m_omitReadEntry = omit; }
    /**
     * @brief Adds a record the radio can return.
     */
    void addRecord(const cps::RecordDescriptor& record, const ByteBuffer& data);
    /**
     * @brief Sets the record ids reported by a read session.
     */
    void setAvailableRecords(const std::vector<uint16_t>& ids);
    /**
     * @brief Swallows the next replies for the given opcode.
     * @param opcode XCMP opcode.
     * @param count Number of requests left unanswered.
     */
    void dropReplies(uint16_t opcode, uint32_t count);
    /**
     * @brief Forces the reply status for the given opcode.
     */
    void setReplyStatus(uint16_t opcode, uint8_t status);

    /**
     * @brief Blocks until at least the given number of commands were received.
     * @returns bool True, if the commands arrived in time, otherwise false.
     */
    bool waitForCommands(uint32_t count, uint32_t timeoutMs);
    /**
     * @brief Gets every received command in arrival order.
     */
    std::vector<ReceivedCommand> getCommands() const;
    /**
     * @brief Gets the opcodes of every received command in arrival order.
     */
    std::vector<uint16_t> getOpcodes() const;
    /**
     * @brief Gets the number of commands received for the given opcode.
     */
    uint32_t count(uint16_t opcode) const;
    /**
     * @brief Gets the component session actions in arrival order.
     */
    std::vector<uint16_t> getSessionActions() const;
    /**
     * @brief Gets the number of records asked for by each codeplug read.
     */
    std::vector<uint32_t> getReadBatchSizes() const;
    /**
     * @brief Gets the number of commands whose sequence was not the previous plus one.
     */
    uint32_t getSequenceErrors() const;
    /**
     * @brief Gets the bytes received by block transfers.
     */
    ByteBuffer getImage() const;
    /**
     * @brief Gets the flags of every block transfer.
     */
    std::vector<uint8_t> getTransferFlags() const;

    bool isAuthKeyValid() const { return m_authKeyValid; }
    bool isSecurityKeyValid() const { return m_securityKeyValid; }
    bool isReadinessReplyValid() const { return m_readinessReplyValid; }
    uint16_t getReadinessReplyTxId() const { return m_readinessReplyTxId; }
    bool isReadySent() const { return m_readySent; }

    /**
     * @brief Gets the radio key the mock hands out.
     */
    static ByteBuffer radioKey();

private:
    std::unique_ptr<network::tcp::TcpClient> m_peer;
    std::unique_ptr<network::tcp::TcpClient> m_channel;
    xnl::FrameReader m_reader;
    crypto::TEA m_tea;

    std::unique_ptr<ThreadFunc> m_thread;
    std::atomic<bool> m_running;

    mutable std::mutex m_lock;
    std::condition_variable m_commandCond;

    std::atomic<uint8_t> m_authResult;
    std::atomic<bool> m_readyWithheld;
    std::atomic<bool> m_reverseRead;
    std::atomic<bool> m_extraRead;
    std::atomic<int> m_failTransferBlock;
    std::atomic<bool> m_failCrc;
    std::atomic<uint32_t> m_strayAuthFrames;
    std::atomic<uint16_t> m_malformedOpcode;
    std::atomic<bool> m_omitReadEntry;

    std::map<cps::RecordDescriptor, ByteBuffer> m_records;
    std::vector<uint16_t> m_availableRecords;
    std::map<uint16_t, uint32_t> m_drops;
    std::map<uint16_t, uint8_t> m_statusOverrides;

    std::vector<ReceivedCommand> m_commands;
    std::vector<uint16_t> m_sessionActions;
    std::vector<uint32_t> m_readBatchSizes;
    std::vector<uint8_t> m_transferFlags;
    ByteBuffer m_image;
    uint32_t m_sequenceErrors;
    int m_lastSequence;

    std::atomic<bool> m_authKeyValid;
    std::atomic<bool> m_securityKeyValid;
    std::atomic<bool> m_readinessReplyValid;
    std::atomic<uint16_t> m_readinessReplyTxId;
    std::atomic<bool> m_readySent;

    bool m_debug;

    /**
     * @brief Radio thread main.
     */
    void run();
    /**
     * @brief Plays the master side of XNL authentication.
     * @returns bool True, if the engine authenticated, otherwise false.
     */
    bool authenticate();
    /**
     * @brief Sends the device status query and waits for its reply.
     */
    void readinessQuery();
    /**
     * @brief Sends the transitional and complete device status broadcasts.
     */
    void sendReady();
    /**
     * @brief Handles a received XCMP command.
     */
    void processCommand(const xnl::Frame& frame);
    /**
     * @brief Builds the reply data for a command.
     * @returns uint8_t Reply status.
     */
    uint8_t handle(uint16_t opcode, const ByteBuffer& payload, ByteBuffer& data);

    /**
     * @brief Reads the next frame, waiting at most the given time.
     */
    bool readFrame(xnl::Frame& frame, uint32_t timeoutMs);
    /**
     * @brief Writes an XCMP message from the master to the engine.
     */
    void sendXCMP(const ByteBuffer& xcmp, uint16_t txId, uint8_t seq);
    /**
     * @brief Writes a device initialization status broadcast.
     */
    void sendInitStatus(uint8_t status, uint16_t txId);
};

#endif // __MOCK_RADIO_H__
