// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Command Tool
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024,2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "cps/ProgrammerSession.h"
#include "cps/ChannelLayout.h"
#include "common/Exception.h"
#include "common/Log.h"
#include "common/Utils.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <vector>

using namespace cps;

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#undef __PROG_NAME__
#define __PROG_NAME__ "Codeplug Programming Engine Command Tool"
#undef __EXE_NAME__
#define __EXE_NAME__ "cpscmd"

#define ERRNO_REMOTE_CMD 99

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#define CMD_IDENTIFY                    "identify"
#define CMD_LIST                        "list"
#define CMD_READ                        "read"
#define CMD_CHANNEL                     "channel"
#define CMD_WRITE                       "write"
#define CMD_WRITE_OPT_COMPRESS          "compress"

#define BAD_CMD_STR                     "Bad or invalid remote command."

// ---------------------------------------------------------------------------
//  Macros
// ---------------------------------------------------------------------------

#define IS(s) (::strcmp(argv[i], s) == 0)

// ---------------------------------------------------------------------------
//  Global Variables
// ---------------------------------------------------------------------------

static std::string g_progExe = std::string(__EXE_NAME__);
static std::string g_remoteAddress = std::string(DEFAULT_RADIO_ADDRESS);
static uint32_t g_remotePort = XNL_DEFAULT_PORT;
static uint32_t g_timeout = DEFAULT_COMMAND_TIMEOUT_MS;
static uint32_t g_retries = DEFAULT_COMMAND_RETRIES;
static bool g_debug = false;

// ---------------------------------------------------------------------------
//	Global Functions
// ---------------------------------------------------------------------------

/* Helper to print a fatal error message and exit. */

void fatal(const char* message)
{
    ::fprintf(stderr, "%s: FATAL PANIC; %s\n", g_progExe.c_str(), message);
    exit(EXIT_FAILURE);
}

/* Helper to print usage the command line arguments. (And optionally an error.) */

void usage(const char* message, const char* arg)
{
    ::fprintf(stdout, __PROG_NAME__ " %s (built %s)\r\n", __VER__, __BUILD__);
    ::fprintf(stdout, "Copyright (c) 2024,2025 Bryan Biedenkapp, N2PLL.\n\n");
    if (message != nullptr) {
        ::fprintf(stderr, "%s: ", g_progExe.c_str());
        ::fprintf(stderr, message, arg);
        ::fprintf(stderr, "\n\n");
    }

    ::fprintf(stdout,
        "usage: %s [-dvh]"
        "[-a <address>]"
        "[-p <port>]"
        "[-t <timeout ms>]"
        "[-r <retries>]"
        " <command> <arguments ...>"
        "\n\n"
        "  -d                          enable debug\n"
        "  -v                          show version information\n"
        "  -h                          show this screen\n"
        "\n"
        "  -a                          radio address\n"
        "  -p                          radio XNL port\n"
        "  -t                          per attempt command timeout (ms)\n"
        "  -r                          command attempts\n"
        "\n"
        "  --                          stop handling options\n",
        g_progExe.c_str());

    std::string reply = "";
    reply += "Commands:\r\n";
    reply += "  identify                    Displays the radio model, serial, versions and radio id\r\n";
    reply += "  list                        Lists the codeplug record ids the radio reports\r\n";
    reply += "  read <id[:index]> ...       Reads and dumps the specified codeplug records (ids in hex)\r\n";
    reply += "  channel <index>             Reads and decodes the specified channel record\r\n";
    reply += "  write <file> [compress]     Writes the codeplug image in the specified file to the radio\r\n";

    ::fprintf(stdout, "\n%s\n", reply.c_str());
    exit(EXIT_FAILURE);
}

/* Helper to validate the command line arguments. */

int checkArgs(int argc, char* argv[])
{
    int i, p = 0;

    // iterate through arguments
    for (i = 1; i <= argc; i++)
    {
        if (argv[i] == nullptr) {
            break;
        }

        if (*argv[i] != '-') {
            continue;
        }
        else if (IS("--")) {
            ++p;
            break;
        }
        else if (IS("-a")) {
            if ((argc - 1) <= 0)
                usage("error: %s", "must specify the address to connect to");
            g_remoteAddress = std::string(argv[++i]);

            if (g_remoteAddress.empty())
                usage("error: %s", "remote address cannot be blank!");

            p += 2;
        }
        else if (IS("-p")) {
            if ((argc - 1) <= 0)
                usage("error: %s", "must specify the port to connect to");
            g_remotePort = (uint32_t)::atoi(argv[++i]);

            if (g_remotePort == 0U || g_remotePort > 65535U)
                usage("error: %s", "remote port is invalid!");

            p += 2;
        }
        else if (IS("-t")) {
            if ((argc - 1) <= 0)
                usage("error: %s", "must specify the command timeout");
            g_timeout = (uint32_t)::atoi(argv[++i]);

            if (g_timeout == 0U)
                usage("error: %s", "command timeout cannot be zero!");

            p += 2;
        }
        else if (IS("-r")) {
            if ((argc - 1) <= 0)
                usage("error: %s", "must specify the command attempts");
            g_retries = (uint32_t)::atoi(argv[++i]);

            if (g_retries == 0U)
                usage("error: %s", "command attempts cannot be zero!");

            p += 2;
        }
        else if (IS("-d")) {
            ++p;
            g_debug = true;
        }
        else if (IS("-v")) {
            ::fprintf(stdout, __PROG_NAME__ " %s (built %s)\r\n", __VER__, __BUILD__);
            ::fprintf(stdout, "Copyright (c) 2024,2025 Bryan Biedenkapp, N2PLL.\n\n");
            if (argc == 2)
                exit(EXIT_SUCCESS);
        }
        else if (IS("-h")) {
            usage(nullptr, nullptr);
            if (argc == 2)
                exit(EXIT_SUCCESS);
        }
        else {
            usage("unrecognized option `%s'", argv[i]);
        }
    }

    if (p < 0 || p > argc) {
        p = 0;
    }

    return ++p;
}

/* Helper to parse a record argument of the form id[:index]; the id is hexadecimal. */

bool parseRecordArg(const std::string& arg, RecordDescriptor& record)
{
    std::string idStr = arg;
    std::string idxStr = "";

    size_t colon = arg.find(':');
    if (colon != std::string::npos) {
        idStr = arg.substr(0U, colon);
        idxStr = arg.substr(colon + 1U);
        if (idxStr.empty())
            return false;
    }

    if (idStr.empty())
        return false;

    char* end = nullptr;
    unsigned long id = ::strtoul(idStr.c_str(), &end, 16);
    if (end == nullptr || *end != '\0' || id > 0xFFFFUL)
        return false;

    if (idxStr.empty()) {
        record = RecordDescriptor((uint16_t)id);
        return true;
    }

    unsigned long idx = ::strtoul(idxStr.c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || idx > 0xFFFFUL)
        return false;

    record = RecordDescriptor((uint16_t)id, (uint16_t)idx);
    return true;
}

/* Helper to load a file into a byte buffer. */

bool loadFile(const std::string& filename, ByteBuffer& data)
{
    std::ifstream file(filename, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        LogError(LOG_HOST, "Cannot open the codeplug image, %s", filename.c_str());
        return false;
    }

    data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        LogError(LOG_HOST, "Failed to read the codeplug image, %s", filename.c_str());
        return false;
    }

    return true;
}

// ---------------------------------------------------------------------------
//  Commands
// ---------------------------------------------------------------------------

/* Displays the radio identity. */

int cmdIdentify(ProgrammerSession* session)
{
    RadioIdentity identity = session->identify();

    ::fprintf(stdout, "Model: %s\n", identity.model.c_str());
    ::fprintf(stdout, "Serial: %s\n", identity.serial.c_str());
    ::fprintf(stdout, "Firmware Version: %s\n", identity.firmwareVersion.c_str());
    ::fprintf(stdout, "Codeplug Version: %s\n", identity.codeplugVersion.c_str());
    ::fprintf(stdout, "Radio ID: %u\n", identity.radioId);
    return EXIT_SUCCESS;
}

/* Lists the available records. */

int cmdList(ProgrammerSession* session)
{
    std::vector<RecordDescriptor> records = session->listRecords();
    for (const RecordDescriptor& record : records) {
        ::fprintf(stdout, "%s\n", record.toString().c_str());
    }

    ::fprintf(stdout, "%u records\n", (uint32_t)records.size());
    return EXIT_SUCCESS;
}

/* Reads and dumps the given records. */

int cmdRead(ProgrammerSession* session, const std::vector<std::string>& args)
{
    std::vector<RecordDescriptor> records;
    for (size_t i = 1U; i < args.size(); i++) {
        RecordDescriptor record;
        if (!parseRecordArg(args[i], record)) {
            LogError(LOG_HOST, "Invalid record argument, %s", args[i].c_str());
            return ERRNO_REMOTE_CMD;
        }

        records.push_back(record);
    }

    RecordMap result = session->readRecords(records, [](uint32_t done, uint32_t total) {
        if (g_debug)
            LogMessage(LOG_HOST, "Read %u of %u records", done, total);
    });

    for (const RecordDescriptor& record : records) {
        auto it = result.find(record);
        if (it == result.end()) {
            ::fprintf(stdout, "%s: not returned by the radio\n", record.toString().c_str());
            continue;
        }

        ::fprintf(stdout, "%s (%u bytes): %s\n", record.toString().c_str(), (uint32_t)it->second.size(),
            Utils::toHex(it->second.data(), (uint32_t)it->second.size()).c_str());
    }

    return EXIT_SUCCESS;
}

/* Reads and decodes a channel record. */

int cmdChannel(ProgrammerSession* session, const std::vector<std::string>& args)
{
    char* end = nullptr;
    unsigned long index = ::strtoul(args[1U].c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || index > 0xFFFFUL) {
        LogError(LOG_HOST, "Invalid channel index, %s", args[1U].c_str());
        return ERRNO_REMOTE_CMD;
    }

    RecordDescriptor record(CHANNEL_RECORD_ID, (uint16_t)index);
    std::vector<RecordDescriptor> records;
    records.push_back(record);

    RecordMap result = session->readRecords(records);
    auto it = result.find(record);
    if (it == result.end()) {
        LogError(LOG_HOST, "Radio did not return channel %lu", index);
        return ERRNO_REMOTE_CMD;
    }

    FieldMap fields = ChannelLayout::decode(it->second);
    ::fprintf(stdout, "Channel %lu\n", index);
    for (const FieldDescriptor& field : ChannelLayout::fields()) {
        auto value = fields.find(field.name);
        if (value == fields.end())
            continue;

        ::fprintf(stdout, "  %-12s %s\n", field.name.c_str(), value->second.toString().c_str());
    }

    return EXIT_SUCCESS;
}

/* Writes a codeplug image. */

int cmdWrite(ProgrammerSession* session, const std::vector<std::string>& args)
{
    ByteBuffer image;
    if (!loadFile(args[1U], image))
        return ERRNO_REMOTE_CMD;

    WriteOptions options = WriteOptions();
    options.commandTimeoutMs = g_timeout;
    if (args.size() > 2U) {
        if (args[2U] != CMD_WRITE_OPT_COMPRESS) {
            LogError(LOG_HOST, "Unknown write option, %s", args[2U].c_str());
            return ERRNO_REMOTE_CMD;
        }

        options.compress = true;
    }

    LogMessage(LOG_HOST, "Writing %u bytes from %s", (uint32_t)image.size(), args[1U].c_str());
    session->writeCodeplug(image, [](const WriteProgress& progress) {
        LogMessage(LOG_HOST, "Write progress, status = $%02X, %u%%", progress.status, progress.percent);
    }, options);

    LogMessage(LOG_HOST, "Codeplug write complete");
    return EXIT_SUCCESS;
}

// ---------------------------------------------------------------------------
//  Program Entry Point
// ---------------------------------------------------------------------------

int main(int argc, char** argv)
{
    if (argv[0] != nullptr && *argv[0] != 0)
        g_progExe = std::string(argv[0]);

    if (argc < 2) {
        usage("error: %s", "must specify the command!");
        return ERRNO_REMOTE_CMD;
    }

    if (argc > 1) {
        // check arguments
        int i = checkArgs(argc, argv);
        if (i < argc) {
            argc -= i;
            argv += i;
        }
        else {
            argc--;
            argv++;
        }
    }

    std::vector<std::string> args = std::vector<std::string>();
    for (int i = 0; i < argc; i++) {
        args.push_back(std::string(argv[i]));
    }

    // initialize system logging
    bool ret = ::LogInitialise("", "", 0U, g_debug ? 1U : 2U, true);
    if (!ret) {
        ::fprintf(stderr, "unable to open the log file\n");
        return 1;
    }

    if (args.size() < 1U || args.at(0U) == "") {
        LogWarning(LOG_HOST, BAD_CMD_STR);
        ::LogFinalise();
        return ERRNO_REMOTE_CMD;
    }

    std::string rcom = args.at(0U);
    uint32_t argCnt = (uint32_t)args.size() - 1U;
    if (g_debug) {
        LogInfoEx(LOG_HOST, "cmd = %s, argCnt = %u", rcom.c_str(), argCnt);
    }

    if (!(rcom == CMD_IDENTIFY || rcom == CMD_LIST || (rcom == CMD_READ && argCnt >= 1U) ||
          (rcom == CMD_CHANNEL && argCnt >= 1U) || (rcom == CMD_WRITE && argCnt >= 1U))) {
        LogError(LOG_HOST, BAD_CMD_STR " (\"%s\")", rcom.c_str());
        ::LogFinalise();
        return ERRNO_REMOTE_CMD;
    }

    xcmp::DispatcherConfig config = xcmp::DispatcherConfig();
    config.timeoutMs = g_timeout;
    config.retries = g_retries;
    config.slotExpiryMs = g_timeout * 2U;

    int retCode = EXIT_SUCCESS;
    try {
        std::unique_ptr<ProgrammerSession> session = ProgrammerSession::connect(g_remoteAddress, (uint16_t)g_remotePort,
            config, g_debug);
        session->authenticate();

        // determine command to execute
        if (rcom == CMD_IDENTIFY) {
            retCode = cmdIdentify(session.get());
        }
        else if (rcom == CMD_LIST) {
            retCode = cmdList(session.get());
        }
        else if (rcom == CMD_READ) {
            retCode = cmdRead(session.get(), args);
        }
        else if (rcom == CMD_CHANNEL) {
            retCode = cmdChannel(session.get(), args);
        }
        else if (rcom == CMD_WRITE) {
            retCode = cmdWrite(session.get(), args);
        }

        session->close();
    }
    catch (cps::Exception& e) {
        LogError(LOG_HOST, "%s failed, %s", rcom.c_str(), e.what());
        retCode = EXIT_FAILURE;
    }

    ::LogFinalise();
    return retCode;
}
