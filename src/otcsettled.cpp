// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "clientversion.h"
#include "fs.h"
#include "init.h"
#include "logging.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "util/system.h"

#include <cstdlib>
#include <iostream>
#include <stdio.h>
#include <string>

#include <univalue.h>

/**
 * Serve JSON-RPC over stdin/stdout: one request object per line in, one
 * reply object per line out, until end of input or "stop".
 */
static void ServeRequests(std::istream& in, std::ostream& out)
{
    std::string strLine;
    while (!IsRPCShutdownRequested() && std::getline(in, strLine)) {
        if (strLine.find_first_not_of(" \t\r") == std::string::npos) continue;
        UniValue reply = JSONRPCExecOne(strLine);
        out << reply.write() << std::endl;
    }
}

static bool AppInit(int argc, char* argv[])
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return false;
    }

    // Process help and version before taking care about datadir
    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help") || gArgs.IsArgSet("-version")) {
        std::string strUsage = CLIENT_NAME + " Daemon version " + FormatFullVersion() + "\n";

        if (gArgs.IsArgSet("-version")) {
            strUsage += "\n" + CLIENT_NAME + " is a settlement engine for signed OTC swaps and a fixed-price marketplace.\n";
        } else {
            strUsage += "\nUsage:  otcsettled [options]     Read JSON-RPC requests from stdin, one per line\n\n";
            strUsage += HelpMessage();
        }

        fprintf(stdout, "%s", strUsage.c_str());
        return true;
    }

    if (!fs::is_directory(GetDataDir())) {
        fprintf(stderr, "Error: Specified data directory \"%s\" does not exist.\n", gArgs.GetArg("-datadir", "").c_str());
        return false;
    }
    if (!gArgs.ReadConfigFile(gArgs.GetArg("-conf", OTCSETTLE_CONF_FILENAME), error)) {
        fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
        return false;
    }
    // -datadir may have been set in the config file
    ClearDatadirCache();

    // stdout carries replies, -printtoconsole logs to stderr
    if (!InitLogging()) return false;
    if (!InitSanityCheck()) {
        ShutdownECC();
        return false;
    }

    bool fRet = false;
    if (InitLedger()) {
        RegisterAllCoreRPCCommands(tableRPC);
        LogPrintf("Serving JSON-RPC on standard input\n");
        ServeRequests(std::cin, std::cout);
        fRet = true;
    }

    ShutdownLedger();
    ShutdownECC();
    LogPrintf("Shutdown: done\n");
    return fRet;
}

int main(int argc, char* argv[])
{
    try {
        return AppInit(argc, argv) ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception& e) {
        fprintf(stderr, "otcsettled: %s\n", e.what());
        return EXIT_FAILURE;
    }
}
