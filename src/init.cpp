// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"

#include "clientversion.h"
#include "key.h"
#include "logging.h"
#include "market/marketplace.h"
#include "swap/otcswap.h"
#include "util/system.h"
#include "utiltime.h"

#include <algorithm>
#include <stdio.h>

std::unique_ptr<CLedgerViewDB> g_ledgerdb;
std::unique_ptr<CLedgerHost> g_ledger_host;

static std::unique_ptr<ECCVerifyHandle> globalVerifyHandle;

CAccountID GetStandardAssetAddress(const std::string& symbol)
{
    return CLedgerHost::DeriveContractAddress(std::string("otcsettle.asset.") + symbol);
}

bool InitError(const std::string& str)
{
    fprintf(stderr, "Error: %s\n", str.c_str());
    LogPrintf("Error: %s\n", str);
    return false;
}

std::string HelpMessage()
{
    std::string strUsage = HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "Print this help message and exit");
    strUsage += HelpMessageOpt("-version", "Print version and exit");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", OTCSETTLE_CONF_FILENAME));
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");
    strUsage += HelpMessageOpt("-dbcache=<n>", strprintf("Ledger database cache size in megabytes (%d to %d, default: %d)",
                                                         MIN_LEDGER_DBCACHE, MAX_LEDGER_DBCACHE, DEFAULT_LEDGER_DBCACHE));
    strUsage += HelpMessageOpt("-wipeledger", "Delete the ledger database and start from an empty ledger");
    strUsage += HelpMessageOpt("-mocktime=<n>", "Replace the ledger clock with a fixed unix time (default: 0 = system clock)");

    strUsage += HelpMessageGroup("Settlement options:");
    strUsage += HelpMessageOpt("-chainid=<n>", strprintf("Chain id bound into signed swap orders (default: %d)", DEFAULT_CHAIN_ID));
    strUsage += HelpMessageOpt("-swapaddress=<addr>", strprintf("Account id of the swap service (default: %s)",
                                                               CLedgerHost::DeriveContractAddress(SWAP_CONTRACT_TAG).ToString()));
    strUsage += HelpMessageOpt("-marketaddress=<addr>", strprintf("Account id of the marketplace (default: %s)",
                                                                 CLedgerHost::DeriveContractAddress(MARKET_CONTRACT_TAG).ToString()));
    strUsage += HelpMessageOpt("-asset=<symbol>", "Register a standard asset with this symbol at startup (can be specified multiple times)");

    strUsage += HelpMessageGroup("Debugging options:");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information (default: 0, supplying <category> is optional). "
        "If <category> is not supplied or if <category> = 1, output all debugging information. <category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-debugexclude=<category>", "Exclude debugging information for a category. Can be used in conjunction with -debug=1 to output debug logs for all categories except one or more specified categories.");
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to stderr instead of debug.log file");
    strUsage += HelpMessageOpt("-debuglogfile=<file>", strprintf("Specify location of debug log file (default: %s)", DEFAULT_DEBUGLOGFILE));
    strUsage += HelpMessageOpt("-shrinkdebugfile", "Shrink debug.log file on client startup (default: 1 when no -debug)");
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));

    return strUsage;
}

bool InitLogging()
{
    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    logger.m_print_to_file = !gArgs.IsArgNegated("-debuglogfile") && !logger.m_print_to_console;
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    if (logger.m_print_to_file) {
        fs::path logfile(gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE));
        if (!logfile.is_complete()) logfile = GetDataDir() / logfile;
        logger.m_file_path = logfile;
    }

    // -debug can be specified multiple times
    if (gArgs.IsArgSet("-debug")) {
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        if (std::none_of(categories.begin(), categories.end(),
                         [](std::string cat) { return cat == "0" || cat == "none"; })) {
            for (const auto& cat : categories) {
                if (!logger.EnableCategory(cat)) {
                    LogPrintf("Unsupported logging category -debug=%s.\n", cat);
                }
            }
        }
    }
    for (const std::string& cat : gArgs.GetArgs("-debugexclude")) {
        if (!logger.DisableCategory(cat)) {
            LogPrintf("Unsupported logging category -debugexclude=%s.\n", cat);
        }
    }

    if (logger.m_print_to_file && gArgs.GetBoolArg("-shrinkdebugfile", logger.GetCategoryMask() == BCLog::NONE)) {
        logger.ShrinkDebugFile();
    }
    if (!logger.StartLogging()) {
        return InitError(strprintf("Could not open debug log file %s", logger.m_file_path.string()));
    }

    LogPrintf("%s version %s\n", CLIENT_NAME, FormatFullVersion());
    LogPrintf("Using data directory %s\n", GetDataDir().string());
    return true;
}

bool InitSanityCheck()
{
    ECC_Start();
    globalVerifyHandle.reset(new ECCVerifyHandle());
    if (!ECC_InitSanityCheck()) {
        return InitError("Elliptic curve cryptography sanity check failure. Aborting.");
    }
    return true;
}

void ShutdownECC()
{
    globalVerifyHandle.reset();
    ECC_Stop();
}

static bool ParseServiceAddress(const std::string& strArg, const char* tag, CAccountID& address)
{
    if (!gArgs.IsArgSet(strArg)) {
        address = CLedgerHost::DeriveContractAddress(tag);
        return true;
    }
    if (!ParseAccountID(gArgs.GetArg(strArg, ""), address)) {
        return InitError(strprintf("Invalid %s '%s': expected 0x followed by 40 hex digits", strArg, gArgs.GetArg(strArg, "")));
    }
    return true;
}

bool InitLedger()
{
    int64_t nMockTime = gArgs.GetArg("-mocktime", (int64_t)0);
    if (nMockTime < 0) {
        return InitError(strprintf("Invalid -mocktime=%d", nMockTime));
    }
    if (nMockTime > 0) {
        SetMockTime(nMockTime);
        LogPrintf("Ledger clock mocked at %d\n", nMockTime);
    }

    const int64_t nChainId = gArgs.GetArg("-chainid", DEFAULT_CHAIN_ID);
    if (nChainId <= 0) {
        return InitError(strprintf("Invalid -chainid=%d", nChainId));
    }

    CAccountID swapAddress, marketAddress;
    if (!ParseServiceAddress("-swapaddress", SWAP_CONTRACT_TAG, swapAddress)) return false;
    if (!ParseServiceAddress("-marketaddress", MARKET_CONTRACT_TAG, marketAddress)) return false;
    if (swapAddress == marketAddress) {
        return InitError("-swapaddress and -marketaddress must differ");
    }

    int64_t nDbCache = gArgs.GetArg("-dbcache", DEFAULT_LEDGER_DBCACHE);
    nDbCache = std::max(nDbCache, MIN_LEDGER_DBCACHE);
    nDbCache = std::min(nDbCache, MAX_LEDGER_DBCACHE);
    const size_t nCacheSize = static_cast<size_t>(nDbCache) << 20;
    const bool fWipe = gArgs.GetBoolArg("-wipeledger", false);

    LogPrintf("Cache configuration:\n");
    LogPrintf("* Using %.1fMiB for ledger database\n", nCacheSize * (1.0 / 1024 / 1024));

    try {
        g_ledgerdb.reset();
        g_ledgerdb = std::make_unique<CLedgerViewDB>(GetDataDir() / "ledger", nCacheSize, fWipe);
    } catch (const dbwrapper_error& e) {
        return InitError(strprintf("Error opening ledger database: %s", e.what()));
    }
    if (g_ledgerdb->IsEmpty()) {
        LogPrintf("Ledger database is empty, starting a new ledger\n");
    }

    g_ledger_host = std::make_unique<CLedgerHost>(g_ledgerdb.get());
    for (const std::string& symbol : gArgs.GetArgs("-asset")) {
        if (symbol.empty()) {
            return InitError("-asset requires a symbol");
        }
        g_ledger_host->RegisterAsset(std::make_shared<CStandardAsset>(GetStandardAssetAddress(symbol), symbol));
    }

    g_otcswap = std::make_unique<COTCSwap>(*g_ledger_host, swapAddress, static_cast<uint64_t>(nChainId));
    g_marketplace = std::make_unique<CMarketplace>(*g_ledger_host, marketAddress);

    LogPrintf("Swap service at %s (chain id %d), marketplace at %s\n",
              swapAddress.ToString(), nChainId, marketAddress.ToString());
    return true;
}

void ShutdownLedger()
{
    LogPrintf("%s: In progress...\n", __func__);
    g_marketplace.reset();
    g_otcswap.reset();
    g_ledger_host.reset();
    g_ledgerdb.reset();
    LogPrintf("%s: done\n", __func__);
}
