// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/server.h"

#include "consensus/validation.h"
#include "logging.h"
#include "util/format.h"
#include "utilstrencodings.h"

#include <algorithm>
#include <atomic>
#include <set>
#include <stdexcept>
#include <unordered_map>

#include <boost/algorithm/string/case_conv.hpp>

static std::atomic<bool> g_rpc_shutdown_requested(false);

bool IsRPCShutdownRequested()
{
    return g_rpc_shutdown_requested;
}

void ResetRPCShutdown()
{
    g_rpc_shutdown_requested = false;
}

// =============================================================================
// Parameter helpers
// =============================================================================

CAccountID ParseAccountV(const UniValue& v, const std::string& strName)
{
    if (!v.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, strName + " must be a string");
    CAccountID id;
    if (!ParseAccountID(v.get_str(), id))
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, strName + " must be a 0x-prefixed 40 character hex account id (not '" + v.get_str() + "')");
    return id;
}

uint256 ParseHashV(const UniValue& v, const std::string& strName)
{
    if (!v.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, strName + " must be a string");
    uint256 hash;
    if (!hash.SetHex(v.get_str()))
        throw JSONRPCError(RPC_INVALID_PARAMETER, strName + " must be 64 hex digits (not '" + v.get_str() + "')");
    return hash;
}

std::vector<unsigned char> ParseHexV(const UniValue& v, const std::string& strName)
{
    std::string strHex;
    if (v.isStr())
        strHex = StripHexPrefix(v.get_str());
    if (!IsHex(strHex))
        throw JSONRPCError(RPC_INVALID_PARAMETER, strName + " must be hexadecimal string (not '" + strHex + "')");
    return ParseHex(strHex);
}

uint64_t ParseUInt64V(const UniValue& v, const std::string& strName)
{
    if (!v.isNum() && !v.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, strName + " must be a number or a decimal string");
    uint64_t n;
    if (!ParseUInt64(v.getValStr(), &n))
        throw JSONRPCError(RPC_INVALID_PARAMETER, strName + " must be a non-negative integer (not '" + v.getValStr() + "')");
    return n;
}

CAmount AmountFromValue(const UniValue& value)
{
    if (!value.isNum() && !value.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount is not a number or string");
    int64_t n;
    if (!ParseInt64(value.getValStr(), &n))
        throw JSONRPCError(RPC_TYPE_ERROR, "Invalid amount");
    if (!AmountRange(n))
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount out of range");
    return n;
}

const CAccountID& GetRequestCaller(const JSONRPCRequest& request)
{
    if (!request.fHaveCaller)
        throw JSONRPCError(RPC_CALLER_REQUIRED, strprintf("%s acts on behalf of a caller: add \"caller\": \"0x...\" to the request", request.strMethod));
    return request.caller;
}

void ThrowSettlementError(const CValidationState& state)
{
    LogPrint(BCLog::RPC, "settlement operation rejected: %s\n", state.ToString());
    throw JSONRPCSettlementError(state);
}

std::string HelpExampleCli(const std::string& methodname, const std::string& args)
{
    return "> echo '{\"method\": \"" + methodname + "\", \"params\": [" + args + "], \"caller\": \"0x...\"}' | otcsettled\n";
}

std::string HelpExampleRpc(const std::string& methodname, const std::string& args)
{
    return "> {\"id\": \"curltest\", \"method\": \"" + methodname + "\", \"params\": [" + args + "], \"caller\": \"0x...\"}\n";
}

// =============================================================================
// Control commands
// =============================================================================

UniValue help(const JSONRPCRequest& jsonRequest)
{
    if (jsonRequest.fHelp || jsonRequest.params.size() > 1)
        throw std::runtime_error(
            "help ( \"command\" )\n"
            "\nList all commands, or get help for a specified command.\n"
            "\nArguments:\n"
            "1. \"command\"     (string, optional) The command to get help on\n"
            "\nResult:\n"
            "\"text\"     (string) The help text\n");

    std::string strCommand;
    if (jsonRequest.params.size() > 0)
        strCommand = jsonRequest.params[0].get_str();

    return tableRPC.help(strCommand);
}

UniValue stop(const JSONRPCRequest& jsonRequest)
{
    if (jsonRequest.fHelp || jsonRequest.params.size() > 0)
        throw std::runtime_error(
            "stop\n"
            "\nStop otcsettled after this request is answered.");
    g_rpc_shutdown_requested = true;
    return "otcsettled stopping";
}

static const CRPCCommand vRPCCommands[] = {
    //  category              name                      actor (function)         okSafeMode  argNames
    //  --------------------- ------------------------  -----------------------  ----------  --------
    { "control",            "help",                   &help,                   true,       {"command"} },
    { "control",            "stop",                   &stop,                   true,       {} },
};

// =============================================================================
// Dispatch
// =============================================================================

CRPCTable::CRPCTable()
{
    for (const auto& cmd : vRPCCommands) {
        mapCommands[cmd.name] = &cmd;
    }
}

const CRPCCommand* CRPCTable::operator[](const std::string& name) const
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it == mapCommands.end())
        return nullptr;
    return (*it).second;
}

bool CRPCTable::appendCommand(const std::string& name, const CRPCCommand* pcmd)
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it != mapCommands.end())
        return false;

    mapCommands[name] = pcmd;
    return true;
}

std::string CRPCTable::help(const std::string& strCommand) const
{
    std::string strRet;
    std::string category;
    std::set<rpcfn_type> setDone;
    std::vector<std::pair<std::string, const CRPCCommand*> > vCommands;

    for (const auto& entry : mapCommands)
        vCommands.emplace_back(entry.second->category + entry.first, entry.second);
    std::sort(vCommands.begin(), vCommands.end());

    JSONRPCRequest jreq;
    jreq.fHelp = true;
    for (const auto& command : vCommands) {
        const CRPCCommand* pcmd = command.second;
        std::string strMethod = pcmd->name;
        if ((strCommand != "" || pcmd->category == "hidden") && strMethod != strCommand)
            continue;
        jreq.strMethod = strMethod;
        try {
            rpcfn_type pfn = pcmd->actor;
            if (setDone.insert(pfn).second)
                (*pfn)(jreq);
        } catch (const std::exception& e) {
            // Help text is returned in an exception
            std::string strHelp = std::string(e.what());
            if (strCommand == "") {
                if (strHelp.find('\n') != std::string::npos)
                    strHelp = strHelp.substr(0, strHelp.find('\n'));

                if (category != pcmd->category) {
                    if (!category.empty())
                        strRet += "\n";
                    category = pcmd->category;
                    std::string firstLetter = category.substr(0, 1);
                    boost::to_upper(firstLetter);
                    strRet += "== " + firstLetter + category.substr(1) + " ==\n";
                }
            }
            strRet += strHelp + "\n";
        }
    }
    if (strRet == "")
        strRet = strprintf("help: unknown command: %s\n", strCommand);
    strRet = strRet.substr(0, strRet.size() - 1);
    return strRet;
}

std::vector<std::string> CRPCTable::listCommands() const
{
    std::vector<std::string> commandList;
    for (const auto& entry : mapCommands)
        commandList.push_back(entry.first);
    return commandList;
}

void JSONRPCRequest::parse(const UniValue& valRequest)
{
    // Parse request
    if (!valRequest.isObject())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Invalid Request object");
    const UniValue& request = valRequest.get_obj();

    // Parse id now so errors from here on will have the id
    id = find_value(request, "id");

    // Parse method
    UniValue valMethod = find_value(request, "method");
    if (valMethod.isNull())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Missing method");
    if (!valMethod.isStr())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Method must be a string");
    strMethod = valMethod.get_str();
    LogPrint(BCLog::RPC, "ThreadRPCServer method=%s\n", strMethod);

    // Parse params
    UniValue valParams = find_value(request, "params");
    if (valParams.isArray() || valParams.isObject())
        params = valParams;
    else if (valParams.isNull())
        params = UniValue(UniValue::VARR);
    else
        throw JSONRPCError(RPC_INVALID_REQUEST, "Params must be an array or object");

    // Parse caller
    UniValue valCaller = find_value(request, "caller");
    fHaveCaller = false;
    if (!valCaller.isNull()) {
        caller = ParseAccountV(valCaller, "caller");
        fHaveCaller = true;
    }
}

/**
 * Process named arguments into a vector of positional arguments, based on the
 * passed-in specification for the RPC call's arguments.
 */
static inline JSONRPCRequest transformNamedArguments(const JSONRPCRequest& in, const std::vector<std::string>& argNames)
{
    JSONRPCRequest out = in;
    out.params = UniValue(UniValue::VARR);
    // Build a map of parameters, and remove ones that have been processed, so that we can throw a focused error if
    // there is an unknown one.
    const std::vector<std::string>& keys = in.params.getKeys();
    const std::vector<UniValue>& values = in.params.getValues();
    std::unordered_map<std::string, const UniValue*> argsIn;
    for (size_t i = 0; i < keys.size(); ++i) {
        argsIn[keys[i]] = &values[i];
    }
    // Process expected parameters.
    int hole = 0;
    for (const std::string& argName : argNames) {
        auto fr = argsIn.find(argName);
        if (fr != argsIn.end()) {
            for (int i = 0; i < hole; ++i) {
                // Fill hole between specified parameters with JSON nulls,
                // but not at the end (for backwards compatibility with calls
                // that act based on number of specified parameters).
                out.params.push_back(UniValue());
            }
            hole = 0;
            out.params.push_back(*fr->second);
            argsIn.erase(fr);
        } else {
            hole += 1;
        }
    }
    // If there are still arguments in the argsIn map, this is an error.
    if (!argsIn.empty()) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Unknown named parameter " + argsIn.begin()->first);
    }
    // Return request with named arguments transformed to positional arguments
    return out;
}

UniValue CRPCTable::execute(const JSONRPCRequest& request) const
{
    // Find method
    const CRPCCommand* pcmd = tableRPC[request.strMethod];
    if (!pcmd)
        throw JSONRPCError(RPC_METHOD_NOT_FOUND, "Method not found");

    try {
        // Execute, convert arguments to array if necessary
        if (request.params.isObject()) {
            return pcmd->actor(transformNamedArguments(request, pcmd->argNames));
        } else {
            return pcmd->actor(request);
        }
    } catch (const std::exception& e) {
        throw JSONRPCError(RPC_MISC_ERROR, e.what());
    }
}

UniValue JSONRPCExecOne(const std::string& strLine)
{
    UniValue valRequest;
    if (!valRequest.read(strLine))
        return JSONRPCReplyObj(NullUniValue, JSONRPCError(RPC_PARSE_ERROR, "Parse error"), NullUniValue);

    JSONRPCRequest jreq;
    try {
        jreq.parse(valRequest);
        UniValue result = tableRPC.execute(jreq);
        return JSONRPCReplyObj(result, NullUniValue, jreq.id);
    } catch (const UniValue& objError) {
        return JSONRPCReplyObj(NullUniValue, objError, jreq.id);
    } catch (const std::exception& e) {
        return JSONRPCReplyObj(NullUniValue, JSONRPCError(RPC_PARSE_ERROR, e.what()), jreq.id);
    }
}

CRPCTable tableRPC;
