// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "utilstrencodings.h"

#include <stdlib.h>
#include <string.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

const char * const OTCSETTLE_CONF_FILENAME = "otcsettle.conf";

ArgsManager gArgs;

static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi64(strValue) != 0);
}

void ArgsManager::InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        if (!bool_val) {
            // Double negatives like -nofoo=0 are supported (but discouraged)
            LogPrintf("Warning: parsed potentially confusing double-negative %s=%s\n", key, val);
        }
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
    }
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    mapArgs.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }
        boost::to_lower(key);

        if (key[0] != '-') {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Interpret --foo as -foo.
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        InterpretNegatedOption(key, val);
        mapArgs[key].push_back(val);
    }

    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& confPath, std::string& error)
{
    fs::ifstream streamConfig(GetConfigFile(confPath));
    if (!streamConfig.good())
        return true; // No otcsettle.conf file is OK

    LOCK(cs_args);
    mapConfigArgs.clear();

    std::string line;
    int linenr = 0;
    while (std::getline(streamConfig, line)) {
        linenr++;
        size_t pos;
        if ((pos = line.find('#')) != std::string::npos) {
            line = line.substr(0, pos);
        }
        boost::algorithm::trim(line);
        if (line.empty()) continue;

        pos = line.find('=');
        if (pos == std::string::npos) {
            error = strprintf("parse error on line %i: %s", linenr, line);
            return false;
        }
        std::string key = "-" + boost::algorithm::trim_copy(line.substr(0, pos));
        std::string val = boost::algorithm::trim_copy(line.substr(pos + 1));
        InterpretNegatedOption(key, val);
        mapConfigArgs[key].push_back(val);
    }

    // If datadir is changed in .conf file:
    ClearDatadirCache();
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    it = mapConfigArgs.find(strArg);
    if (it != mapConfigArgs.end()) return it->second;
    return {};
}

bool ArgsManager::GetLast(const std::string& strArg, std::string& result) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end() && !it->second.empty()) {
        result = it->second.back();
        return true;
    }
    it = mapConfigArgs.find(strArg);
    if (it != mapConfigArgs.end() && !it->second.empty()) {
        result = it->second.back();
        return true;
    }
    return false;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::string unused;
    return GetLast(strArg, unused);
}

bool ArgsManager::IsArgNegated(const std::string& strArg) const
{
    std::string val;
    return GetLast(strArg, val) && !InterpretBool(val);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::string val;
    if (GetLast(strArg, val)) return val;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::string val;
    if (GetLast(strArg, val)) return atoi64(val);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::string val;
    if (GetLast(strArg, val)) return InterpretBool(val);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

bool ArgsManager::SoftSetBoolArg(const std::string& strArg, bool fValue)
{
    if (fValue)
        return SoftSetArg(strArg, std::string("1"));
    else
        return SoftSetArg(strArg, std::string("0"));
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    mapArgs[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    mapArgs.clear();
    mapConfigArgs.clear();
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string& message)
{
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string& option, const std::string& message)
{
    std::string ret = std::string(optIndent, ' ') + std::string(option) + std::string("\n");
    // Wrap the description at word boundaries
    std::string line(msgIndent, ' ');
    size_t pos = 0;
    while (pos < message.size()) {
        size_t next = message.find(' ', pos);
        if (next == std::string::npos) next = message.size();
        std::string word = message.substr(pos, next - pos);
        if (line.size() > (size_t)msgIndent && line.size() + word.size() + 1 > (size_t)screenWidth) {
            ret += line + "\n";
            line = std::string(msgIndent, ' ');
        }
        if (line.size() > (size_t)msgIndent) line += ' ';
        line += word;
        pos = next + 1;
    }
    ret += line + "\n\n";
    return ret;
}

fs::path GetDefaultDataDir()
{
    // Unix: ~/.otcsettle
    char* pszHome = getenv("HOME");
    fs::path pathRet;
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".otcsettle";
}

static fs::path pathCached;
static RecursiveMutex csPathCached;

const fs::path& GetDataDir()
{
    LOCK(csPathCached);

    fs::path& path = pathCached;

    // This can be called during exceptions by LogPrintf(), so we cache the
    // value so we don't have to do memory allocations after that.
    if (!path.empty())
        return path;

    if (gArgs.IsArgSet("-datadir")) {
        path = fs::system_complete(gArgs.GetArg("-datadir", ""));
        if (!fs::is_directory(path)) {
            path = "";
            return path;
        }
    } else {
        path = GetDefaultDataDir();
    }

    fs::create_directories(path);

    return path;
}

void ClearDatadirCache()
{
    LOCK(csPathCached);
    pathCached = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_complete())
        pathConfigFile = GetDataDir() / pathConfigFile;

    return pathConfigFile;
}

bool TryCreateDirectories(const fs::path& p)
{
    try {
        return fs::create_directories(p);
    } catch (const fs::filesystem_error&) {
        if (!fs::exists(p) || !fs::is_directory(p))
            throw;
    }

    // create_directories didn't create the directory, it had to have existed already
    return false;
}
