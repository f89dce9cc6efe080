// Copyright (c) 2012-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "clientversion.h"

#include "util/format.h"

std::string FormatFullVersion()
{
    return strprintf("v%d.%d.%d", CLIENT_VERSION_MAJOR, CLIENT_VERSION_MINOR, CLIENT_VERSION_REVISION);
}
