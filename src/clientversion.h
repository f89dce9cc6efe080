// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_CLIENTVERSION_H
#define OTCSETTLE_CLIENTVERSION_H

#include <string>

#define CLIENT_VERSION_MAJOR 0
#define CLIENT_VERSION_MINOR 3
#define CLIENT_VERSION_REVISION 0

static const int CLIENT_VERSION =
                           1000000 * CLIENT_VERSION_MAJOR
                         +   10000 * CLIENT_VERSION_MINOR
                         +     100 * CLIENT_VERSION_REVISION;

static const std::string CLIENT_NAME = "OTCSettle";

std::string FormatFullVersion();

#endif // OTCSETTLE_CLIENTVERSION_H
