// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_UTIL_FORMAT_H
#define OTCSETTLE_UTIL_FORMAT_H

/**
 * Single include point for tinyformat.
 *
 * Format errors are raised as exceptions instead of tinyformat's default
 * assert, so a bad log format string can never take the daemon down.
 */

#include <stdexcept>
#include <string>

namespace tinyformat {
class format_error : public std::runtime_error
{
public:
    explicit format_error(const std::string& what) : std::runtime_error(what) {}
};
} // namespace tinyformat

#ifndef TINYFORMAT_ERROR
#define TINYFORMAT_ERROR(reason) throw tinyformat::format_error(reason)
#endif

#include <tinyformat.h>

#define strprintf tfm::format

#endif // OTCSETTLE_UTIL_FORMAT_H
