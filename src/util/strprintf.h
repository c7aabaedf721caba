// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_UTIL_STRPRINTF_H
#define SOLAR_UTIL_STRPRINTF_H

#include <boost/format.hpp>

#include <initializer_list>
#include <string>

/**
 * printf-style formatting on top of boost::format.
 *
 * Arguments are streamed, so any type with an operator<< (CAmount included)
 * can be passed to %s/%d/%u. Length modifiers (%lld, %lu) are accepted and
 * ignored. A mismatch between directives and arguments is not an error.
 */
template <typename... Args>
std::string strprintf(const std::string& fmt, const Args&... args)
{
    boost::format formatter(fmt);
    formatter.exceptions(boost::io::all_error_bits ^ (boost::io::too_many_args_bit | boost::io::too_few_args_bit));
    (void)std::initializer_list<int>{((void)(formatter % args), 0)...};
    return formatter.str();
}

#endif // SOLAR_UTIL_STRPRINTF_H
