// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "solar/solar_account.h"

#include <boost/algorithm/hex.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

CAccountID::CAccountID(const std::vector<unsigned char>& vch)
{
    if (vch.size() != WIDTH) {
        throw std::invalid_argument("CAccountID: expected 20 bytes");
    }
    std::copy(vch.begin(), vch.end(), m_data);
}

bool CAccountID::SetHex(const std::string& str)
{
    std::string strHex = str;
    if (strHex.size() >= 2 && strHex[0] == '0' && std::tolower(static_cast<unsigned char>(strHex[1])) == 'x') {
        strHex = strHex.substr(2);
    }
    if (strHex.size() != WIDTH * 2) {
        return false;
    }

    std::vector<unsigned char> vch;
    try {
        boost::algorithm::unhex(strHex.begin(), strHex.end(), std::back_inserter(vch));
    } catch (const boost::algorithm::hex_decode_error&) {
        return false;
    }

    std::copy(vch.begin(), vch.end(), m_data);
    return true;
}

std::string CAccountID::GetHex() const
{
    std::string strHex;
    boost::algorithm::hex_lower(begin(), end(), std::back_inserter(strHex));
    return strHex;
}

std::string CAccountID::ToString() const
{
    return "0x" + GetHex();
}

CAccountID AccountIDFromHex(const std::string& str)
{
    CAccountID account;
    if (!account.SetHex(str)) {
        account.SetNull();
    }
    return account;
}
